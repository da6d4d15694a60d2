#pragma once

#include "knora/classifier.hpp"

#include <istream>
#include <string>

namespace knora {

// Pool description format, one classifier per line ('#' comments):
//
//   stump <feature> <threshold> <left_label> <right_label>
//   linear <n_features> <label> <bias> <w...> [| <label> <bias> <w...>]...
//   constant <label>
//
// Throws std::runtime_error with "<source>:<line>: ..." on bad input.
ClassifierPool read_pool(std::istream& in, const std::string& source_name = "<stream>");

ClassifierPool load_pool(const std::string& path);

}  // namespace knora
