#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace knora {

// Class labels are categorical; encoded as integers on load
using Label = int32_t;

// One sample / query
using FeatureVector = std::vector<float>;

// Per-classifier count of correctly predicted neighbours, range [0, k]
using CompetenceVector = std::vector<int>;

// Ordered multiset of labels, appended in pool order
using VoteSequence = std::vector<Label>;

// true = classifier survives pruning for the current query
using InclusionMask = std::vector<bool>;

// Default region-of-competence size
constexpr size_t DEFAULT_K = 7;

inline std::string join_ints(const std::vector<int>& v, char sep = ',') {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += std::to_string(v[i]);
    }
    return out;
}

inline std::string join_labels(const VoteSequence& v, char sep = ',') {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i) out += sep;
        out += std::to_string(v[i]);
    }
    return out;
}

}  // namespace knora
