#include "knora/inclusion_mask.hpp"

#include <stdexcept>
#include <string>

namespace knora {

StaticInclusionMask StaticInclusionMask::excluding(size_t n_classifiers,
                                                   const std::vector<size_t>& excluded) {
    InclusionMask m(n_classifiers, true);
    for (size_t idx : excluded) {
        if (idx >= n_classifiers) {
            throw std::out_of_range("excluded classifier " + std::to_string(idx) +
                                    " out of range (pool size " + std::to_string(n_classifiers) + ")");
        }
        m[idx] = false;
    }
    return StaticInclusionMask(std::move(m));
}

}  // namespace knora
