#pragma once

#include "knora/types.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace knora {

/**
 * Per-query classifier eligibility (Dynamic Frienemy Pruning or similar).
 * Must return one entry per pool classifier.
 */
class InclusionMaskProvider {
public:
    virtual ~InclusionMaskProvider() = default;

    virtual InclusionMask mask(const FeatureVector& query) const = 0;
};

// Pruning disabled: every classifier is eligible
class AllIncludedMask : public InclusionMaskProvider {
public:
    explicit AllIncludedMask(size_t n_classifiers) : n_classifiers_(n_classifiers) {}

    InclusionMask mask(const FeatureVector&) const override {
        return InclusionMask(n_classifiers_, true);
    }

private:
    size_t n_classifiers_;
};

// Same mask for every query
class StaticInclusionMask : public InclusionMaskProvider {
public:
    explicit StaticInclusionMask(InclusionMask mask) : mask_(std::move(mask)) {}

    // All included except the listed classifier indices.
    // Throws std::out_of_range for an index >= n_classifiers.
    static StaticInclusionMask excluding(size_t n_classifiers,
                                         const std::vector<size_t>& excluded);

    InclusionMask mask(const FeatureVector&) const override { return mask_; }

private:
    InclusionMask mask_;
};

}  // namespace knora
