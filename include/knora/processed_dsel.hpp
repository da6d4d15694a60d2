#pragma once

#include "knora/classifier.hpp"
#include "knora/dataset.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace knora {

/**
 * Oracle table for the dynamic selection set.
 *
 * Cell (sample j, classifier i) is 1 when classifier i predicted the true
 * label of DSEL sample j during the offline pass, else 0. Immutable once
 * built; shared read-only by every query.
 */
class ProcessedDsel {
public:
    ProcessedDsel() = default;

    // Takes row-major cells; every cell must be 0 or 1
    ProcessedDsel(size_t n_samples, size_t n_classifiers, std::vector<uint8_t> cells);

    // Runs each classifier over every DSEL sample. Rows are processed in
    // parallel when OpenMP is available; the table does not depend on the
    // thread count.
    static ProcessedDsel build(const ClassifierPool& pool, const Dataset& dsel);

    size_t n_samples() const { return n_samples_; }
    size_t n_classifiers() const { return n_classifiers_; }

    // Bounds-checked
    uint8_t at(size_t sample, size_t clf) const;

    // Unchecked
    uint8_t operator()(size_t sample, size_t clf) const {
        return cells_[sample * n_classifiers_ + clf];
    }

    // Fraction of DSEL samples classifier `clf` got right
    double classifier_accuracy(size_t clf) const;

private:
    size_t n_samples_ = 0;
    size_t n_classifiers_ = 0;
    std::vector<uint8_t> cells_;
};

}  // namespace knora
