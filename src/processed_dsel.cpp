#include "knora/processed_dsel.hpp"

#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#ifdef _OPENMP
#include <omp.h>
#endif

namespace knora {

ProcessedDsel::ProcessedDsel(size_t n_samples, size_t n_classifiers, std::vector<uint8_t> cells)
    : n_samples_(n_samples), n_classifiers_(n_classifiers), cells_(std::move(cells)) {
    if (cells_.size() != n_samples_ * n_classifiers_) {
        throw std::invalid_argument("ProcessedDsel: " + std::to_string(cells_.size()) +
                                    " cells for a " + std::to_string(n_samples_) + " x " +
                                    std::to_string(n_classifiers_) + " table");
    }
    for (size_t i = 0; i < cells_.size(); ++i) {
        if (cells_[i] > 1) {
            throw std::invalid_argument("ProcessedDsel: cell " + std::to_string(i) +
                                        " is " + std::to_string(cells_[i]) + ", expected 0 or 1");
        }
    }
}

ProcessedDsel ProcessedDsel::build(const ClassifierPool& pool, const Dataset& dsel) {
    if (pool.empty()) {
        throw std::invalid_argument("ProcessedDsel::build: classifier pool is empty");
    }
    if (dsel.empty()) {
        throw std::invalid_argument("ProcessedDsel::build: DSEL is empty");
    }
    if (!dsel.labelled() || dsel.labels.size() != dsel.rows.size()) {
        throw std::invalid_argument("ProcessedDsel::build: DSEL must carry one label per sample");
    }

    const size_t n_samples = dsel.size();
    const size_t n_clf = pool.size();
    std::vector<uint8_t> cells(n_samples * n_clf, 0);

    // Exceptions must not escape an OpenMP region; keep the first one
    std::exception_ptr first_error;
    const long long n = static_cast<long long>(n_samples);

    #pragma omp parallel for schedule(dynamic, 64)
    for (long long s = 0; s < n; ++s) {
        const size_t j = static_cast<size_t>(s);
        try {
            for (size_t clf = 0; clf < n_clf; ++clf) {
                cells[j * n_clf + clf] = (pool[clf]->predict(dsel.rows[j]) == dsel.labels[j]) ? 1 : 0;
            }
        } catch (...) {
            #pragma omp critical(knora_dsel_error)
            {
                if (!first_error) first_error = std::current_exception();
            }
        }
    }

    if (first_error) std::rethrow_exception(first_error);

    return ProcessedDsel(n_samples, n_clf, std::move(cells));
}

uint8_t ProcessedDsel::at(size_t sample, size_t clf) const {
    if (sample >= n_samples_ || clf >= n_classifiers_) {
        throw std::out_of_range("ProcessedDsel: cell (" + std::to_string(sample) + ", " +
                                std::to_string(clf) + ") outside " + std::to_string(n_samples_) +
                                " x " + std::to_string(n_classifiers_));
    }
    return cells_[sample * n_classifiers_ + clf];
}

double ProcessedDsel::classifier_accuracy(size_t clf) const {
    if (clf >= n_classifiers_) {
        throw std::out_of_range("ProcessedDsel: classifier " + std::to_string(clf) + " out of range");
    }
    if (n_samples_ == 0) return 0.0;
    size_t correct = 0;
    for (size_t j = 0; j < n_samples_; ++j) {
        correct += cells_[j * n_classifiers_ + clf];
    }
    return static_cast<double>(correct) / static_cast<double>(n_samples_);
}

}  // namespace knora
