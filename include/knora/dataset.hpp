#pragma once

#include "knora/types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace knora {

/**
 * Dense row-major sample table with optional labels.
 *
 * Used for both the DSEL (always labelled) and query files.
 */
struct Dataset {
    size_t n_features = 0;
    std::vector<FeatureVector> rows;
    std::vector<Label> labels;  // empty for unlabelled query files

    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }
    bool labelled() const { return !labels.empty(); }

    const FeatureVector& row(size_t i) const {
        if (i >= rows.size()) {
            throw std::out_of_range("Dataset row " + std::to_string(i) +
                                    " out of range (size " + std::to_string(rows.size()) + ")");
        }
        return rows[i];
    }
};

/**
 * Read a delimited text table (comma, tab or whitespace separated).
 *
 * Plain and gzip files are both accepted. A first line that does not parse
 * as numbers is treated as a header and skipped. With `labelled`, the last
 * column of every row is the integer class label.
 *
 * Throws std::runtime_error naming file and line on any parse failure.
 */
Dataset load_dataset(const std::string& path, bool labelled);

// Parse a single text line into numeric fields. Returns false if any field
// is not a number. Exposed for tests.
bool parse_numeric_fields(const std::string& line, std::vector<double>& out);

}  // namespace knora
