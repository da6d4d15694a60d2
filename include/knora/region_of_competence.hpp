#pragma once

#include "knora/dataset.hpp"
#include "knora/types.hpp"

#include <cstddef>
#include <vector>

namespace knora {

// Nearest DSEL samples of a query, closest first
struct CompetenceRegion {
    std::vector<size_t> indices;
    std::vector<float> distances;

    size_t size() const { return indices.size(); }
};

/**
 * Supplies the region of competence for a query.
 *
 * Returned indices must be valid rows of the ProcessedDsel the strategy was
 * built with. A provider may return fewer than k neighbours (safe_k).
 * Malformed queries are rejected here, not in the selection core.
 */
class RegionOfCompetenceProvider {
public:
    virtual ~RegionOfCompetenceProvider() = default;

    virtual CompetenceRegion region(const FeatureVector& query) const = 0;
    virtual size_t k() const = 0;
};

// Brute-force Euclidean k-NN over the DSEL feature rows
class KnnRegionOfCompetence : public RegionOfCompetenceProvider {
public:
    // `dsel` must outlive this object
    KnnRegionOfCompetence(const Dataset& dsel, size_t k);

    CompetenceRegion region(const FeatureVector& query) const override;
    size_t k() const override { return k_; }

    static float euclidean_distance(const FeatureVector& a, const FeatureVector& b);

private:
    const Dataset& dsel_;
    size_t k_;
};

}  // namespace knora
