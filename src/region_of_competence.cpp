#include "knora/region_of_competence.hpp"

#include <cmath>
#include <queue>
#include <stdexcept>
#include <string>
#include <utility>

namespace knora {

KnnRegionOfCompetence::KnnRegionOfCompetence(const Dataset& dsel, size_t k)
    : dsel_(dsel), k_(k) {
    if (k_ == 0) {
        throw std::invalid_argument("region of competence: k must be >= 1");
    }
    if (k_ > dsel_.size()) {
        throw std::invalid_argument("region of competence: k=" + std::to_string(k_) +
                                    " exceeds DSEL size " + std::to_string(dsel_.size()));
    }
}

float KnnRegionOfCompetence::euclidean_distance(const FeatureVector& a, const FeatureVector& b) {
    double sum = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        const double d = static_cast<double>(a[i]) - b[i];
        sum += d * d;
    }
    return static_cast<float>(std::sqrt(sum));
}

CompetenceRegion KnnRegionOfCompetence::region(const FeatureVector& query) const {
    if (query.size() != dsel_.n_features) {
        throw std::invalid_argument("region of competence: query has " + std::to_string(query.size()) +
                                    " features, DSEL has " + std::to_string(dsel_.n_features));
    }

    // Max-heap of the k best so far, keyed (distance, index) so equal
    // distances keep the lower DSEL index
    std::priority_queue<std::pair<float, size_t>> nearest;
    for (size_t j = 0; j < dsel_.size(); ++j) {
        const float dist = euclidean_distance(query, dsel_.rows[j]);
        if (nearest.size() < k_) {
            nearest.emplace(dist, j);
        } else if (std::make_pair(dist, j) < nearest.top()) {
            nearest.pop();
            nearest.emplace(dist, j);
        }
    }

    CompetenceRegion roc;
    roc.indices.resize(nearest.size());
    roc.distances.resize(nearest.size());
    for (size_t pos = nearest.size(); pos-- > 0;) {
        roc.distances[pos] = nearest.top().first;
        roc.indices[pos] = nearest.top().second;
        nearest.pop();
    }
    return roc;
}

}  // namespace knora
