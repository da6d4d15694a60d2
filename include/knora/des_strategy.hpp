#pragma once

#include "knora/types.hpp"

#include <string>

namespace knora {

/**
 * Capability set shared by dynamic ensemble selection strategies.
 *
 * Each strategy implements the three steps independently; shared services
 * (region of competence, pruning mask) are passed in at construction
 * rather than inherited.
 */
class DesStrategy {
public:
    virtual ~DesStrategy() = default;

    // One competence score per pool classifier
    virtual CompetenceVector estimate_competence(const FeatureVector& query) const = 0;

    // Labels of the selected classifiers, replicated by their vote weight
    virtual VoteSequence select(const FeatureVector& query) const = 0;

    // Final ensemble decision
    virtual Label classify_instance(const FeatureVector& query) const = 0;

    virtual std::string name() const = 0;
};

}  // namespace knora
