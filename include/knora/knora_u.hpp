#pragma once

#include "knora/classifier.hpp"
#include "knora/des_strategy.hpp"
#include "knora/inclusion_mask.hpp"
#include "knora/processed_dsel.hpp"
#include "knora/region_of_competence.hpp"
#include "knora/types.hpp"

#include <string>
#include <vector>

namespace knora {

// Everything that went into one decision, for --explain style output
struct Decision {
    CompetenceVector competences;
    std::vector<int> weights;
    bool used_fallback = false;
    VoteSequence votes;
    Label label = 0;
};

/**
 * k-Nearest Oracles Union.
 *
 * Every classifier that correctly predicts at least one sample of the
 * region of competence is selected, with one vote per neighbour it got
 * right. When no eligible classifier gets any neighbour right, every
 * classifier in the pool votes once (pruned ones included).
 *
 * Ties in the final plurality go to the label voted first, i.e. the label
 * of the earliest classifier in pool order.
 *
 * Reference: Ko, Sabourin, Britto. "From dynamic classifier selection to
 * dynamic ensemble selection." Pattern Recognition 41.5 (2008).
 *
 * Holds references only; the pool, table and providers must outlive it.
 * All query methods are const and touch no shared mutable state.
 */
class KnoraU : public DesStrategy {
public:
    KnoraU(const ClassifierPool& pool,
           const ProcessedDsel& processed_dsel,
           const RegionOfCompetenceProvider& region,
           const InclusionMaskProvider& mask);

    CompetenceVector estimate_competence(const FeatureVector& query) const override;
    VoteSequence select(const FeatureVector& query) const override;
    Label classify_instance(const FeatureVector& query) const override;
    std::string name() const override { return "k-Nearest Oracles Union"; }

    Decision explain(const FeatureVector& query) const;

    size_t n_classifiers() const { return pool_.size(); }

private:
    VoteSequence collect_votes(const FeatureVector& query, const std::vector<int>& weights) const;

    const ClassifierPool& pool_;
    const ProcessedDsel& processed_dsel_;
    const RegionOfCompetenceProvider& region_;
    const InclusionMaskProvider& mask_;
};

// Competences if any is non-zero, otherwise weight 1 for every classifier
std::vector<int> vote_weights(const CompetenceVector& competences, bool* used_fallback = nullptr);

// Most frequent label; ties go to the label seen first.
// Throws std::invalid_argument on an empty sequence.
Label plurality_vote(const VoteSequence& votes);

}  // namespace knora
