#include "knora/knora_u.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

namespace knora {

KnoraU::KnoraU(const ClassifierPool& pool,
               const ProcessedDsel& processed_dsel,
               const RegionOfCompetenceProvider& region,
               const InclusionMaskProvider& mask)
    : pool_(pool), processed_dsel_(processed_dsel), region_(region), mask_(mask) {
    if (pool_.empty()) {
        throw std::invalid_argument("KNORA-U: classifier pool is empty");
    }
    for (size_t i = 0; i < pool_.size(); ++i) {
        if (!pool_[i]) {
            throw std::invalid_argument("KNORA-U: pool entry " + std::to_string(i) + " is null");
        }
    }
    if (processed_dsel_.n_classifiers() != pool_.size()) {
        throw std::invalid_argument(
            "KNORA-U: processed DSEL has " + std::to_string(processed_dsel_.n_classifiers()) +
            " classifier columns, pool has " + std::to_string(pool_.size()));
    }
}

CompetenceVector KnoraU::estimate_competence(const FeatureVector& query) const {
    const CompetenceRegion roc = region_.region(query);
    const InclusionMask included = mask_.mask(query);
    const size_t n = pool_.size();

    if (included.size() != n) {
        throw std::invalid_argument("KNORA-U: inclusion mask has " + std::to_string(included.size()) +
                                    " entries, pool has " + std::to_string(n));
    }
    for (size_t j : roc.indices) {
        if (j >= processed_dsel_.n_samples()) {
            throw std::out_of_range("KNORA-U: region index " + std::to_string(j) +
                                    " outside processed DSEL (" +
                                    std::to_string(processed_dsel_.n_samples()) + " samples)");
        }
    }

    CompetenceVector competences(n, 0);
    for (size_t clf = 0; clf < n; ++clf) {
        // Pruned classifiers never accrue competence
        if (!included[clf]) continue;
        int correct = 0;
        for (size_t j : roc.indices) {
            correct += processed_dsel_(j, clf);
        }
        competences[clf] = correct;
    }
    return competences;
}

VoteSequence KnoraU::collect_votes(const FeatureVector& query,
                                   const std::vector<int>& weights) const {
    VoteSequence votes;
    size_t total = 0;
    for (int w : weights) total += static_cast<size_t>(w);
    votes.reserve(total);

    // One predict() per classifier, in pool order, whatever its weight
    for (size_t clf = 0; clf < pool_.size(); ++clf) {
        const Label label = pool_[clf]->predict(query);
        votes.insert(votes.end(), static_cast<size_t>(weights[clf]), label);
    }
    return votes;
}

VoteSequence KnoraU::select(const FeatureVector& query) const {
    return collect_votes(query, vote_weights(estimate_competence(query)));
}

Label KnoraU::classify_instance(const FeatureVector& query) const {
    return plurality_vote(select(query));
}

Decision KnoraU::explain(const FeatureVector& query) const {
    Decision d;
    d.competences = estimate_competence(query);
    d.weights = vote_weights(d.competences, &d.used_fallback);
    d.votes = collect_votes(query, d.weights);
    d.label = plurality_vote(d.votes);
    return d;
}

std::vector<int> vote_weights(const CompetenceVector& competences, bool* used_fallback) {
    const bool all_zero = std::all_of(competences.begin(), competences.end(),
                                      [](int c) { return c == 0; });
    if (used_fallback) *used_fallback = all_zero;
    if (all_zero) {
        // Nobody is competent: every classifier votes once, masked or not
        return std::vector<int>(competences.size(), 1);
    }
    return competences;
}

Label plurality_vote(const VoteSequence& votes) {
    if (votes.empty()) {
        throw std::invalid_argument("plurality_vote: empty vote sequence");
    }

    // (label, count) in first-seen order
    std::vector<std::pair<Label, size_t>> tally;
    std::unordered_map<Label, size_t> slot;
    for (Label v : votes) {
        auto it = slot.find(v);
        if (it == slot.end()) {
            slot.emplace(v, tally.size());
            tally.emplace_back(v, 1);
        } else {
            ++tally[it->second].second;
        }
    }

    size_t best = 0;
    for (size_t i = 1; i < tally.size(); ++i) {
        if (tally[i].second > tally[best].second) best = i;
    }
    return tally[best].first;
}

}  // namespace knora
