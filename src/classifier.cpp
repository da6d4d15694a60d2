#include "knora/classifier.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace knora {

DecisionStump::DecisionStump(size_t feature, float threshold, Label left, Label right)
    : feature_(feature), threshold_(threshold), left_(left), right_(right) {}

Label DecisionStump::predict(const FeatureVector& x) const {
    if (feature_ >= x.size()) {
        throw std::invalid_argument("DecisionStump: feature " + std::to_string(feature_) +
                                    " out of range for query with " +
                                    std::to_string(x.size()) + " features");
    }
    return (x[feature_] <= threshold_) ? left_ : right_;
}

std::string DecisionStump::describe() const {
    std::ostringstream oss;
    oss << "stump(x[" << feature_ << "] <= " << threshold_ << " ? " << left_ << " : " << right_ << ")";
    return oss.str();
}

LinearClassifier::LinearClassifier(size_t n_features, std::vector<ClassModel> classes)
    : n_features_(n_features), classes_(std::move(classes)) {
    if (classes_.empty()) {
        throw std::invalid_argument("LinearClassifier: no classes");
    }
    for (const auto& c : classes_) {
        if (c.weights.size() != n_features_) {
            throw std::invalid_argument("LinearClassifier: class " + std::to_string(c.label) +
                                        " has " + std::to_string(c.weights.size()) +
                                        " weights, expected " + std::to_string(n_features_));
        }
    }
}

Label LinearClassifier::predict(const FeatureVector& x) const {
    if (x.size() != n_features_) {
        throw std::invalid_argument("LinearClassifier: query has " + std::to_string(x.size()) +
                                    " features, expected " + std::to_string(n_features_));
    }

    size_t best = 0;
    double best_score = 0.0;
    for (size_t c = 0; c < classes_.size(); ++c) {
        double s = classes_[c].bias;
        for (size_t f = 0; f < n_features_; ++f) {
            s += static_cast<double>(classes_[c].weights[f]) * x[f];
        }
        // Strict > keeps the lower class index on ties
        if (c == 0 || s > best_score) {
            best = c;
            best_score = s;
        }
    }
    return classes_[best].label;
}

std::string LinearClassifier::describe() const {
    return "linear(" + std::to_string(n_features_) + " features, " +
           std::to_string(classes_.size()) + " classes)";
}

std::string ConstantClassifier::describe() const {
    return "constant(" + std::to_string(label_) + ")";
}

}  // namespace knora
