#pragma once

#include "knora/types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace knora {

/**
 * A trained base classifier.
 *
 * The selection core only ever asks for a single label per query, so this
 * is the whole interface. Implementations must be immutable after
 * construction; predict() may be called concurrently.
 */
class BaseClassifier {
public:
    virtual ~BaseClassifier() = default;

    // Throws std::invalid_argument when the query does not fit the model
    virtual Label predict(const FeatureVector& x) const = 0;

    // Short human-readable description, used in verbose output
    virtual std::string describe() const = 0;
};

// Ordered pool. Order is the vote tie-break order.
using ClassifierPool = std::vector<std::unique_ptr<BaseClassifier>>;

// Axis-aligned split on one feature
class DecisionStump : public BaseClassifier {
public:
    DecisionStump(size_t feature, float threshold, Label left, Label right);

    Label predict(const FeatureVector& x) const override;
    std::string describe() const override;

    size_t feature() const { return feature_; }
    float threshold() const { return threshold_; }

private:
    size_t feature_;
    float threshold_;
    Label left_;
    Label right_;
};

// One-vs-rest linear model; argmax of w_c . x + b_c
class LinearClassifier : public BaseClassifier {
public:
    struct ClassModel {
        Label label = 0;
        float bias = 0.0f;
        std::vector<float> weights;
    };

    LinearClassifier(size_t n_features, std::vector<ClassModel> classes);

    Label predict(const FeatureVector& x) const override;
    std::string describe() const override;

    size_t n_features() const { return n_features_; }
    size_t n_classes() const { return classes_.size(); }

private:
    size_t n_features_;
    std::vector<ClassModel> classes_;
};

// Always votes for the same label
class ConstantClassifier : public BaseClassifier {
public:
    explicit ConstantClassifier(Label label) : label_(label) {}

    Label predict(const FeatureVector&) const override { return label_; }
    std::string describe() const override;

private:
    Label label_;
};

}  // namespace knora
