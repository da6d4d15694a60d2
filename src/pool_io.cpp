#include "knora/pool_io.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace knora {

namespace {

[[noreturn]] void fail(const std::string& source, size_t line_no, const std::string& msg) {
    throw std::runtime_error(source + ":" + std::to_string(line_no) + ": " + msg);
}

template <typename T>
T read_field(std::istringstream& ss, const std::string& what,
             const std::string& source, size_t line_no) {
    T value{};
    if (!(ss >> value)) {
        fail(source, line_no, "expected " + what);
    }
    return value;
}

std::unique_ptr<BaseClassifier> parse_stump(std::istringstream& ss,
                                            const std::string& source, size_t line_no) {
    const long long feature = read_field<long long>(ss, "feature index", source, line_no);
    if (feature < 0) fail(source, line_no, "negative feature index");
    const float threshold = read_field<float>(ss, "threshold", source, line_no);
    const Label left = read_field<Label>(ss, "left label", source, line_no);
    const Label right = read_field<Label>(ss, "right label", source, line_no);
    return std::make_unique<DecisionStump>(static_cast<size_t>(feature), threshold, left, right);
}

std::unique_ptr<BaseClassifier> parse_linear(std::istringstream& ss,
                                             const std::string& source, size_t line_no) {
    const long long n_features = read_field<long long>(ss, "feature count", source, line_no);
    if (n_features < 1) fail(source, line_no, "feature count must be >= 1");
    const size_t nf = static_cast<size_t>(n_features);

    std::vector<LinearClassifier::ClassModel> classes;
    while (true) {
        LinearClassifier::ClassModel cm;
        cm.label = read_field<Label>(ss, "class label", source, line_no);
        cm.bias = read_field<float>(ss, "class bias", source, line_no);
        cm.weights.resize(nf);
        for (size_t f = 0; f < nf; ++f) {
            cm.weights[f] = read_field<float>(ss, "weight " + std::to_string(f), source, line_no);
        }
        classes.push_back(std::move(cm));

        std::string sep;
        if (!(ss >> sep)) break;
        if (sep != "|") fail(source, line_no, "expected '|' between classes, found '" + sep + "'");
    }
    return std::make_unique<LinearClassifier>(nf, std::move(classes));
}

}  // namespace

ClassifierPool read_pool(std::istream& in, const std::string& source_name) {
    ClassifierPool pool;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        const size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream ss(line);
        std::string kind;
        if (!(ss >> kind)) continue;

        std::unique_ptr<BaseClassifier> clf;
        if (kind == "stump") {
            clf = parse_stump(ss, source_name, line_no);
        } else if (kind == "linear") {
            clf = parse_linear(ss, source_name, line_no);
        } else if (kind == "constant") {
            clf = std::make_unique<ConstantClassifier>(
                read_field<Label>(ss, "label", source_name, line_no));
        } else {
            fail(source_name, line_no, "unknown classifier type '" + kind + "'");
        }

        std::string extra;
        if (ss >> extra) {
            fail(source_name, line_no, "unexpected trailing field '" + extra + "'");
        }
        pool.push_back(std::move(clf));
    }

    if (pool.empty()) {
        throw std::runtime_error(source_name + ": no classifiers defined");
    }
    return pool;
}

ClassifierPool load_pool(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Failed to open pool file: " + path);
    }
    return read_pool(in, path);
}

}  // namespace knora
