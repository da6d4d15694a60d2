// Tests for the services around the selection core: k-NN region of
// competence, inclusion masks, the DSEL oracle table, dataset and pool
// file parsing.

#include "knora/classifier.hpp"
#include "knora/dataset.hpp"
#include "knora/inclusion_mask.hpp"
#include "knora/pool_io.hpp"
#include "knora/processed_dsel.hpp"
#include "knora/region_of_competence.hpp"

#include <cassert>
#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <zlib.h>

namespace fs = std::filesystem;

template <typename Ex, typename Fn>
static bool throws(Fn&& fn) {
    try {
        fn();
    } catch (const Ex&) {
        return true;
    }
    return false;
}

static fs::path temp_file(const std::string& name) {
    return fs::temp_directory_path() / ("knora_test_" + name);
}

static void write_text(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

static void write_gzip(const fs::path& path, const std::string& content) {
    gzFile gz = gzopen(path.string().c_str(), "wb");
    assert(gz != nullptr);
    int written = gzwrite(gz, content.data(), static_cast<unsigned>(content.size()));
    assert(written == static_cast<int>(content.size()));
    (void)written;
    gzclose(gz);
}

// 1-D DSEL at positions 0, 1, 2, ..., n-1
static knora::Dataset line_dsel(size_t n) {
    knora::Dataset ds;
    ds.n_features = 1;
    for (size_t i = 0; i < n; ++i) {
        ds.rows.push_back({static_cast<float>(i)});
        ds.labels.push_back(static_cast<knora::Label>(i % 2));
    }
    return ds;
}

void test_knn_region() {
    std::cout << "Testing k-NN region of competence... ";
    knora::Dataset ds = line_dsel(10);
    knora::KnnRegionOfCompetence region(ds, 3);

    auto roc = region.region({6.2f});
    assert(roc.size() == 3);
    assert(roc.indices[0] == 6);
    assert(roc.indices[1] == 7);
    assert(roc.indices[2] == 5);
    assert(std::abs(roc.distances[0] - 0.2f) < 1e-5f);
    assert(roc.distances[0] <= roc.distances[1] && roc.distances[1] <= roc.distances[2]);

    // Equidistant neighbours: lower DSEL index first
    auto tie = region.region({4.5f});
    assert(tie.indices[0] == 4);
    assert(tie.indices[1] == 5);

    // Query far to the left picks the first three samples
    auto left = region.region({-100.0f});
    assert(left.indices == std::vector<size_t>({0, 1, 2}));

    assert(region.k() == 3);
    std::cout << "PASSED\n";
}

void test_knn_region_errors() {
    std::cout << "Testing k-NN region errors... ";
    knora::Dataset ds = line_dsel(4);
    assert(throws<std::invalid_argument>([&] { knora::KnnRegionOfCompetence r(ds, 0); }));
    assert(throws<std::invalid_argument>([&] { knora::KnnRegionOfCompetence r(ds, 5); }));

    knora::KnnRegionOfCompetence all(ds, 4);
    assert(all.region({1.0f}).size() == 4);
    // Malformed query is rejected by the provider
    assert(throws<std::invalid_argument>([&] { all.region({1.0f, 2.0f}); }));
    std::cout << "PASSED\n";
}

void test_masks() {
    std::cout << "Testing inclusion masks... ";
    knora::AllIncludedMask all(4);
    assert(all.mask({}) == knora::InclusionMask(4, true));

    auto m = knora::StaticInclusionMask::excluding(4, {1, 3});
    assert(m.mask({0.0f}) == knora::InclusionMask({true, false, true, false}));
    assert(throws<std::out_of_range>([] { knora::StaticInclusionMask::excluding(2, {2}); }));
    std::cout << "PASSED\n";
}

void test_processed_dsel_build() {
    std::cout << "Testing oracle table build... ";
    // Labels alternate 0,1,0,1,... over x = 0..7
    knora::Dataset ds = line_dsel(8);

    knora::ClassifierPool pool;
    pool.push_back(std::make_unique<knora::ConstantClassifier>(0));
    pool.push_back(std::make_unique<knora::ConstantClassifier>(1));
    pool.push_back(std::make_unique<knora::DecisionStump>(0, 3.5f, 0, 1));

    auto table = knora::ProcessedDsel::build(pool, ds);
    assert(table.n_samples() == 8);
    assert(table.n_classifiers() == 3);
    for (size_t j = 0; j < 8; ++j) {
        const bool even = (j % 2) == 0;
        assert(table.at(j, 0) == (even ? 1 : 0));
        assert(table.at(j, 1) == (even ? 0 : 1));
        const knora::Label stump = j <= 3 ? 0 : 1;
        assert(table(j, 2) == (stump == ds.labels[j] ? 1 : 0));
    }
    assert(std::abs(table.classifier_accuracy(0) - 0.5) < 1e-12);
    assert(std::abs(table.classifier_accuracy(2) - 0.5) < 1e-12);
    assert(throws<std::out_of_range>([&] { table.at(8, 0); }));
    assert(throws<std::out_of_range>([&] { table.at(0, 3); }));

    // A classifier that cannot handle the DSEL fails the whole pass
    knora::ClassifierPool bad;
    bad.push_back(std::make_unique<knora::DecisionStump>(4, 0.0f, 0, 1));
    assert(throws<std::invalid_argument>([&] { knora::ProcessedDsel::build(bad, ds); }));

    knora::ClassifierPool empty;
    assert(throws<std::invalid_argument>([&] { knora::ProcessedDsel::build(empty, ds); }));
    std::cout << "PASSED\n";
}

void test_processed_dsel_validation() {
    std::cout << "Testing oracle table validation... ";
    assert(throws<std::invalid_argument>([] { knora::ProcessedDsel(2, 2, {1, 0, 1}); }));
    assert(throws<std::invalid_argument>([] { knora::ProcessedDsel(1, 2, {1, 2}); }));
    knora::ProcessedDsel ok(1, 2, {1, 0});
    assert(ok.at(0, 0) == 1 && ok.at(0, 1) == 0);
    std::cout << "PASSED\n";
}

void test_classifiers() {
    std::cout << "Testing base classifiers... ";
    knora::DecisionStump stump(1, 0.5f, 7, 9);
    assert(stump.feature() == 1 && stump.threshold() == 0.5f);
    assert(stump.predict({100.0f, 0.5f}) == 7);
    assert(stump.predict({-100.0f, 0.6f}) == 9);
    assert(throws<std::invalid_argument>([&] { stump.predict({0.0f}); }));

    std::vector<knora::LinearClassifier::ClassModel> classes = {
        {10, 0.0f, {1.0f, 0.0f}},
        {20, 0.0f, {0.0f, 1.0f}},
    };
    knora::LinearClassifier linear(2, classes);
    assert(linear.n_features() == 2 && linear.n_classes() == 2);
    assert(linear.predict({2.0f, 1.0f}) == 10);
    assert(linear.predict({1.0f, 2.0f}) == 20);
    assert(linear.predict({1.0f, 1.0f}) == 10);  // tie: lower class index
    assert(throws<std::invalid_argument>([&] { linear.predict({1.0f}); }));
    assert(throws<std::invalid_argument>([] {
        knora::LinearClassifier(3, {{1, 0.0f, {1.0f}}});
    }));
    std::cout << "PASSED\n";
}

void test_pool_parsing() {
    std::cout << "Testing pool description parsing... ";
    std::istringstream in(
        "# three classifiers\n"
        "stump 0 1.5 0 1\n"
        "\n"
        "linear 2 0 0.5 1 -1 | 1 -0.5 -1 1   # two classes\n"
        "constant 4\n");
    knora::ClassifierPool pool = knora::read_pool(in, "pool.txt");
    assert(pool.size() == 3);
    assert(pool[0]->predict({1.0f, 0.0f}) == 0);
    assert(pool[0]->predict({2.0f, 0.0f}) == 1);
    assert(pool[1]->predict({3.0f, 0.0f}) == 0);
    assert(pool[1]->predict({0.0f, 3.0f}) == 1);
    assert(pool[2]->predict({}) == 4);

    auto error_of = [](const std::string& text) -> std::string {
        std::istringstream bad(text);
        try {
            knora::read_pool(bad, "pool.txt");
        } catch (const std::runtime_error& e) {
            return e.what();
        }
        return "";
    };
    assert(error_of("stump 0 1.5 0\n").find("pool.txt:1:") == 0);
    assert(error_of("constant 1\nforest 3\n").find("pool.txt:2:") == 0);
    assert(error_of("linear 2 0 0.5 1\n").find("pool.txt:1:") == 0);
    assert(error_of("linear 1 0 0 1 / 1 0 1\n").find("'|'") != std::string::npos);
    assert(error_of("constant 1 2\n").find("trailing") != std::string::npos);
    assert(error_of("# nothing\n").find("no classifiers") != std::string::npos);
    assert(throws<std::runtime_error>([] { knora::load_pool("/nonexistent/knora_pool.txt"); }));
    std::cout << "PASSED\n";
}

void test_numeric_fields() {
    std::cout << "Testing numeric field parsing... ";
    std::vector<double> f;
    assert(knora::parse_numeric_fields("1.5,2,-3", f) && f == std::vector<double>({1.5, 2.0, -3.0}));
    assert(knora::parse_numeric_fields("1\t2\t3", f) && f.size() == 3);
    assert(knora::parse_numeric_fields("  1   2 3 ", f) && f.size() == 3);
    assert(knora::parse_numeric_fields("1, 2 ,3", f) && f.size() == 3);
    assert(!knora::parse_numeric_fields("x,y,label", f));
    assert(!knora::parse_numeric_fields("1,,2", f));
    assert(!knora::parse_numeric_fields("1,nan,2", f));
    std::cout << "PASSED\n";
}

void test_dataset_loading() {
    std::cout << "Testing dataset loading (plain and gzip)... ";
    const std::string csv =
        "x0,x1,label\n"
        "0.0,1.0,0\n"
        "\n"
        "2.5,-1.0,1\n"
        "3.0,3.0,2\n";

    const fs::path plain = temp_file("dsel.csv");
    write_text(plain, csv);
    knora::Dataset ds = knora::load_dataset(plain.string(), true);
    assert(ds.size() == 3);
    assert(ds.n_features == 2);
    assert(ds.labelled());
    assert(ds.labels == std::vector<knora::Label>({0, 1, 2}));
    assert(ds.row(1)[0] == 2.5f && ds.row(1)[1] == -1.0f);
    assert(throws<std::out_of_range>([&] { ds.row(3); }));

    const fs::path gz = temp_file("dsel.csv.gz");
    write_gzip(gz, csv);
    knora::Dataset dsz = knora::load_dataset(gz.string(), true);
    assert(dsz.rows == ds.rows);
    assert(dsz.labels == ds.labels);

    // Same file read as unlabelled queries keeps all three columns
    knora::Dataset q = knora::load_dataset(plain.string(), false);
    assert(q.n_features == 3 && !q.labelled());

    const fs::path tsv = temp_file("queries.tsv");
    write_text(tsv, "1\t2\r\n3\t4\r\n");
    knora::Dataset qt = knora::load_dataset(tsv.string(), false);
    assert(qt.size() == 2 && qt.n_features == 2);

    const fs::path ragged = temp_file("ragged.csv");
    write_text(ragged, "1,2,0\n1,2\n");
    bool threw = false;
    try {
        knora::load_dataset(ragged.string(), true);
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()).find(":2:") != std::string::npos;
    }
    assert(threw);

    const fs::path frac = temp_file("frac.csv");
    write_text(frac, "1,2,0.5\n");
    assert(throws<std::runtime_error>([&] { knora::load_dataset(frac.string(), true); }));

    const fs::path junk = temp_file("junk.csv");
    const std::vector<std::pair<std::string, std::string>> bad_rows = {
        {"1,2,0\n1,abc,1\n", ":2:"},
        {"0.1,0\n0.1,5000000000\n", "label out of range"},
        {"0.1,-3000000000\n", "label out of range"},
        {"1e39,0\n", "out of float range"},
        {"1,-1e300,0\n", "out of float range"},
    };
    for (const auto& [text, message] : bad_rows) {
        write_text(junk, text);
        bool rejected = false;
        try {
            knora::load_dataset(junk.string(), true);
        } catch (const std::runtime_error& e) {
            rejected = std::string(e.what()).find(message) != std::string::npos;
        }
        assert(rejected);
    }
    // Extremes of the label type still load
    write_text(junk, "0.5,2147483647\n0.5,-2147483648\n");
    knora::Dataset extremes = knora::load_dataset(junk.string(), true);
    assert(extremes.labels == std::vector<knora::Label>({2147483647, -2147483647 - 1}));

    assert(throws<std::runtime_error>([] { knora::load_dataset("/nonexistent/knora.csv", true); }));

    for (const auto& p : {plain, gz, tsv, ragged, frac, junk}) {
        std::error_code ec;
        fs::remove(p, ec);
    }
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Framework Service Tests ===\n\n";
    test_knn_region();
    test_knn_region_errors();
    test_masks();
    test_processed_dsel_build();
    test_processed_dsel_validation();
    test_classifiers();
    test_pool_parsing();
    test_numeric_fields();
    test_dataset_loading();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
