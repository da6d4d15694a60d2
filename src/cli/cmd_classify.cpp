// knora classify: KNORA-U ensemble decision for each query sample
//
// Loads the pool description and the DSEL, runs the pool over the DSEL once
// to build the oracle table, then classifies queries one at a time.

#include "subcommand.hpp"
#include "args.hpp"
#include "knora/dataset.hpp"
#include "knora/inclusion_mask.hpp"
#include "knora/knora_u.hpp"
#include "knora/log_utils.hpp"
#include "knora/pool_io.hpp"
#include "knora/processed_dsel.hpp"
#include "knora/region_of_competence.hpp"

#include <chrono>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

namespace knora {
namespace cli {

namespace {

int run_classify(const ClassifyOptions& opts) {
    auto t_start = std::chrono::steady_clock::now();

    ClassifierPool pool = load_pool(opts.pool_file);
    Dataset dsel = load_dataset(opts.dsel_file, true);
    Dataset queries = load_dataset(opts.query_file, opts.labelled_queries);

    if (dsel.empty()) {
        std::cerr << "Error: DSEL file has no samples: " << opts.dsel_file << "\n";
        return 1;
    }
    if (!queries.empty() && queries.n_features != dsel.n_features) {
        std::cerr << "Error: queries have " << queries.n_features << " features, DSEL has "
                  << dsel.n_features << "\n";
        return 1;
    }

    if (opts.verbose) {
        std::cerr << "Loaded inputs:\n";
        std::cerr << "  Classifiers: " << pool.size() << "\n";
        std::cerr << "  DSEL samples: " << dsel.size() << " (" << dsel.n_features << " features)\n";
        std::cerr << "  Queries: " << queries.size() << "\n";
        std::cerr << "  k: " << opts.k << "\n";
        for (size_t i = 0; i < pool.size(); ++i) {
            std::cerr << "  [" << i << "] " << pool[i]->describe() << "\n";
        }
    }

    auto t_load = std::chrono::steady_clock::now();

    const ProcessedDsel processed = ProcessedDsel::build(pool, dsel);

    auto t_oracle = std::chrono::steady_clock::now();
    if (opts.verbose) {
        std::cerr << "Oracle table built in " << log_utils::format_elapsed(t_load, t_oracle) << "\n";
        for (size_t i = 0; i < pool.size(); ++i) {
            std::cerr << "  DSEL accuracy [" << i << "]: " << std::fixed << std::setprecision(4)
                      << processed.classifier_accuracy(i) << "\n";
        }
    }

    const KnnRegionOfCompetence region(dsel, opts.k);
    std::unique_ptr<InclusionMaskProvider> mask;
    if (opts.excluded.empty()) {
        mask = std::make_unique<AllIncludedMask>(pool.size());
    } else {
        mask = std::make_unique<StaticInclusionMask>(
            StaticInclusionMask::excluding(pool.size(), opts.excluded));
    }
    const KnoraU strategy(pool, processed, region, *mask);
    if (opts.verbose) {
        std::cerr << "Strategy: " << strategy.name() << " (k=" << region.k() << ", "
                  << (opts.excluded.empty() ? std::string("no pruning")
                                            : std::to_string(opts.excluded.size()) + " excluded")
                  << ")\n";
    }

    std::ofstream file_out;
    if (!opts.output_file.empty()) {
        file_out.open(opts.output_file);
        if (!file_out) {
            std::cerr << "Error: Cannot open output file: " << opts.output_file << "\n";
            return 1;
        }
    }
    std::ostream& out = opts.output_file.empty() ? std::cout : file_out;

    out << "query\tpredicted";
    if (queries.labelled()) out << "\ttrue";
    if (opts.explain) out << "\tfallback\tcompetence\tvotes";
    out << '\n';

    size_t correct = 0;
    size_t fallbacks = 0;
    for (size_t q = 0; q < queries.size(); ++q) {
        const FeatureVector& x = queries.row(q);
        Label predicted;
        if (opts.explain) {
            const Decision d = strategy.explain(x);
            predicted = d.label;
            if (d.used_fallback) ++fallbacks;
            out << q << '\t' << predicted;
            if (queries.labelled()) out << '\t' << queries.labels[q];
            out << '\t' << (d.used_fallback ? "yes" : "no")
                << '\t' << join_ints(d.competences)
                << '\t' << join_labels(d.votes);
        } else {
            predicted = strategy.classify_instance(x);
            out << q << '\t' << predicted;
            if (queries.labelled()) out << '\t' << queries.labels[q];
        }
        out << '\n';
        if (queries.labelled() && predicted == queries.labels[q]) ++correct;
    }

    if (file_out.is_open()) {
        file_out.close();
        if (!file_out) {
            std::cerr << "Error: Failed writing output file: " << opts.output_file << "\n";
            return 1;
        }
    }

    auto t_end = std::chrono::steady_clock::now();

    if (queries.labelled() && !queries.empty()) {
        std::cerr << "Accuracy: " << std::fixed << std::setprecision(4)
                  << static_cast<double>(correct) / static_cast<double>(queries.size())
                  << " (" << correct << "/" << queries.size() << ")\n";
    }
    if (opts.verbose) {
        const auto classify_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(t_end - t_oracle).count();
        if (opts.explain) {
            std::cerr << "Fallback decisions: " << fallbacks << "/" << queries.size() << "\n";
        }
        std::cerr << "Classified " << queries.size() << " queries in "
                  << log_utils::format_duration_ms(classify_ms) << " ("
                  << log_utils::format_rate(queries.size(), classify_ms) << ")\n";
        std::cerr << "Total time: " << log_utils::format_elapsed(t_start, t_end) << "\n";
    }

    return 0;
}

}  // namespace

int cmd_classify(int argc, char* argv[]) {
    ClassifyOptions opts;
    try {
        opts = parse_classify_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.exit_code() != 0) {
            std::cerr << e.what() << "\n";
            std::cerr << "Use --help for usage.\n";
        }
        return e.exit_code();
    }

    try {
        return run_classify(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

namespace {
    struct ClassifyRegistrar {
        ClassifyRegistrar() {
            SubcommandRegistry::instance().register_command(
                "classify",
                "Classify queries with KNORA-U dynamic ensemble selection",
                cmd_classify, 10);
        }
    };
    static ClassifyRegistrar registrar;
}

}  // namespace cli
}  // namespace knora
