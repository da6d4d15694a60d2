// knora oracle: dump the DSEL oracle table of a pool
//
// One row per DSEL sample, one 0/1 column per classifier, followed by a
// per-classifier accuracy footer. Useful to check why a pool never reaches
// competence on some region.

#include "subcommand.hpp"
#include "knora/dataset.hpp"
#include "knora/log_utils.hpp"
#include "knora/pool_io.hpp"
#include "knora/processed_dsel.hpp"

#include <chrono>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <string>

namespace knora {
namespace cli {

int cmd_oracle(int argc, char* argv[]) {
    std::string pool_file;
    std::string dsel_file;
    std::string output_file;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        if ((strcmp(argv[i], "--pool") == 0 || strcmp(argv[i], "-p") == 0) && i + 1 < argc) {
            pool_file = argv[++i];
        } else if ((strcmp(argv[i], "--dsel") == 0 || strcmp(argv[i], "-d") == 0) && i + 1 < argc) {
            dsel_file = argv[++i];
        } else if ((strcmp(argv[i], "--output") == 0 || strcmp(argv[i], "-o") == 0) && i + 1 < argc) {
            output_file = argv[++i];
        } else if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--verbose") == 0) {
            verbose = true;
        } else if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
            std::cerr << "Usage: knora oracle --pool <pool.txt> --dsel <dsel.csv> [-o <out.tsv>]\n\n";
            std::cerr << "Write the DSEL oracle table: 1 where a classifier predicts the sample's label.\n\n";
            std::cerr << "Required:\n";
            std::cerr << "  --pool, -p <file>      Pool description\n";
            std::cerr << "  --dsel, -d <file>      Labelled dynamic selection set\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --output, -o <file>    Output TSV (default: stdout)\n";
            std::cerr << "  -v, --verbose          Verbose output\n";
            std::cerr << "  --help, -h             Show this help\n";
            return 0;
        } else {
            std::cerr << "Error: Unknown or incomplete option: " << argv[i] << "\n";
            return 1;
        }
    }

    if (pool_file.empty() || dsel_file.empty()) {
        std::cerr << "Error: --pool and --dsel are required\n";
        std::cerr << "Use --help for usage.\n";
        return 1;
    }

    try {
        auto t_start = std::chrono::steady_clock::now();

        ClassifierPool pool = load_pool(pool_file);
        Dataset dsel = load_dataset(dsel_file, true);
        const ProcessedDsel table = ProcessedDsel::build(pool, dsel);

        auto t_built = std::chrono::steady_clock::now();
        if (verbose) {
            std::cerr << "Oracle table: " << table.n_samples() << " samples x "
                      << table.n_classifiers() << " classifiers in "
                      << log_utils::format_elapsed(t_start, t_built) << "\n";
        }

        std::ofstream file_out;
        if (!output_file.empty()) {
            file_out.open(output_file);
            if (!file_out) {
                std::cerr << "Error: Cannot open output file: " << output_file << "\n";
                return 1;
            }
        }
        std::ostream& out = output_file.empty() ? std::cout : file_out;

        out << "sample";
        for (size_t c = 0; c < table.n_classifiers(); ++c) out << "\tc" << c;
        out << '\n';
        for (size_t j = 0; j < table.n_samples(); ++j) {
            out << j;
            for (size_t c = 0; c < table.n_classifiers(); ++c) {
                out << '\t' << static_cast<int>(table(j, c));
            }
            out << '\n';
        }
        out << "#accuracy";
        for (size_t c = 0; c < table.n_classifiers(); ++c) {
            out << '\t' << std::fixed << std::setprecision(4) << table.classifier_accuracy(c);
        }
        out << '\n';

        if (file_out.is_open()) {
            file_out.close();
            if (!file_out) {
                std::cerr << "Error: Failed writing output file: " << output_file << "\n";
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

namespace {
    struct OracleRegistrar {
        OracleRegistrar() {
            SubcommandRegistry::instance().register_command(
                "oracle",
                "Write the DSEL oracle (correctness) table of a pool",
                cmd_oracle, 20);
        }
    };
    static OracleRegistrar registrar;
}

}  // namespace cli
}  // namespace knora
