#include "args.hpp"
#include "knora/version.h"
#include <iostream>
#include <string>

namespace knora {
namespace cli {

void print_version() {
    std::cout << "knora " << KNORA_VERSION << "\n";
}

void print_classify_usage(const char* program_name) {
    std::cout << "knora v" << KNORA_VERSION << "\n\n";
    std::cout << "Usage: knora " << program_name << " --pool <file> --dsel <file> --queries <file> [options]\n\n";
    std::cout << "Classify each query with k-Nearest Oracles Union (KNORA-U).\n\n";
    std::cout << "Required:\n";
    std::cout << "  -p, --pool <file>        Pool description (stump/linear/constant lines)\n";
    std::cout << "  -d, --dsel <file>        Dynamic selection set: features then label (.csv/.tsv, .gz ok)\n";
    std::cout << "  -q, --queries <file>     Query samples: features only (.csv/.tsv, .gz ok)\n";
    std::cout << "\nOptions:\n";
    std::cout << "  -o, --output <file>      Output TSV (default: stdout)\n";
    std::cout << "  -k <int>                 Region of competence size (default: 7)\n";
    std::cout << "  --exclude <i,j,...>      Prune these classifiers for every query\n";
    std::cout << "  --labelled               Last query column is the true label; report accuracy\n";
    std::cout << "  --explain                Add fallback, competence and votes columns\n";
    std::cout << "  -v, --verbose            Verbose output\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  knora " << program_name << " -p pool.txt -d dsel.csv -q test.csv -o predictions.tsv\n";
    std::cout << "  knora " << program_name << " -p pool.txt -d dsel.csv.gz -q test.csv --labelled --explain\n";
}

std::vector<size_t> parse_index_list(const std::string& flag, const std::string& value) {
    std::vector<size_t> out;
    size_t start = 0;
    while (start <= value.size()) {
        size_t comma = value.find(',', start);
        if (comma == std::string::npos) comma = value.size();
        const std::string item = value.substr(start, comma - start);
        if (item.empty() || item.find_first_not_of("0123456789") != std::string::npos) {
            throw ParseArgsExit(1, "Error: Invalid index list for " + flag + ": " + value);
        }
        try {
            out.push_back(static_cast<size_t>(std::stoull(item)));
        } catch (const std::out_of_range&) {
            throw ParseArgsExit(1, "Error: Index out of range for " + flag + ": " + item);
        }
        start = comma + 1;
    }
    return out;
}

ClassifyOptions parse_classify_args(int argc, char* argv[]) {
    ClassifyOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_size = [&](const std::string& flag, const std::string& value) -> size_t {
            try {
                size_t idx = 0;
                if (!value.empty() && value[0] == '-') {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                size_t parsed = std::stoull(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::logic_error&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_classify_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-p" || arg == "--pool") {
            opts.pool_file = require_value(arg);
        } else if (arg == "-d" || arg == "--dsel") {
            opts.dsel_file = require_value(arg);
        } else if (arg == "-q" || arg == "--queries") {
            opts.query_file = require_value(arg);
        } else if (arg == "-o" || arg == "--output") {
            opts.output_file = require_value(arg);
        } else if (arg == "-k") {
            opts.k = parse_size(arg, require_value(arg));
            if (opts.k < 1) {
                throw ParseArgsExit(1, "Error: -k must be >= 1");
            }
        } else if (arg == "--exclude") {
            opts.excluded = parse_index_list(arg, require_value(arg));
        } else if (arg == "--labelled") {
            opts.labelled_queries = true;
        } else if (arg == "--explain") {
            opts.explain = true;
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.pool_file.empty()) {
        throw ParseArgsExit(1, "Error: No pool file specified (--pool)");
    }
    if (opts.dsel_file.empty()) {
        throw ParseArgsExit(1, "Error: No DSEL file specified (--dsel)");
    }
    if (opts.query_file.empty()) {
        throw ParseArgsExit(1, "Error: No query file specified (--queries)");
    }

    return opts;
}

}  // namespace cli
}  // namespace knora
