#ifndef KNORA_CLI_ARGS_HPP
#define KNORA_CLI_ARGS_HPP

#include "knora/types.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace knora {
namespace cli {

// Thrown by the parser instead of calling exit(); code 0 for --help/--version
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int code, const std::string& message = "")
        : std::runtime_error(message), exit_code_(code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

struct ClassifyOptions {
    std::string pool_file;
    std::string dsel_file;
    std::string query_file;
    std::string output_file;             // empty = stdout
    size_t k = DEFAULT_K;                // region of competence size
    std::vector<size_t> excluded;        // classifiers pruned for every query
    bool labelled_queries = false;       // last query column is the true label
    bool explain = false;                // add competence / votes columns
    bool verbose = false;
};

// Print version string to stdout
void print_version();

// Print usage for `knora classify` to stdout
void print_classify_usage(const char* program_name);

// Parse `knora classify` arguments (argv[0] is the subcommand name).
// Throws ParseArgsExit(0) for --help/--version, ParseArgsExit(1, msg) on errors.
ClassifyOptions parse_classify_args(int argc, char* argv[]);

// "0,3,5" -> {0, 3, 5}; throws ParseArgsExit(1) on malformed input
std::vector<size_t> parse_index_list(const std::string& flag, const std::string& value);

}  // namespace cli
}  // namespace knora

#endif  // KNORA_CLI_ARGS_HPP
