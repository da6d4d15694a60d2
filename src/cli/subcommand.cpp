#include "subcommand.hpp"
#include "knora/version.h"
#include <algorithm>
#include <iomanip>
#include <iostream>

namespace knora {
namespace cli {

SubcommandRegistry& SubcommandRegistry::instance() {
    static SubcommandRegistry registry;
    return registry;
}

void SubcommandRegistry::register_command(const std::string& name,
                                          const std::string& description,
                                          SubcommandFn fn,
                                          int order) {
    // Re-registering a name replaces its handler and help entry
    handlers_[name] = std::move(fn);
    auto existing = std::find_if(command_list_.begin(), command_list_.end(),
                                 [&](const CommandEntry& e) { return e.name == name; });
    if (existing != command_list_.end()) {
        existing->description = description;
        existing->order = order;
    } else {
        command_list_.push_back({name, description, order});
    }
}

bool SubcommandRegistry::has_command(const std::string& name) const {
    return handlers_.count(name) != 0;
}

int SubcommandRegistry::run_command(const std::string& name, int argc, char* argv[]) const {
    const auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        std::cerr << "Unknown command: " << name << "\n"
                  << "Run 'knora --help' for usage information.\n";
        return 1;
    }
    return it->second(argc, argv);
}

std::vector<SubcommandRegistry::CommandEntry> SubcommandRegistry::sorted_commands() const {
    // Sort by workflow order, then name, so help output is stable whatever
    // order the static registrars ran in
    auto sorted = command_list_;
    std::sort(sorted.begin(), sorted.end(),
              [](const CommandEntry& a, const CommandEntry& b) {
                  if (a.order != b.order) return a.order < b.order;
                  return a.name < b.name;
              });
    return sorted;
}

void SubcommandRegistry::print_help(const char* program_name) const {
    const auto sorted = sorted_commands();

    size_t width = 0;
    for (const auto& cmd : sorted) width = std::max(width, cmd.name.size());

    std::cout << "knora v" << KNORA_VERSION << " - k-Nearest Oracles Union ensemble selection\n\n"
              << "Usage: " << program_name << " <command> [options]\n\n"
              << "Commands:\n";
    for (const auto& cmd : sorted) {
        std::cout << "  " << std::left << std::setw(static_cast<int>(width + 2)) << cmd.name
                  << cmd.description << "\n";
    }
    std::cout << "\nFor help on a specific command: " << program_name << " <command> --help\n";
}

}  // namespace cli
}  // namespace knora
