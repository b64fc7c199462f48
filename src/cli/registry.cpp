#include "cli/registry.hpp"

#include <exception>
#include <iomanip>
#include <stdexcept>
#include <utility>

namespace gitwire::cli {

void Registry::add(Command cmd) {
  const std::string name = cmd.name;
  if (!commands_.try_emplace(name, std::move(cmd)).second) {
    throw std::logic_error("command registered twice: " + name);
  }
}

auto Registry::find(std::string_view name) const -> const Command * {
  const auto it = commands_.find(name);
  return it == commands_.end() ? nullptr : &it->second;
}

auto Registry::dispatch(int argc, const char *const *argv, std::ostream &err) const -> int {
  if (argc < 2) {
    print_usage(err);
    return 2;
  }
  const Command *cmd = find(argv[1]);
  if (cmd == nullptr) {
    err << "unknown command: " << argv[1] << "\n";
    print_usage(err);
    return 2;
  }

  const Args args(argv + 2, argv + argc);
  try {
    return cmd->run(args);
  } catch (const UsageError &e) {
    if (*e.what() != '\0') {
      err << cmd->name << ": " << e.what() << "\n";
    }
    err << "usage: gitwire " << cmd->name << ' ' << cmd->synopsis << "\n";
    return 2;
  } catch (const std::exception &e) {
    err << cmd->name << ": " << e.what() << "\n";
    return 1;
  }
}

void Registry::print_usage(std::ostream &out) const {
  out << "usage: gitwire <command> [args]\n\ncommands:\n";
  for (const auto &[name, cmd] : commands_) {
    out << "  " << std::left << std::setw(14) << name << cmd.summary << "\n";
  }
}

} // namespace gitwire::cli
