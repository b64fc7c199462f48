#pragma once
#include "cli/command.hpp"

#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <string_view>

namespace gitwire::cli {

class Registry {
public:
  void add(Command cmd);
  [[nodiscard]] auto find(std::string_view name) const -> const Command *;

  /**
   * Run the command named by argv[1] with the remaining arguments.
   * Usage errors exit with 2. Any other exception is reported on `err` as
   * "<command>: <what>" and exits with 1.
   */
  auto dispatch(int argc, const char *const *argv, std::ostream &err) const -> int;

  void print_usage(std::ostream &out) const;

private:
  std::map<std::string, Command, std::less<>> commands_;
};

// Registry holding every built-in command (register_commands.cpp).
auto builtin_commands() -> Registry;

} // namespace gitwire::cli
