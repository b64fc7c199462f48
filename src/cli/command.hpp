#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace gitwire::cli {

// Arguments after the command name.
using Args = std::vector<std::string>;

// Returns the exit status. Failures are thrown; dispatch reports them.
using CommandFn = int (*)(const Args &args);

// Bad command line. Dispatch prints the message and the synopsis, exit status 2.
class UsageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct Command {
  std::string name;
  std::string synopsis; // e.g. "<url> [<name>]"
  std::string summary;
  CommandFn run;
};

// Built-in commands, one per file under commands/
int ls_remote(const Args &args);
int fetch_pack(const Args &args);
int send_pack(const Args &args);
int ls_files(const Args &args);
int update_index(const Args &args);
int write_tree(const Args &args);
int diff_index(const Args &args);
int remote(const Args &args);

} // namespace gitwire::cli
