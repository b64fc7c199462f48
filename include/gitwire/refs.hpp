#pragma once
#include "gitwire/hash.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace gitwire {

// ref name -> object id, as advertised or as stored locally
using RefMap = std::map<std::string, oid>;

// git check-ref-format rules: no "..", "//", "@{", control or special
// characters, no component starting with '.' or ending in ".lock", no leading
// or trailing '/'. One-level names such as "HEAD" are accepted.
bool is_valid_ref_name(std::string_view name);

// "refs/heads/<branch>"
std::string heads_ref(std::string_view branch);

// Read a loose ref file (e.g., "refs/heads/master") under `git_dir`.
// Returns std::nullopt if it does not exist or is not a plain object id.
// Throws GitError for an invalid ref name.
std::optional<oid> read_ref(const std::filesystem::path& git_dir, const std::string& refname);

// Overwrite/create a loose ref with the given id (adds trailing newline on disk).
// Throws GitError for an invalid ref name, so a name never leaves `git_dir`.
void update_ref(const std::filesystem::path& git_dir, const std::string& refname, const oid& id);

// All loose refs under <git_dir>/refs, keyed by full name.
RefMap read_loose_refs(const std::filesystem::path& git_dir);

} // namespace gitwire
