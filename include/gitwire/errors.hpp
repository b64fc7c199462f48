#pragma once
#include <map>
#include <stdexcept>
#include <string>
#include <utility>

namespace gitwire {

// Base of every error the library raises on its own account.
class GitError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Malformed or unexpected data from the other side of a conversation.
class ProtocolError : public GitError {
public:
  using GitError::GitError;
};

// The remote location exists but holds no repository (HTTP 404).
class NotGitRepository : public GitError {
public:
  NotGitRepository() : GitError("not a git repository") {}
  explicit NotGitRepository(const std::string &what) : GitError(what) {}
};

// Server could not unpack the pack we sent; what() is the server's message.
class SendPackError : public GitError {
public:
  using GitError::GitError;
};

// One or more ref updates were refused by the server.
class UpdateRefsError : public GitError {
public:
  UpdateRefsError(const std::string &what, std::map<std::string, std::string> ref_status)
      : GitError(what), ref_status_(std::move(ref_status)) {}

  // ref name -> reason, failing refs only
  [[nodiscard]] auto ref_status() const -> const std::map<std::string, std::string> & {
    return ref_status_;
  }

private:
  std::map<std::string, std::string> ref_status_;
};

// Index file is unreadable as a whole (bad magic/version, truncation, checksum).
class IndexError : public GitError {
public:
  using GitError::GitError;
};

} // namespace gitwire
