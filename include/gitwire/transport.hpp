#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace gitwire {

/**
 * A duplex byte channel to a git service. Reads and writes block.
 * Implementations release their resources on destruction; close() may be
 * called more than once.
 */
class Connection {
public:
  virtual ~Connection() = default;

  // Read up to n bytes into dst. Returns 0 at end of stream.
  virtual auto read(std::uint8_t *dst, std::size_t n) -> std::size_t = 0;

  virtual void write(std::span<const std::uint8_t> data) = 0;

  // True if a read would not block right now. Advisory only.
  virtual auto can_read() -> bool { return false; }

  virtual void close() = 0;
};

using ConnectionPtr = std::unique_ptr<Connection>;

// Connected TCP socket to host:port. Throws std::system_error / std::runtime_error.
auto connect_tcp(const std::string &host, int port) -> ConnectionPtr;

// Spawn argv[0] with stdin/stdout attached to the returned connection.
auto spawn_process(const std::vector<std::string> &argv) -> ConnectionPtr;

/**
 * Opens the remote end of an SSH session. Passed explicitly to the SSH client
 * so callers can substitute their own program or a test double.
 */
class SshVendor {
public:
  virtual ~SshVendor() = default;
  virtual auto connect_ssh(const std::string &host, const std::vector<std::string> &command,
                           const std::optional<std::string> &username,
                           std::optional<int> port) -> ConnectionPtr = 0;
};

// Runs an OpenSSH-compatible client: <program> -x [-p port] [user@]host command...
class SubprocessSshVendor : public SshVendor {
public:
  explicit SubprocessSshVendor(std::string program = "ssh") : program_(std::move(program)) {}

  auto connect_ssh(const std::string &host, const std::vector<std::string> &command,
                   const std::optional<std::string> &username,
                   std::optional<int> port) -> ConnectionPtr override;

private:
  std::string program_;
};

/**
 * In-memory connection: reads come from a fixed buffer, writes are
 * collected. Backs HTTP request/response bodies.
 */
class BufferConnection : public Connection {
public:
  BufferConnection() = default;
  explicit BufferConnection(std::string input) : input_(std::move(input)) {}

  auto read(std::uint8_t *dst, std::size_t n) -> std::size_t override;
  void write(std::span<const std::uint8_t> data) override;
  auto can_read() -> bool override { return pos_ < input_.size(); }
  void close() override {}

  [[nodiscard]] auto written() const -> const std::string & { return output_; }

private:
  std::string input_;
  std::size_t pos_{0};
  std::string output_;
};

} // namespace gitwire
