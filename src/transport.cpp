#include "gitwire/transport.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <sys/socket.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>
#include <vector>

namespace {

class UniqueFd {
public:
  UniqueFd() = default;
  explicit UniqueFd(int fd) noexcept : fd_{fd} {}

  UniqueFd(const UniqueFd &) = delete;
  auto operator=(const UniqueFd &) -> UniqueFd & = delete;

  UniqueFd(UniqueFd &&other) noexcept : fd_{other.fd_} { other.fd_ = -1; }
  auto operator=(UniqueFd &&other) noexcept -> UniqueFd & {
    if (this != &other) {
      close_if_open();
      fd_ = other.fd_;
      other.fd_ = -1;
    }
    return *this;
  }

  ~UniqueFd() { close_if_open(); }

  [[nodiscard]] auto valid() const noexcept -> bool { return fd_ != -1; }
  [[nodiscard]] explicit operator bool() const noexcept { return valid(); }
  [[nodiscard]] auto get() const noexcept -> int { return fd_; }

  void reset(int fd = -1) noexcept {
    if (fd_ != fd) {
      close_if_open();
      fd_ = fd;
    }
  }

private:
  int fd_{-1};

  void close_if_open() noexcept {
    if (fd_ != -1) {
      // best effort; no throw in destructor
      ::close(fd_);
      fd_ = -1;
    }
  }
};

[[nodiscard]] auto fd_can_read(int fd) -> bool {
  pollfd p{};
  p.fd = fd;
  p.events = POLLIN;
  const int rc = ::poll(&p, 1, 0);
  if (rc < 0) {
    throw std::system_error(errno, std::generic_category(), "poll");
  }
  return rc > 0 && (p.revents & (POLLIN | POLLHUP)) != 0;
}

[[nodiscard]] auto gai_error_to_exception(int rc, std::string_view where, std::string_view host,
                                          int port) -> std::runtime_error {
  std::ostringstream os;
  os << where << " failed for " << host << ":" << port << ": " << gai_strerror(rc);
  return std::runtime_error(os.str());
}

class SocketConnection : public gitwire::Connection {
public:
  explicit SocketConnection(UniqueFd fd) : fd_(std::move(fd)) {}

  auto read(std::uint8_t *dst, std::size_t n) -> std::size_t override {
    for (;;) {
      const ssize_t r = ::recv(fd_.get(), dst, n, 0);
      if (r >= 0) {
        return static_cast<std::size_t>(r);
      }
      if (errno != EINTR) {
        throw std::system_error(errno, std::generic_category(), "recv");
      }
    }
  }

  void write(std::span<const std::uint8_t> data) override {
    const auto *p = data.data();
    std::size_t n = data.size();
    while (n != 0U) {
      const ssize_t w = ::send(fd_.get(), p, n, MSG_NOSIGNAL);
      if (w < 0 && errno == EINTR) {
        continue;
      }
      if (w <= 0) {
        throw std::system_error(errno, std::generic_category(), "send");
      }
      p += static_cast<std::size_t>(w);
      n -= static_cast<std::size_t>(w);
    }
  }

  auto can_read() -> bool override { return fd_ && fd_can_read(fd_.get()); }

  void close() override { fd_.reset(); }

private:
  UniqueFd fd_;
};

class ProcessConnection : public gitwire::Connection {
public:
  ProcessConnection(pid_t pid, UniqueFd to_child, UniqueFd from_child)
      : pid_(pid), to_child_(std::move(to_child)), from_child_(std::move(from_child)) {}

  ProcessConnection(const ProcessConnection &) = delete;
  auto operator=(const ProcessConnection &) -> ProcessConnection & = delete;

  ~ProcessConnection() override { close(); }

  auto read(std::uint8_t *dst, std::size_t n) -> std::size_t override {
    for (;;) {
      const ssize_t r = ::read(from_child_.get(), dst, n);
      if (r >= 0) {
        return static_cast<std::size_t>(r);
      }
      if (errno != EINTR) {
        throw std::system_error(errno, std::generic_category(), "read from subprocess");
      }
    }
  }

  void write(std::span<const std::uint8_t> data) override {
    const auto *p = data.data();
    std::size_t n = data.size();
    while (n != 0U) {
      const ssize_t w = ::write(to_child_.get(), p, n);
      if (w < 0 && errno == EINTR) {
        continue;
      }
      if (w <= 0) {
        throw std::system_error(errno, std::generic_category(), "write to subprocess");
      }
      p += static_cast<std::size_t>(w);
      n -= static_cast<std::size_t>(w);
    }
  }

  auto can_read() -> bool override { return from_child_ && fd_can_read(from_child_.get()); }

  void close() override {
    to_child_.reset();
    from_child_.reset();
    if (pid_ > 0) {
      int status = 0;
      while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
      }
      pid_ = -1;
    }
  }

private:
  pid_t pid_;
  UniqueFd to_child_;
  UniqueFd from_child_;
};

} // namespace

namespace gitwire {

auto connect_tcp(const std::string &host, int port) -> ConnectionPtr {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;

  addrinfo *res = nullptr;
  const std::string port_s = std::to_string(port);

  if (const int rc = ::getaddrinfo(host.c_str(), port_s.c_str(), &hints, &res); rc != 0) {
    throw gai_error_to_exception(rc, "getaddrinfo", host, port);
  }

  UniqueFd sock;
  int saved_errno = EHOSTUNREACH;
  for (addrinfo *rp = res; rp != nullptr; rp = rp->ai_next) {
    UniqueFd fd{::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol)};
    if (!fd) {
      saved_errno = errno;
      continue;
    }
    const int one = 1;
    ::setsockopt(fd.get(), IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
    if (::connect(fd.get(), rp->ai_addr, rp->ai_addrlen) == 0) {
      sock = std::move(fd);
      break;
    }
    // try next addr; if none succeed, we throw below with the last errno
    saved_errno = errno;
  }
  ::freeaddrinfo(res);

  if (!sock) {
    throw std::system_error(saved_errno, std::generic_category(),
                            "connect to " + host + ":" + port_s);
  }
  return std::make_unique<SocketConnection>(std::move(sock));
}

auto spawn_process(const std::vector<std::string> &argv) -> ConnectionPtr {
  if (argv.empty()) {
    throw std::invalid_argument("spawn_process: empty argv");
  }

  int in_pipe[2];  // parent -> child stdin
  int out_pipe[2]; // child stdout -> parent
  if (::pipe(in_pipe) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe");
  }
  UniqueFd in_r{in_pipe[0]};
  UniqueFd in_w{in_pipe[1]};
  if (::pipe(out_pipe) != 0) {
    throw std::system_error(errno, std::generic_category(), "pipe");
  }
  UniqueFd out_r{out_pipe[0]};
  UniqueFd out_w{out_pipe[1]};

  std::vector<char *> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto &a : argv) {
    cargv.push_back(const_cast<char *>(a.c_str()));
  }
  cargv.push_back(nullptr);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw std::system_error(errno, std::generic_category(), "fork");
  }
  if (pid == 0) {
    ::dup2(in_r.get(), STDIN_FILENO);
    ::dup2(out_w.get(), STDOUT_FILENO);
    ::close(in_r.get());
    ::close(in_w.get());
    ::close(out_r.get());
    ::close(out_w.get());
    ::execvp(cargv[0], cargv.data());
    ::_exit(127);
  }

  in_r.reset();
  out_w.reset();
  return std::make_unique<ProcessConnection>(pid, std::move(in_w), std::move(out_r));
}

auto SubprocessSshVendor::connect_ssh(const std::string &host,
                                      const std::vector<std::string> &command,
                                      const std::optional<std::string> &username,
                                      std::optional<int> port) -> ConnectionPtr {
  // "ssh -i key" style commands carry their own arguments
  std::vector<std::string> args;
  std::istringstream words(program_);
  for (std::string w; words >> w;) {
    args.push_back(w);
  }
  if (args.empty()) {
    throw std::invalid_argument("empty ssh command");
  }
  args.emplace_back("-x");
  if (port) {
    args.emplace_back("-p");
    args.push_back(std::to_string(*port));
  }
  args.push_back(username ? *username + "@" + host : host);
  args.insert(args.end(), command.begin(), command.end());
  return spawn_process(args);
}

auto BufferConnection::read(std::uint8_t *dst, std::size_t n) -> std::size_t {
  const std::size_t take = std::min(n, input_.size() - pos_);
  std::memcpy(dst, input_.data() + pos_, take);
  pos_ += take;
  return take;
}

void BufferConnection::write(std::span<const std::uint8_t> data) {
  output_.append(reinterpret_cast<const char *>(data.data()), data.size());
}

} // namespace gitwire
