#pragma once
#include "gitwire/transport.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gitwire {

// Packet payloads are raw bytes; std::string is only the container.
using Packet = std::optional<std::string>; // nullopt = flush-pkt

// Encode a single packet (or flush) to its wire form.
auto pkt_line(const Packet &data) -> std::string;

// Sideband channels of side-band-64k.
enum class SideBand : std::uint8_t { Data = 1, Progress = 2, Fatal = 3 };

// Receives a chunk of bytes (pack data, progress text, ...).
using DataHandler = std::function<void(std::string_view)>;

/**
 * Packet-line framing over a Connection. The protocol object does not own the
 * connection and performs no read-ahead, so the connection's can_read()
 * reflects exactly what is still unread.
 */
class Protocol {
public:
  explicit Protocol(Connection &conn) : conn_(conn) {}

  // Next packet; nullopt on flush. Throws ProtocolError on bad framing or EOF.
  auto read_pkt_line() -> Packet;

  class PktSeq;
  // Packets up to (not including) the next flush. Single pass.
  auto read_pkt_seq() -> PktSeq;

  void write_pkt_line(const Packet &data);
  void write_pkt_seq(const std::vector<std::string> &pkts);

  // git-daemon style request: "<cmd> <arg0>\0<arg1>\0..."
  void send_cmd(std::string_view cmd, const std::vector<std::string> &args);

  // Raw, unframed access for pack streams.
  auto read(std::size_t n) -> std::string;
  void write(std::span<const std::uint8_t> data) { conn_.write(data); }
  void write(std::string_view data) {
    conn_.write(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(data.data()),
                                              data.size()));
  }

  [[nodiscard]] auto can_read() -> bool { return conn_.can_read(); }
  [[nodiscard]] auto connection() -> Connection & { return conn_; }

private:
  void read_exact(char *dst, std::size_t n);

  Connection &conn_;
};

class Protocol::PktSeq {
public:
  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::string;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::string *;
    using reference = const std::string &;

    iterator() = default;
    explicit iterator(PktSeq *seq) : seq_(seq) {}

    auto operator*() const -> reference { return *seq_->current_; }
    auto operator->() const -> pointer { return &*seq_->current_; }
    auto operator++() -> iterator & {
      seq_->advance();
      return *this;
    }
    void operator++(int) { seq_->advance(); }
    auto operator==(const iterator &other) const -> bool { return done() == other.done(); }

  private:
    [[nodiscard]] auto done() const -> bool { return seq_ == nullptr || !seq_->current_; }
    PktSeq *seq_{nullptr};
  };

  explicit PktSeq(Protocol &proto) : proto_(proto) {}

  auto begin() -> iterator {
    if (!started_) {
      started_ = true;
      advance();
    }
    return iterator{this};
  }
  auto end() -> iterator { return iterator{}; }

private:
  void advance() { current_ = proto_.read_pkt_line(); }

  Protocol &proto_;
  bool started_{false};
  Packet current_;
};

/**
 * Incremental packet-line parser for data that arrives in arbitrary chunks,
 * e.g. report-status carried inside sideband channel 1.
 */
class PktLineParser {
public:
  explicit PktLineParser(std::function<void(const Packet &)> handle_pkt)
      : handle_pkt_(std::move(handle_pkt)) {}

  void parse(std::string_view data);

  // Bytes received that do not yet form a complete packet.
  [[nodiscard]] auto pending() const -> std::string_view { return buf_; }

private:
  std::function<void(const Packet &)> handle_pkt_;
  std::string buf_;
};

// Empty handlers discard their channel's data.
struct SideBandHandlers {
  DataHandler data;
  DataHandler progress;
};

// Split a sideband packet into its channel and payload. Unknown channel or an
// empty packet is a ProtocolError.
auto parse_sideband(std::string_view pkt) -> std::pair<SideBand, std::string_view>;

/**
 * Demultiplex side-band-64k packets until flush. Channel 3 aborts with a
 * ProtocolError carrying the remote message.
 */
void read_sideband(Protocol &proto, const SideBandHandlers &handlers);

// Parse the 4-byte hex length prefix. Throws ProtocolError when malformed.
auto parse_pkt_len(std::string_view prefix) -> std::size_t;

} // namespace gitwire
