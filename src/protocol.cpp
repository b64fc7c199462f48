#include "gitwire/protocol.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"

#include <array>
#include <cstdio>
#include <stdexcept>
#include <string>

namespace gitwire {

auto parse_pkt_len(std::string_view prefix) -> std::size_t {
  if (prefix.size() != consts::kPktLenSize) {
    throw ProtocolError("packet length prefix must be 4 bytes");
  }
  std::size_t len = 0;
  for (const char c : prefix) {
    int v = -1;
    if (c >= '0' && c <= '9') {
      v = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      v = 10 + (c - 'a');
    } else if (c >= 'A' && c <= 'F') {
      v = 10 + (c - 'A');
    }
    if (v < 0) {
      throw ProtocolError("invalid packet length prefix: " + std::string(prefix));
    }
    len = (len << 4U) | static_cast<std::size_t>(v);
  }
  if (len != 0 && len < consts::kPktLenSize) {
    throw ProtocolError("invalid packet length " + std::to_string(len));
  }
  return len;
}

auto pkt_line(const Packet &data) -> std::string {
  if (!data) {
    return "0000";
  }
  if (data->size() > consts::kMaxPktPayload) {
    throw std::length_error("packet payload exceeds " + std::to_string(consts::kMaxPktPayload) +
                            " bytes");
  }
  std::array<char, 5> prefix{};
  std::snprintf(prefix.data(), prefix.size(), "%04zx", data->size() + consts::kPktLenSize);
  std::string out(prefix.data(), consts::kPktLenSize);
  out.append(*data);
  return out;
}

void Protocol::read_exact(char *dst, std::size_t n) {
  std::size_t got = 0;
  while (got < n) {
    const std::size_t r = conn_.read(reinterpret_cast<std::uint8_t *>(dst) + got, n - got);
    if (r == 0) {
      throw ProtocolError("unexpected end of stream: wanted " + std::to_string(n) + " bytes, got " +
                          std::to_string(got));
    }
    got += r;
  }
}

auto Protocol::read_pkt_line() -> Packet {
  std::array<char, consts::kPktLenSize> prefix{};
  read_exact(prefix.data(), prefix.size());
  const std::size_t len = parse_pkt_len(std::string_view(prefix.data(), prefix.size()));
  if (len == 0) {
    return std::nullopt;
  }
  std::string payload(len - consts::kPktLenSize, '\0');
  if (!payload.empty()) {
    read_exact(payload.data(), payload.size());
  }
  return payload;
}

auto Protocol::read_pkt_seq() -> PktSeq { return PktSeq{*this}; }

void Protocol::write_pkt_line(const Packet &data) { write(pkt_line(data)); }

void Protocol::write_pkt_seq(const std::vector<std::string> &pkts) {
  for (const auto &p : pkts) {
    write_pkt_line(p);
  }
  write_pkt_line(std::nullopt);
}

void Protocol::send_cmd(std::string_view cmd, const std::vector<std::string> &args) {
  std::string line(cmd);
  line.push_back(consts::kSpace);
  for (const auto &a : args) {
    line.append(a);
    line.push_back(consts::kNul);
  }
  write_pkt_line(line);
}

auto Protocol::read(std::size_t n) -> std::string {
  std::string buf(n, '\0');
  const std::size_t r = conn_.read(reinterpret_cast<std::uint8_t *>(buf.data()), n);
  buf.resize(r);
  return buf;
}

void PktLineParser::parse(std::string_view data) {
  buf_.append(data);
  for (;;) {
    if (buf_.size() < consts::kPktLenSize) {
      return;
    }
    const std::size_t len = parse_pkt_len(std::string_view(buf_).substr(0, consts::kPktLenSize));
    if (len == 0) {
      buf_.erase(0, consts::kPktLenSize);
      handle_pkt_(std::nullopt);
      continue;
    }
    if (buf_.size() < len) {
      return;
    }
    std::string pkt = buf_.substr(consts::kPktLenSize, len - consts::kPktLenSize);
    buf_.erase(0, len);
    handle_pkt_(pkt);
  }
}

auto parse_sideband(std::string_view pkt) -> std::pair<SideBand, std::string_view> {
  if (pkt.empty()) {
    throw ProtocolError("empty sideband packet");
  }
  const auto channel = static_cast<std::uint8_t>(pkt.front());
  switch (channel) {
  case static_cast<std::uint8_t>(SideBand::Data):
  case static_cast<std::uint8_t>(SideBand::Progress):
  case static_cast<std::uint8_t>(SideBand::Fatal):
    return {static_cast<SideBand>(channel), pkt.substr(1)};
  default:
    throw ProtocolError("invalid sideband channel " + std::to_string(channel));
  }
}

void read_sideband(Protocol &proto, const SideBandHandlers &handlers) {
  for (const auto &pkt : proto.read_pkt_seq()) {
    const auto [channel, payload] = parse_sideband(pkt);
    switch (channel) {
    case SideBand::Data:
      if (handlers.data) {
        handlers.data(payload);
      }
      break;
    case SideBand::Progress:
      if (handlers.progress) {
        handlers.progress(payload);
      }
      break;
    case SideBand::Fatal:
      throw ProtocolError("remote error: " + std::string(payload));
    }
  }
}

} // namespace gitwire
