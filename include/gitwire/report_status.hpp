#pragma once
#include "gitwire/protocol.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gitwire {

/**
 * Collects the status report a server sends after receive-pack when the
 * report-status capability is in use: one "unpack ..." line, then one line per
 * ref, then flush.
 */
class ReportStatusParser {
public:
  // Throws ProtocolError for any packet after the terminating flush.
  void handle_packet(const Packet &pkt);

  // Throws SendPackError if unpacking failed, UpdateRefsError if any ref was
  // refused. Returns normally otherwise.
  void check() const;

  [[nodiscard]] auto done() const -> bool { return done_; }
  [[nodiscard]] auto pack_status() const -> const std::optional<std::string> & {
    return pack_status_;
  }
  [[nodiscard]] auto ref_statuses() const -> const std::vector<std::string> & {
    return ref_statuses_;
  }

private:
  bool done_{false};
  std::optional<std::string> pack_status_;
  bool ref_status_ok_{true};
  std::vector<std::string> ref_statuses_;
};

} // namespace gitwire
