#pragma once
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gitwire {

// Split "<ref>\0<cap> <cap>..." into the ref name and its capabilities.
auto extract_capabilities(std::string_view text)
    -> std::pair<std::string, std::vector<std::string>>;

/**
 * Capabilities agreed for one conversation. Built once from the client's
 * offer and the server's advertisement; read-only afterwards.
 */
class CapabilitySet {
public:
  CapabilitySet() = default;
  explicit CapabilitySet(std::vector<std::string> caps) : caps_(std::move(caps)) {}

  // The offered capabilities the server also advertised, in offer order.
  static auto negotiate(const std::vector<std::string> &offered,
                        const std::vector<std::string> &advertised) -> CapabilitySet;

  [[nodiscard]] auto has(std::string_view cap) const -> bool;
  [[nodiscard]] auto list() const -> const std::vector<std::string> & { return caps_; }
  [[nodiscard]] auto empty() const -> bool { return caps_.empty(); }

  // Space-separated wire form.
  [[nodiscard]] auto joined() const -> std::string;

private:
  std::vector<std::string> caps_;
};

// What the client offers by default.
auto default_fetch_capabilities(bool thin_packs) -> std::vector<std::string>;
auto default_send_capabilities() -> std::vector<std::string>;

} // namespace gitwire
