#include "gitwire/capabilities.hpp"

#include "gitwire/consts.hpp"

#include <algorithm>
#include <iterator>

namespace gitwire {

auto extract_capabilities(std::string_view text)
    -> std::pair<std::string, std::vector<std::string>> {
  const auto nul = text.find(consts::kNul);
  if (nul == std::string_view::npos) {
    return {std::string(text), {}};
  }
  std::vector<std::string> caps;
  std::string_view rest = text.substr(nul + 1);
  while (!rest.empty()) {
    const auto sp = rest.find(consts::kSpace);
    const auto tok = rest.substr(0, sp);
    if (!tok.empty()) {
      caps.emplace_back(tok);
    }
    if (sp == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(sp + 1);
  }
  return {std::string(text.substr(0, nul)), std::move(caps)};
}

auto CapabilitySet::negotiate(const std::vector<std::string> &offered,
                              const std::vector<std::string> &advertised) -> CapabilitySet {
  std::vector<std::string> out;
  std::ranges::copy_if(offered, std::back_inserter(out), [&](const std::string &c) {
    return std::ranges::find(advertised, c) != advertised.end();
  });
  return CapabilitySet{std::move(out)};
}

auto CapabilitySet::has(std::string_view cap) const -> bool {
  return std::ranges::find(caps_, cap) != caps_.end();
}

auto CapabilitySet::joined() const -> std::string {
  std::string s;
  for (const auto &c : caps_) {
    if (!s.empty()) {
      s.push_back(consts::kSpace);
    }
    s.append(c);
  }
  return s;
}

auto default_fetch_capabilities(bool thin_packs) -> std::vector<std::string> {
  std::vector<std::string> caps{std::string(consts::kCapMultiAck),
                                std::string(consts::kCapMultiAckDetailed),
                                std::string(consts::kCapOfsDelta),
                                std::string(consts::kCapSideBand64k)};
  if (thin_packs) {
    caps.emplace_back(consts::kCapThinPack);
  }
  return caps;
}

auto default_send_capabilities() -> std::vector<std::string> {
  return {std::string(consts::kCapReportStatus), std::string(consts::kCapOfsDelta),
          std::string(consts::kCapSideBand64k)};
}

} // namespace gitwire
