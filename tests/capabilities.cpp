#include "gitwire/capabilities.hpp"

#include "test_util.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace std::string_literals;
using gitwire::CapabilitySet;

int main() {
  try {
    {
      const auto [ref, caps] =
          gitwire::extract_capabilities("HEAD\0multi_ack thin-pack side-band-64k agent=git/2.40"s);
      check(ref == "HEAD", "ref name before NUL");
      check((caps == std::vector<std::string>{"multi_ack", "thin-pack", "side-band-64k",
                                               "agent=git/2.40"}),
            "caps split on spaces, unknown tokens kept");
    }
    {
      const auto [ref, caps] = gitwire::extract_capabilities("refs/heads/master");
      check(ref == "refs/heads/master" && caps.empty(), "no NUL, no caps");
    }
    {
      const auto [ref, caps] = gitwire::extract_capabilities("HEAD\0"s);
      check(ref == "HEAD" && caps.empty(), "empty cap list");
    }

    // Offered capabilities restricted to the server's
    {
      const auto caps = CapabilitySet::negotiate(gitwire::default_send_capabilities(),
                                                 {"delete-refs", "side-band-64k", "ofs-delta"});
      check((caps.list() == std::vector<std::string>{"ofs-delta", "side-band-64k"}),
            "report-status dropped, offer order kept");
      check(!caps.has("report-status") && caps.has("ofs-delta"), "has()");
      check(caps.joined() == "ofs-delta side-band-64k", "joined");
    }
    {
      const auto caps = CapabilitySet::negotiate(gitwire::default_fetch_capabilities(true), {});
      check(caps.empty() && caps.joined().empty(), "nothing advertised");
    }

    const auto thin = gitwire::default_fetch_capabilities(true);
    const auto thick = gitwire::default_fetch_capabilities(false);
    check(CapabilitySet(thin).has("thin-pack"), "thin-pack offered");
    check(!CapabilitySet(thick).has("thin-pack"), "thin-pack withheld");
    check(CapabilitySet(thick).has("side-band-64k") && CapabilitySet(thick).has("multi_ack"),
          "fetch defaults");

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
