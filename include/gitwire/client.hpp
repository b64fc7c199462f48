#pragma once
#include "gitwire/capabilities.hpp"
#include "gitwire/graph_walker.hpp"
#include "gitwire/hash.hpp"
#include "gitwire/objects.hpp"
#include "gitwire/protocol.hpp"
#include "gitwire/refs.hpp"
#include "gitwire/transport.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace gitwire {

class ObjectStore;

// Pick the ids to fetch from the advertised refs. Empty = fetch nothing.
using DetermineWants = std::function<std::vector<oid>(const RefMap &)>;
// Compute the refs the remote should end up with. nullopt = push nothing.
using DetermineNewRefs = std::function<std::optional<RefMap>(const RefMap &)>;
// Objects to upload given what the remote has and what it will need.
using GeneratePackContents =
    std::function<std::vector<Object>(const std::vector<oid> &have, const std::vector<oid> &want)>;

// Refs and server capabilities from a ref advertisement.
struct Advertisement {
  RefMap refs;
  std::vector<std::string> capabilities;
};

// Read "<hex> <ref>" packets up to flush. The first carries capabilities.
auto read_advertisement(Protocol &proto) -> Advertisement;

enum class FetchState : std::uint8_t {
  Advertised,       // refs known, nothing sent yet
  NegotiatingHaves, // wants sent, offering haves
  AwaitingAck,      // reading server acknowledgements
  StreamingPack,    // receiving pack data
  Done
};

/**
 * One upload-pack conversation after the advertisement. The head phase
 * (wants, haves, done) and the tail phase (final ACKs, pack stream) may run
 * over different connections, as they do over HTTP.
 */
class FetchNegotiation {
public:
  FetchNegotiation(CapabilitySet caps, GraphWalker &walker)
      : caps_(std::move(caps)), walker_(walker) {}

  // Write wants and haves, then "done". Reads ACKs between haves only when
  // proto.can_read() says a packet is waiting.
  void send_wants_and_haves(Protocol &proto, const std::vector<oid> &wants);

  // Read the final ACKs and the pack stream up to the end of the connection.
  void receive_pack(Protocol &proto, const DataHandler &pack_data, const DataHandler &progress);

  [[nodiscard]] auto state() const -> FetchState { return state_; }
  [[nodiscard]] auto capabilities() const -> const CapabilitySet & { return caps_; }

private:
  // Handle one head-phase packet. Returns true if negotiation may stop.
  auto handle_head_ack(const Packet &pkt) -> bool;

  CapabilitySet caps_;
  GraphWalker &walker_;
  FetchState state_{FetchState::Advertised};
};

// Have/want sets of a push, derived from old and new refs.
struct PushPlan {
  std::vector<oid> have;
  std::vector<oid> want;
};

// Write the ref update commands and flush.
auto send_pack_head(Protocol &proto, const CapabilitySet &caps, const RefMap &old_refs,
                    const RefMap &new_refs) -> PushPlan;

// Read report-status (raw or inside sideband) and raise on failure.
void receive_pack_tail(Protocol &proto, const CapabilitySet &caps, const DataHandler &progress);

// Fail with a ProtocolError if anything is left on the connection.
void expect_eof(Protocol &proto);

/**
 * Client side of git's smart protocol. Subclasses choose how to reach the
 * upload-pack and receive-pack services.
 */
class GitClient {
public:
  explicit GitClient(bool thin_packs = true);
  virtual ~GitClient() = default;

  GitClient(const GitClient &) = delete;
  auto operator=(const GitClient &) -> GitClient & = delete;

  /**
   * Fetch the objects selected by `determine_wants` from `path`, feeding the
   * pack bytes to `pack_data`. Returns the advertised refs.
   */
  virtual auto fetch_pack(const std::string &path, const DetermineWants &determine_wants,
                          GraphWalker &walker, const DataHandler &pack_data,
                          const DataHandler &progress = {}) -> RefMap = 0;

  /**
   * Update refs on `path`, uploading the objects `generate_pack_contents`
   * returns. Returns the refs the remote now has.
   */
  virtual auto send_pack(const std::string &path, const DetermineNewRefs &determine_new_refs,
                         const GeneratePackContents &generate_pack_contents,
                         const DataHandler &progress = {}) -> RefMap = 0;

  // Fetch into `target`. Wants default to every advertised ref it lacks.
  auto fetch(const std::string &path, ObjectStore &target,
             const DetermineWants &determine_wants = {}, const DataHandler &progress = {})
      -> RefMap;

  // Advertised refs only.
  auto get_refs(const std::string &path) -> RefMap;

  [[nodiscard]] auto fetch_capabilities() const -> const std::vector<std::string> & {
    return fetch_capabilities_;
  }
  [[nodiscard]] auto send_capabilities() const -> const std::vector<std::string> & {
    return send_capabilities_;
  }

protected:
  std::vector<std::string> fetch_capabilities_;
  std::vector<std::string> send_capabilities_;
};

// A client that holds one duplex connection for the whole conversation.
class TraditionalGitClient : public GitClient {
public:
  using GitClient::GitClient;

  auto fetch_pack(const std::string &path, const DetermineWants &determine_wants,
                  GraphWalker &walker, const DataHandler &pack_data,
                  const DataHandler &progress = {}) -> RefMap override;

  auto send_pack(const std::string &path, const DetermineNewRefs &determine_new_refs,
                 const GeneratePackContents &generate_pack_contents,
                 const DataHandler &progress = {}) -> RefMap override;

protected:
  // Start git-<service> for `path`. The advertisement is the next thing to read.
  virtual auto connect(std::string_view service, const std::string &path) -> ConnectionPtr = 0;
};

// git:// daemon.
class TcpGitClient : public TraditionalGitClient {
public:
  TcpGitClient(std::string host, std::optional<int> port = std::nullopt, bool thin_packs = true);

  [[nodiscard]] auto host() const -> const std::string & { return host_; }
  [[nodiscard]] auto port() const -> int { return port_; }

protected:
  auto connect(std::string_view service, const std::string &path) -> ConnectionPtr override;

private:
  std::string host_;
  int port_;
};

// Local repository through a `git <service>` child process.
class SubprocessGitClient : public TraditionalGitClient {
public:
  using TraditionalGitClient::TraditionalGitClient;

protected:
  auto connect(std::string_view service, const std::string &path) -> ConnectionPtr override;
};

class SshGitClient : public TraditionalGitClient {
public:
  SshGitClient(std::string host, std::optional<int> port, std::optional<std::string> username,
               std::shared_ptr<SshVendor> vendor, bool thin_packs = true);

  [[nodiscard]] auto host() const -> const std::string & { return host_; }
  [[nodiscard]] auto port() const -> std::optional<int> { return port_; }
  [[nodiscard]] auto username() const -> const std::optional<std::string> & { return username_; }

protected:
  auto connect(std::string_view service, const std::string &path) -> ConnectionPtr override;

private:
  std::string host_;
  std::optional<int> port_;
  std::optional<std::string> username_;
  std::shared_ptr<SshVendor> vendor_;
};

struct HttpRequest {
  std::string url;
  std::optional<std::string> content_type; // set for POST
  std::string body;
};

struct HttpResponse {
  long status{0};
  std::string content_type;
  std::string body;
};

/**
 * Smart HTTP. Every exchange is one request/response pair, so haves are sent
 * without waiting for ACKs.
 */
class HttpGitClient : public GitClient {
public:
  explicit HttpGitClient(std::string base_url, bool thin_packs = true);

  auto fetch_pack(const std::string &path, const DetermineWants &determine_wants,
                  GraphWalker &walker, const DataHandler &pack_data,
                  const DataHandler &progress = {}) -> RefMap override;

  auto send_pack(const std::string &path, const DetermineNewRefs &determine_new_refs,
                 const GeneratePackContents &generate_pack_contents,
                 const DataHandler &progress = {}) -> RefMap override;

  [[nodiscard]] auto base_url() const -> const std::string & { return base_url_; }

  // Repository URL for `path`, with a trailing slash.
  [[nodiscard]] auto get_url(const std::string &path) const -> std::string;

protected:
  // Perform one request (GET when content_type is unset). Throws on transport failure.
  virtual auto perform(const HttpRequest &request) -> HttpResponse;

private:
  auto discover_references(std::string_view service, const std::string &url) -> Advertisement;
  auto smart_request(std::string_view service, const std::string &url, std::string body)
      -> HttpResponse;

  std::string base_url_;
};

struct TransportOptions {
  bool thin_packs{true};
  std::shared_ptr<SshVendor> ssh_vendor; // null = SubprocessSshVendor
};

/**
 * Client and repository path for a URL, scp-style "host:path" or local path.
 * Throws std::invalid_argument for unsupported schemes.
 */
auto get_transport_and_path(const std::string &uri, const TransportOptions &options = {})
    -> std::pair<std::unique_ptr<GitClient>, std::string>;

} // namespace gitwire
