#include "gitwire/client.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"
#include "gitwire/object_store.hpp"
#include "gitwire/pack.hpp"
#include "gitwire/report_status.hpp"

#include <charconv>
#include <exception>
#include <set>
#include <stdexcept>

namespace gitwire {

namespace {

auto strip_lf(std::string_view line) -> std::string_view {
  if (line.ends_with(consts::kLF)) {
    line.remove_suffix(1);
  }
  return line;
}

auto split_words(std::string_view line) -> std::vector<std::string_view> {
  std::vector<std::string_view> words;
  while (!line.empty()) {
    const auto sp = line.find(consts::kSpace);
    words.push_back(line.substr(0, sp));
    if (sp == std::string_view::npos) {
      break;
    }
    line.remove_prefix(sp + 1);
  }
  return words;
}

auto parse_oid(std::string_view hex, std::string_view context) -> oid {
  oid id{};
  if (!from_hex(hex, id)) {
    throw ProtocolError("invalid object id in " + std::string(context) + ": " + std::string(hex));
  }
  return id;
}

auto is_ack_continue(std::string_view status) -> bool {
  return status == "continue" || status == "common";
}

constexpr std::string_view kPeeledSuffix = "^{}";

auto service_name(std::string_view service) -> std::string { return "git-" + std::string(service); }

} // namespace

auto read_advertisement(Protocol &proto) -> Advertisement {
  Advertisement adv;
  bool first = true;
  for (const auto &pkt : proto.read_pkt_seq()) {
    const std::string_view line = strip_lf(pkt);
    if (line.starts_with(consts::kTokErr) && line.size() > consts::kTokErr.size() &&
        line[consts::kTokErr.size()] == consts::kSpace) {
      throw ProtocolError(std::string(line.substr(consts::kTokErr.size() + 1)));
    }
    const auto sp = line.find(consts::kSpace);
    if (sp == std::string_view::npos) {
      throw ProtocolError("invalid ref advertisement: " + std::string(line));
    }
    const oid id = parse_oid(line.substr(0, sp), "ref advertisement");
    std::string ref(line.substr(sp + 1));
    if (first) {
      auto [name, caps] = extract_capabilities(ref);
      ref = std::move(name);
      adv.capabilities = std::move(caps);
      first = false;
    }
    // Peeled tags are advertised as "<tag>^{}"
    const std::string_view base =
        std::string_view(ref).ends_with(kPeeledSuffix)
            ? std::string_view(ref).substr(0, ref.size() - kPeeledSuffix.size())
            : std::string_view(ref);
    if (!is_valid_ref_name(base)) {
      throw ProtocolError("invalid ref name in advertisement: " + ref);
    }
    adv.refs[ref] = id;
  }
  return adv;
}

// Fetch

auto FetchNegotiation::handle_head_ack(const Packet &pkt) -> bool {
  if (!pkt) {
    return false;
  }
  const auto words = split_words(strip_lf(*pkt));
  if (words.empty() || words[0] != consts::kTokAck) {
    return false; // NAK or chatter
  }
  if (words.size() < 2) {
    throw ProtocolError("ACK without object id");
  }
  const oid id = parse_oid(words[1], "ACK");
  if (words.size() == 2) {
    walker_.ack(id);
    return true;
  }
  if (is_ack_continue(words[2])) {
    walker_.ack(id);
    return false;
  }
  if (words[2] == "ready") {
    walker_.ack(id);
    return true;
  }
  throw ProtocolError("invalid ACK status: " + std::string(words[2]));
}

void FetchNegotiation::send_wants_and_haves(Protocol &proto, const std::vector<oid> &wants) {
  if (state_ != FetchState::Advertised) {
    throw std::logic_error("fetch negotiation already started");
  }
  if (wants.empty()) {
    throw std::invalid_argument("fetch negotiation needs at least one want");
  }

  std::string first = std::string(consts::kTokWant) + to_hex(wants.front());
  if (!caps_.empty()) {
    first += consts::kSpace + caps_.joined();
  }
  first += consts::kLF;
  proto.write_pkt_line(first);
  for (std::size_t i = 1; i < wants.size(); ++i) {
    proto.write_pkt_line(std::string(consts::kTokWant) + to_hex(wants[i]) + consts::kLF);
  }
  proto.write_pkt_line(std::nullopt);

  state_ = FetchState::NegotiatingHaves;
  while (const auto have = walker_.next_have()) {
    proto.write_pkt_line(std::string(consts::kTokHave) + to_hex(*have) + consts::kLF);
    if (!proto.can_read()) {
      continue;
    }
    state_ = FetchState::AwaitingAck;
    const bool stop = handle_head_ack(proto.read_pkt_line());
    state_ = FetchState::NegotiatingHaves;
    if (stop) {
      break;
    }
  }

  proto.write_pkt_line(std::string(consts::kTokDone));
  state_ = FetchState::AwaitingAck;
}

void FetchNegotiation::receive_pack(Protocol &proto, const DataHandler &pack_data,
                                    const DataHandler &progress) {
  if (state_ != FetchState::AwaitingAck) {
    throw std::logic_error("pack requested before negotiation finished");
  }

  for (;;) {
    const Packet pkt = proto.read_pkt_line();
    if (!pkt) {
      break;
    }
    const auto words = split_words(strip_lf(*pkt));
    if (!words.empty() && words[0] == consts::kTokAck && words.size() >= 2) {
      walker_.ack(parse_oid(words[1], "ACK"));
    }
    if (words.size() < 3 || !(is_ack_continue(words[2]) || words[2] == "ready")) {
      break;
    }
  }

  state_ = FetchState::StreamingPack;
  if (caps_.has(consts::kCapSideBand64k)) {
    read_sideband(proto, SideBandHandlers{.data = pack_data, .progress = progress});
    expect_eof(proto);
  } else {
    for (;;) {
      const std::string chunk = proto.read(consts::kReadBufSize);
      if (chunk.empty()) {
        break;
      }
      if (pack_data) {
        pack_data(chunk);
      }
    }
  }
  state_ = FetchState::Done;
}

// Push

auto send_pack_head(Protocol &proto, const CapabilitySet &caps, const RefMap &old_refs,
                    const RefMap &new_refs) -> PushPlan {
  std::set<std::string> names;
  for (const auto &[name, id] : old_refs) {
    names.insert(name);
  }
  for (const auto &[name, id] : new_refs) {
    names.insert(name);
  }

  const auto lookup = [](const RefMap &refs, const std::string &name) -> oid {
    const auto it = refs.find(name);
    return it == refs.end() ? kZeroOid : it->second;
  };

  bool sent_capabilities = false;
  for (const auto &name : names) {
    const oid old_id = lookup(old_refs, name);
    const oid new_id = lookup(new_refs, name);
    if (old_id == new_id) {
      continue;
    }
    std::string line = to_hex(old_id) + consts::kSpace + to_hex(new_id) + consts::kSpace + name;
    if (!sent_capabilities) {
      line += consts::kNul + caps.joined();
      sent_capabilities = true;
    }
    proto.write_pkt_line(line);
  }
  proto.write_pkt_line(std::nullopt);

  std::set<oid> have;
  for (const auto &[name, id] : old_refs) {
    if (id != kZeroOid) {
      have.insert(id);
    }
  }
  std::set<oid> want;
  for (const auto &[name, id] : new_refs) {
    if (id != kZeroOid && !have.contains(id)) {
      want.insert(id);
    }
  }
  return PushPlan{.have = {have.begin(), have.end()}, .want = {want.begin(), want.end()}};
}

void receive_pack_tail(Protocol &proto, const CapabilitySet &caps, const DataHandler &progress) {
  std::optional<ReportStatusParser> report;
  if (caps.has(consts::kCapReportStatus)) {
    report.emplace();
  }

  if (caps.has(consts::kCapSideBand64k)) {
    PktLineParser parser([&report](const Packet &pkt) {
      if (report) {
        report->handle_packet(pkt);
      }
    });
    read_sideband(proto, SideBandHandlers{
                             .data = [&parser](std::string_view data) { parser.parse(data); },
                             .progress = progress});
  } else if (report) {
    for (const auto &pkt : proto.read_pkt_seq()) {
      report->handle_packet(pkt);
    }
    report->handle_packet(std::nullopt);
  }

  if (report) {
    report->check();
  }
  expect_eof(proto);
}

void expect_eof(Protocol &proto) {
  const std::string rest = proto.read(consts::kReadBufSize);
  if (!rest.empty()) {
    throw ProtocolError("unexpected data after end of response (" + std::to_string(rest.size()) +
                        " bytes)");
  }
}

// GitClient

GitClient::GitClient(bool thin_packs)
    : fetch_capabilities_(default_fetch_capabilities(thin_packs)),
      send_capabilities_(default_send_capabilities()) {}

auto GitClient::fetch(const std::string &path, ObjectStore &target,
                      const DetermineWants &determine_wants, const DataHandler &progress)
    -> RefMap {
  const DetermineWants wants =
      determine_wants ? determine_wants
                      : [&target](const RefMap &refs) { return target.determine_wants_all(refs); };
  const auto walker = target.graph_walker(target.local_heads());

  PackTarget pack = target.add_pack();
  RefMap refs;
  try {
    refs = fetch_pack(path, wants, *walker, pack.write, progress);
  } catch (...) {
    // Report the transfer failure, not the partial pack it left behind.
    const std::exception_ptr transfer_error = std::current_exception();
    try {
      pack.commit();
    } catch (const std::exception &) {
      std::rethrow_exception(transfer_error);
    }
    throw;
  }
  pack.commit();
  return refs;
}

auto GitClient::get_refs(const std::string &path) -> RefMap {
  EmptyGraphWalker walker;
  return fetch_pack(
      path, [](const RefMap &) { return std::vector<oid>{}; }, walker, {});
}

// TraditionalGitClient

auto TraditionalGitClient::fetch_pack(const std::string &path,
                                      const DetermineWants &determine_wants, GraphWalker &walker,
                                      const DataHandler &pack_data, const DataHandler &progress)
    -> RefMap {
  const ConnectionPtr conn = connect(consts::kUploadPack, path);
  Protocol proto(*conn);
  Advertisement adv = read_advertisement(proto);

  FetchNegotiation negotiation(CapabilitySet::negotiate(fetch_capabilities_, adv.capabilities),
                               walker);
  const auto wants = determine_wants(adv.refs);
  if (wants.empty()) {
    proto.write_pkt_line(std::nullopt);
    return std::move(adv.refs);
  }
  negotiation.send_wants_and_haves(proto, wants);
  negotiation.receive_pack(proto, pack_data, progress);
  return std::move(adv.refs);
}

auto TraditionalGitClient::send_pack(const std::string &path,
                                     const DetermineNewRefs &determine_new_refs,
                                     const GeneratePackContents &generate_pack_contents,
                                     const DataHandler &progress) -> RefMap {
  const ConnectionPtr conn = connect(consts::kReceivePack, path);
  Protocol proto(*conn);
  Advertisement adv = read_advertisement(proto);
  const auto caps = CapabilitySet::negotiate(send_capabilities_, adv.capabilities);

  const auto new_refs = determine_new_refs(adv.refs);
  if (!new_refs) {
    proto.write_pkt_line(std::nullopt);
    return std::move(adv.refs);
  }

  const PushPlan plan = send_pack_head(proto, caps, adv.refs, *new_refs);
  if (plan.want.empty() && adv.refs == *new_refs) {
    return *new_refs;
  }

  const auto objects = generate_pack_contents(plan.have, plan.want);
  if (!objects.empty()) {
    write_pack_objects([&proto](std::span<const std::uint8_t> data) { proto.write(data); },
                       objects);
  }
  receive_pack_tail(proto, caps, progress);
  return *new_refs;
}

// Concrete transports

TcpGitClient::TcpGitClient(std::string host, std::optional<int> port, bool thin_packs)
    : TraditionalGitClient(thin_packs), host_(std::move(host)),
      port_(port.value_or(consts::portNumber)) {}

auto TcpGitClient::connect(std::string_view service, const std::string &path) -> ConnectionPtr {
  ConnectionPtr conn = connect_tcp(host_, port_);
  Protocol proto(*conn);
  proto.send_cmd(service_name(service), {path, "host=" + host_});
  return conn;
}

auto SubprocessGitClient::connect(std::string_view service, const std::string &path)
    -> ConnectionPtr {
  return spawn_process({"git", std::string(service), path});
}

SshGitClient::SshGitClient(std::string host, std::optional<int> port,
                           std::optional<std::string> username, std::shared_ptr<SshVendor> vendor,
                           bool thin_packs)
    : TraditionalGitClient(thin_packs), host_(std::move(host)), port_(port),
      username_(std::move(username)), vendor_(std::move(vendor)) {
  if (!vendor_) {
    vendor_ = std::make_shared<SubprocessSshVendor>();
  }
}

auto SshGitClient::connect(std::string_view service, const std::string &path) -> ConnectionPtr {
  return vendor_->connect_ssh(host_, {service_name(service) + " '" + path + "'"}, username_,
                              port_);
}

// Transport selection

namespace {

auto parse_port(std::string_view text, std::string_view uri) -> int {
  int port = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
  if (ec != std::errc{} || ptr != text.data() + text.size() || port <= 0 || port > 65535) {
    throw std::invalid_argument("invalid port in " + std::string(uri));
  }
  return port;
}

struct NetLoc {
  std::optional<std::string> username;
  std::string host;
  std::optional<int> port;
};

// "[user@]host[:port]"
auto parse_netloc(std::string_view netloc, std::string_view uri) -> NetLoc {
  NetLoc out;
  if (const auto at = netloc.rfind('@'); at != std::string_view::npos) {
    out.username = std::string(netloc.substr(0, at));
    netloc.remove_prefix(at + 1);
  }
  if (const auto colon = netloc.rfind(':'); colon != std::string_view::npos) {
    out.port = parse_port(netloc.substr(colon + 1), uri);
    netloc = netloc.substr(0, colon);
  }
  if (netloc.empty()) {
    throw std::invalid_argument("missing host in " + std::string(uri));
  }
  out.host = std::string(netloc);
  return out;
}

// "/~user/repo" names a home directory, not an absolute path.
auto home_relative(std::string path) -> std::string {
  if (path.starts_with("/~")) {
    path.erase(0, 1);
  }
  return path;
}

} // namespace

auto get_transport_and_path(const std::string &uri, const TransportOptions &options)
    -> std::pair<std::unique_ptr<GitClient>, std::string> {
  const auto vendor =
      options.ssh_vendor ? options.ssh_vendor : std::make_shared<SubprocessSshVendor>();

  if (const auto sep = uri.find("://"); sep != std::string::npos) {
    const std::string scheme = uri.substr(0, sep);
    const std::string rest = uri.substr(sep + 3);
    const auto slash = rest.find('/');
    const std::string netloc = rest.substr(0, slash);
    const std::string path = slash == std::string::npos ? std::string{} : rest.substr(slash);

    if (scheme == "git") {
      const NetLoc loc = parse_netloc(netloc, uri);
      return {std::make_unique<TcpGitClient>(loc.host, loc.port, options.thin_packs),
              home_relative(path)};
    }
    if (scheme == "git+ssh" || scheme == "ssh") {
      const NetLoc loc = parse_netloc(netloc, uri);
      return {std::make_unique<SshGitClient>(loc.host, loc.port, loc.username, vendor,
                                             options.thin_packs),
              home_relative(path)};
    }
    if (scheme == "http" || scheme == "https") {
      return {std::make_unique<HttpGitClient>(scheme + "://" + netloc, options.thin_packs),
              path};
    }
    throw std::invalid_argument("unknown scheme '" + scheme + "'");
  }

  // scp-style "[user@]host:path"; a slash before the colon makes it a local path
  const auto colon = uri.find(':');
  if (colon != std::string::npos && colon > 0 && uri.find('/') > colon) {
    std::string host = uri.substr(0, colon);
    std::optional<std::string> username;
    if (const auto at = host.find('@'); at != std::string::npos) {
      username = host.substr(0, at);
      host.erase(0, at + 1);
    }
    return {std::make_unique<SshGitClient>(std::move(host), std::nullopt, std::move(username),
                                           vendor, options.thin_packs),
            uri.substr(colon + 1)};
  }

  return {std::make_unique<SubprocessGitClient>(options.thin_packs), uri};
}

} // namespace gitwire
