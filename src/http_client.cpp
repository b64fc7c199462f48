#include "gitwire/client.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"
#include "gitwire/pack.hpp"

#include <curl/curl.h>

#include <memory>
#include <stdexcept>

namespace gitwire {

namespace {

struct CurlGlobal {
  CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobal() { curl_global_cleanup(); }
  CurlGlobal(const CurlGlobal &) = delete;
  auto operator=(const CurlGlobal &) -> CurlGlobal & = delete;
};

struct CurlDeleter {
  void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

auto collect_body(char *data, std::size_t size, std::size_t nmemb, void *userdata) -> std::size_t {
  static_cast<std::string *>(userdata)->append(data, size * nmemb);
  return size * nmemb;
}

void check_status(const HttpResponse &resp, const std::string &url) {
  if (resp.status == 404) {
    throw NotGitRepository("not a git repository: " + url);
  }
  if (resp.status != 200) {
    throw ProtocolError("unexpected http response " + std::to_string(resp.status) + " for " + url);
  }
}

} // namespace

HttpGitClient::HttpGitClient(std::string base_url, bool thin_packs)
    : GitClient(thin_packs), base_url_(std::move(base_url)) {}

auto HttpGitClient::get_url(const std::string &path) const -> std::string {
  std::string url = base_url_;
  while (url.ends_with('/')) {
    url.pop_back();
  }
  if (!path.starts_with('/')) {
    url.push_back('/');
  }
  url += path;
  if (!url.ends_with('/')) {
    url.push_back('/');
  }
  return url;
}

auto HttpGitClient::perform(const HttpRequest &request) -> HttpResponse {
  static const CurlGlobal curl_global;

  const std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw std::runtime_error("curl_easy_init failed");
  }

  HttpResponse resp;
  std::unique_ptr<curl_slist, SlistDeleter> headers;
  curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "gitwire");
  curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collect_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &resp.body);
  if (request.content_type) {
    headers.reset(curl_slist_append(nullptr, ("Content-Type: " + *request.content_type).c_str()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(request.body.size()));
  }

  const CURLcode rc = curl_easy_perform(curl.get());
  if (rc != CURLE_OK) {
    throw std::runtime_error("http request to " + request.url +
                             " failed: " + curl_easy_strerror(rc));
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &resp.status);
  char *content_type = nullptr;
  curl_easy_getinfo(curl.get(), CURLINFO_CONTENT_TYPE, &content_type);
  if (content_type != nullptr) {
    resp.content_type = content_type;
  }
  return resp;
}

auto HttpGitClient::discover_references(std::string_view service, const std::string &url)
    -> Advertisement {
  const std::string refs_url = url + "info/refs?service=" + "git-" + std::string(service);
  HttpResponse resp = perform(HttpRequest{.url = refs_url, .content_type = std::nullopt, .body = {}});
  check_status(resp, refs_url);
  if (!resp.content_type.starts_with("application/x-git-")) {
    throw ProtocolError("dumb http servers are not supported: " + url);
  }

  BufferConnection conn(std::move(resp.body));
  Protocol proto(conn);
  const std::string marker = "# service=git-" + std::string(service) + consts::kLF;
  std::vector<std::string> head;
  for (const auto &pkt : proto.read_pkt_seq()) {
    head.push_back(pkt);
  }
  if (head.size() != 1 || head.front() != marker) {
    throw ProtocolError("unexpected first line from smart server: " +
                        (head.empty() ? std::string("<flush>") : head.front()));
  }
  return read_advertisement(proto);
}

auto HttpGitClient::smart_request(std::string_view service, const std::string &url,
                                  std::string body) -> HttpResponse {
  const std::string name = "git-" + std::string(service);
  const std::string post_url = url + name;
  HttpResponse resp = perform(HttpRequest{.url = post_url,
                                          .content_type = "application/x-" + name + "-request",
                                          .body = std::move(body)});
  check_status(resp, post_url);
  if (resp.content_type != "application/x-" + name + "-result") {
    throw ProtocolError("invalid content-type from server: " + resp.content_type);
  }
  return resp;
}

auto HttpGitClient::fetch_pack(const std::string &path, const DetermineWants &determine_wants,
                               GraphWalker &walker, const DataHandler &pack_data,
                               const DataHandler &progress) -> RefMap {
  const std::string url = get_url(path);
  Advertisement adv = discover_references(consts::kUploadPack, url);

  FetchNegotiation negotiation(CapabilitySet::negotiate(fetch_capabilities_, adv.capabilities),
                               walker);
  const auto wants = determine_wants(adv.refs);
  if (wants.empty()) {
    return std::move(adv.refs);
  }

  BufferConnection request;
  Protocol req_proto(request);
  negotiation.send_wants_and_haves(req_proto, wants);

  HttpResponse resp = smart_request(consts::kUploadPack, url, request.written());
  BufferConnection response(std::move(resp.body));
  Protocol resp_proto(response);
  negotiation.receive_pack(resp_proto, pack_data, progress);
  return std::move(adv.refs);
}

auto HttpGitClient::send_pack(const std::string &path, const DetermineNewRefs &determine_new_refs,
                              const GeneratePackContents &generate_pack_contents,
                              const DataHandler &progress) -> RefMap {
  const std::string url = get_url(path);
  Advertisement adv = discover_references(consts::kReceivePack, url);
  const auto caps = CapabilitySet::negotiate(send_capabilities_, adv.capabilities);

  const auto new_refs = determine_new_refs(adv.refs);
  if (!new_refs) {
    return std::move(adv.refs);
  }

  BufferConnection request;
  Protocol req_proto(request);
  const PushPlan plan = send_pack_head(req_proto, caps, adv.refs, *new_refs);
  if (plan.want.empty() && adv.refs == *new_refs) {
    return *new_refs;
  }
  const auto objects = generate_pack_contents(plan.have, plan.want);
  if (!objects.empty()) {
    write_pack_objects([&req_proto](std::span<const std::uint8_t> data) { req_proto.write(data); },
                       objects);
  }

  HttpResponse resp = smart_request(consts::kReceivePack, url, request.written());
  BufferConnection response(std::move(resp.body));
  Protocol resp_proto(response);
  receive_pack_tail(resp_proto, caps, progress);
  return *new_refs;
}

} // namespace gitwire
