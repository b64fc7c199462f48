#include "gitwire/report_status.hpp"

#include "gitwire/consts.hpp"
#include "gitwire/errors.hpp"

#include <cctype>
#include <map>
#include <string_view>

namespace {

std::string strip(std::string_view sv) {
  auto is_ws = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
  while (!sv.empty() && is_ws(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && is_ws(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace

namespace gitwire {

void ReportStatusParser::handle_packet(const Packet &pkt) {
  if (done_) {
    throw ProtocolError("received more data after status report");
  }
  if (!pkt) {
    done_ = true;
    return;
  }
  if (!pack_status_) {
    pack_status_ = strip(*pkt);
    return;
  }
  std::string status = strip(*pkt);
  if (!std::string_view(status).starts_with(consts::kStatusOk)) {
    ref_status_ok_ = false;
  }
  ref_statuses_.push_back(std::move(status));
}

void ReportStatusParser::check() const {
  if (pack_status_ && *pack_status_ != consts::kUnpackOk) {
    throw SendPackError(*pack_status_);
  }
  if (ref_status_ok_) {
    return;
  }

  std::map<std::string, std::string> failed;
  for (const auto &line : ref_statuses_) {
    const auto sp = line.find(consts::kSpace);
    if (sp == std::string::npos) {
      continue; // malformed, skip
    }
    const std::string_view status = std::string_view(line).substr(0, sp);
    if (status != consts::kStatusNg) {
      continue;
    }
    std::string_view rest = std::string_view(line).substr(sp + 1);
    const auto sp2 = rest.find(consts::kSpace);
    if (sp2 == std::string_view::npos) {
      failed[std::string(rest)] = std::string(consts::kStatusNg);
    } else {
      failed[std::string(rest.substr(0, sp2))] = std::string(rest.substr(sp2 + 1));
    }
  }

  std::string names;
  for (const auto &[ref, reason] : failed) {
    if (!names.empty()) {
      names += ", ";
    }
    names += ref;
  }
  throw UpdateRefsError(names + " failed to update", std::move(failed));
}

} // namespace gitwire
