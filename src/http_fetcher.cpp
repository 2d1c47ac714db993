#include "http_fetcher.hpp"

#include "config.hpp"

#include <httplib.h>

#include <memory>
#include <string>

namespace chatgen {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep, int connect_timeout, int read_timeout) {
  auto cli = std::make_unique<httplib::Client>(ep.scheme + "://" + ep.host + ":" + std::to_string(ep.port));
  cli->set_connection_timeout(connect_timeout);
  cli->set_read_timeout(read_timeout);
  cli->set_write_timeout(30);
  cli->set_follow_location(true);
  return cli;
}

}  // namespace

HttplibFetcher::HttplibFetcher(int connect_timeout_seconds, int read_timeout_seconds)
    : connect_timeout_seconds_(connect_timeout_seconds), read_timeout_seconds_(read_timeout_seconds) {}

std::optional<FetchResponse> HttplibFetcher::Get(const std::string& url, const HeaderList& headers, std::string* err) {
  auto ep = ParseHttpEndpoint(url);
  if (!ep) {
    if (err) *err = "invalid url";
    return std::nullopt;
  }
  auto cli = MakeClient(*ep, connect_timeout_seconds_, read_timeout_seconds_);
  httplib::Headers h;
  for (const auto& kv : headers) h.emplace(kv.first, kv.second);
  const std::string path = ep->base_path.empty() ? "/" : ep->base_path;
  auto res = cli->Get(path, h);
  if (!res) {
    if (err) *err = "request failed: " + httplib::to_string(res.error());
    return std::nullopt;
  }
  FetchResponse out;
  out.status = res->status;
  out.body = std::move(res->body);
  out.content_type = res->get_header_value("Content-Type");
  return out;
}

std::string UrlEncode(const std::string& s) {
  static const char* kHex = "0123456789ABCDEF";
  std::string out;
  out.reserve(s.size() * 3);
  for (unsigned char c : s) {
    const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
                            c == '_' || c == '.' || c == '~';
    if (unreserved) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string BuildQuery(const std::vector<std::pair<std::string, std::string>>& params) {
  std::string out;
  for (const auto& [k, v] : params) {
    if (!out.empty()) out += "&";
    out += UrlEncode(k) + "=" + UrlEncode(v);
  }
  return out;
}

}  // namespace chatgen
