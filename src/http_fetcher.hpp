#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chatgen {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct FetchResponse {
  int status = 0;
  std::string body;
  std::string content_type;
};

// Outbound HTTP used by tools and attachment hydration; tests substitute a scripted fake.
class IHttpFetcher {
 public:
  virtual ~IHttpFetcher() = default;
  // nullopt means the request never produced a response (DNS, connect, TLS, timeout).
  virtual std::optional<FetchResponse> Get(const std::string& url, const HeaderList& headers, std::string* err) = 0;
};

class HttplibFetcher : public IHttpFetcher {
 public:
  HttplibFetcher(int connect_timeout_seconds = 5, int read_timeout_seconds = 30);
  std::optional<FetchResponse> Get(const std::string& url, const HeaderList& headers, std::string* err) override;

 private:
  int connect_timeout_seconds_;
  int read_timeout_seconds_;
};

std::string UrlEncode(const std::string& s);
std::string BuildQuery(const std::vector<std::pair<std::string, std::string>>& params);

}  // namespace chatgen
