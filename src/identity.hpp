#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace chatgen {

struct Identity {
  std::string user_id;
  bool anonymous = false;
};

using RequestHeaders = std::vector<std::pair<std::string, std::string>>;

class IIdentityResolver {
 public:
  virtual ~IIdentityResolver() = default;
  virtual std::optional<Identity> ResolveCaller(const RequestHeaders& headers) = 0;
};

// Trusts a user id header set by an upstream auth proxy. Without require_identity, callers that carry no
// header resolve to the "anonymous" identity.
class TrustedHeaderIdentityResolver : public IIdentityResolver {
 public:
  TrustedHeaderIdentityResolver(std::string header_name, bool require_identity);

  std::optional<Identity> ResolveCaller(const RequestHeaders& headers) override;

 private:
  std::string header_name_;
  bool require_identity_;
};

}  // namespace chatgen
