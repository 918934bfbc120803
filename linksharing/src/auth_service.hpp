#pragma once

#include "context.hpp"
#include "errors.hpp"

#include <string>
#include <string_view>

namespace auth {

// What the authorization service knows about an access key id.
struct Response {
  std::string access_grant;
  std::string secret_key;
  bool is_public = false;
};

// Resolves access key ids into serialized access grants.
class Resolver {
public:
  virtual ~Resolver() = default;

  virtual bool resolve(const util::Context& ctx,
                       std::string_view access_key_id,
                       Response* out,
                       sharing::Error* err) = 0;
};

struct ServiceConfig {
  std::string base_url; // e.g. https://auth.example.test
  std::string token;    // bearer token
  long timeout_ms = 5000;
  long connect_timeout_ms = 2000;
  bool verify_tls = true;
};

// HTTP client of the authorization service: GET <base_url>/v1/access/<id>.
class ServiceClient final : public Resolver {
public:
  explicit ServiceClient(ServiceConfig cfg);
  ~ServiceClient() override;

  bool resolve(const util::Context& ctx,
               std::string_view access_key_id,
               Response* out,
               sharing::Error* err) override;

private:
  std::string BuildAccessUrl(std::string_view access_key_id) const;

  ServiceConfig cfg_;
};

// Parse the JSON body {"access_grant": "...", "secret_key": "...", "public": bool}.
bool parse_service_response(std::string_view body, Response* out, std::string* err);

} // namespace auth
