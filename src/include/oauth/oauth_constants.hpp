//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// oauth_constants.hpp
//
// Device Authorization Grant (RFC 8628) and introspection (RFC 7662)
// protocol constants and policy defaults
//===----------------------------------------------------------------------===//

#pragma once

#include "http/http_client.hpp"

#include <cstdint>

namespace pam_oauth2 {

//===----------------------------------------------------------------------===//
// Grant and form parameters
//===----------------------------------------------------------------------===//

constexpr const char *DEVICE_CODE_GRANT_TYPE = "urn:ietf:params:oauth:grant-type:device_code";

constexpr const char *ACCESS_TOKEN_TYPE_HINT = "access_token";

//===----------------------------------------------------------------------===//
// Token endpoint error codes (RFC 8628 section 3.5)
//===----------------------------------------------------------------------===//

constexpr const char *ERROR_AUTHORIZATION_PENDING = "authorization_pending";
constexpr const char *ERROR_SLOW_DOWN = "slow_down";
constexpr const char *ERROR_EXPIRED_TOKEN = "expired_token";
constexpr const char *ERROR_ACCESS_DENIED = "access_denied";

//===----------------------------------------------------------------------===//
// Policy defaults (overridable from configuration)
//===----------------------------------------------------------------------===//

// Poll spacing when the server does not advertise an interval
constexpr int64_t DEFAULT_POLL_INTERVAL_SECONDS = 5;

// Added to the interval on every slow_down
constexpr int64_t SLOW_DOWN_INCREMENT_SECONDS = 5;

// Caller-side cap on one whole device grant
constexpr int64_t DEFAULT_AUTH_TIMEOUT_SECONDS = 300;

// Device code lifetime when the server omits expires_in
constexpr int64_t DEFAULT_DEVICE_CODE_EXPIRES_SECONDS = 900;  // 15 minutes

constexpr int64_t DEFAULT_HTTP_TIMEOUT_SECONDS = http::DEFAULT_HTTP_TIMEOUT_SECONDS;

constexpr const char *DEFAULT_SCOPE = "openid";

}  // namespace pam_oauth2
