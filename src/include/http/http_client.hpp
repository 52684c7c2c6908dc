//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// http_client.hpp
//
// HTTP transport for the authorization-server endpoints. One POST per call,
// no retries: retry policy belongs to the device grant engine.
//===----------------------------------------------------------------------===//

#pragma once

#include "common/secret_string.hpp"

#include <string>
#include <utility>
#include <vector>

namespace pam_oauth2 {
namespace http {

// Default per-request timeout in seconds
constexpr int DEFAULT_HTTP_TIMEOUT_SECONDS = 30;

constexpr const char *FORM_CONTENT_TYPE = "application/x-www-form-urlencoded";

//! Form field list, in the order it is sent
using FormParams = std::vector<std::pair<std::string, std::string>>;

//! A POST to one endpoint
struct HttpRequest {
	std::string url;
	SecretString body;                 //! Carries device codes, tokens and client secrets
	std::string content_type = FORM_CONTENT_TYPE;
	std::vector<SecretString> headers; //! "Name: value" lines (Authorization is secret)
	int timeout_seconds = DEFAULT_HTTP_TIMEOUT_SECONDS;
};

//! Result of an HTTP request
struct HttpResponse {
	int status = 0;
	std::string body;
	std::string error; //! Non-empty on network/connection failure

	bool Success() const {
		return error.empty() && status >= 200 && status < 300;
	}

	bool TransportFailed() const {
		return !error.empty();
	}
};

//===----------------------------------------------------------------------===//
// HttpTransport - Abstract POST capability
//===----------------------------------------------------------------------===//
class HttpTransport {
public:
	virtual ~HttpTransport() = default;

	// Must not throw for network failures; report them in HttpResponse::error
	virtual HttpResponse Post(const HttpRequest &request) = 0;
};

//===----------------------------------------------------------------------===//
// CurlHttpTransport - libcurl implementation
//===----------------------------------------------------------------------===//
struct HttpTransportOptions {
	bool verify_tls = true;
	std::string ca_bundle;          //! Empty: libcurl's default trust store
	bool allow_insecure_http = false;
	std::string user_agent = "pam_oauth2_device";
};

class CurlHttpTransport : public HttpTransport {
public:
	explicit CurlHttpTransport(HttpTransportOptions options);
	~CurlHttpTransport() override = default;

	HttpResponse Post(const HttpRequest &request) override;

private:
	HttpTransportOptions options_;
};

//! URL-encode a single string value
std::string UrlEncode(const std::string &value);

//! application/x-www-form-urlencoded body from ordered params
std::string FormEncode(const FormParams &params);

//! True for absolute http:// or https:// URLs with a host
bool IsHttpUrl(const std::string &url, bool allow_insecure_http);

}  // namespace http
}  // namespace pam_oauth2
