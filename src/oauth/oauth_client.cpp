//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// oauth_client.cpp
//
// Request construction and response classification for the device-code,
// token and introspection endpoints
//===----------------------------------------------------------------------===//

#include "oauth/oauth_client.hpp"
#include "common/exception.hpp"
#include "common/string_util.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <vector>

namespace pam_oauth2 {

//===----------------------------------------------------------------------===//
// ClientAuthMethod
//===----------------------------------------------------------------------===//

const char *ClientAuthMethodToString(ClientAuthMethod method) {
	switch (method) {
	case ClientAuthMethod::BASIC:
		return "basic";
	case ClientAuthMethod::POST:
		return "post";
	default:
		return "unknown";
	}
}

ClientAuthMethod ParseClientAuthMethod(const std::string &name) {
	auto lower = StringUtil::Lower(StringUtil::Trim(name));
	if (lower == "basic" || lower == "client_secret_basic") {
		return ClientAuthMethod::BASIC;
	}
	if (lower == "post" || lower == "client_secret_post") {
		return ClientAuthMethod::POST;
	}
	throw ConfigurationException(
	    StringUtil::Format("Invalid client_auth_method '%s'. Must be 'basic' or 'post'", name.c_str()));
}

const char *TokenPollStatusToString(TokenPollStatus status) {
	switch (status) {
	case TokenPollStatus::SUCCESS:
		return "SUCCESS";
	case TokenPollStatus::AUTHORIZATION_PENDING:
		return "AUTHORIZATION_PENDING";
	case TokenPollStatus::SLOW_DOWN:
		return "SLOW_DOWN";
	case TokenPollStatus::EXPIRED_TOKEN:
		return "EXPIRED_TOKEN";
	case TokenPollStatus::ACCESS_DENIED:
		return "ACCESS_DENIED";
	case TokenPollStatus::FAILED:
		return "FAILED";
	default:
		return "UNKNOWN";
	}
}

//===----------------------------------------------------------------------===//
// ValidateClientConfig
//===----------------------------------------------------------------------===//

static void ValidateEndpoint(const char *name, const std::string &url, bool allow_insecure_http) {
	if (url.empty()) {
		throw ConfigurationException(StringUtil::Format("Missing required setting '%s'", name));
	}
	if (!http::IsHttpUrl(url, allow_insecure_http)) {
		throw ConfigurationException(StringUtil::Format(
		    "Invalid URL for '%s': %s (expected %s)", name, url.c_str(),
		    allow_insecure_http ? "an absolute http:// or https:// URL" : "an absolute https:// URL"));
	}
}

static void ValidatePositive(const char *name, int64_t value) {
	if (value <= 0) {
		throw ConfigurationException(
		    StringUtil::Format("Setting '%s' must be a positive number of seconds, got %lld", name,
		                       static_cast<long long>(value)));
	}
}

void ValidateClientConfig(const ClientConfig &config) {
	if (StringUtil::Trim(config.client_id).empty()) {
		throw ConfigurationException("Missing required setting 'client_id'");
	}
	ValidateEndpoint("oauth_device_url", config.device_code_url, config.allow_insecure_http);
	ValidateEndpoint("oauth_token_url", config.token_url, config.allow_insecure_http);
	ValidateEndpoint("oauth_token_introspect_url", config.introspection_url, config.allow_insecure_http);
	ValidatePositive("oauth_auth_timeout", config.auth_timeout_seconds);
	ValidatePositive("http_timeout", config.http_timeout_seconds);
	ValidatePositive("poll_interval", config.poll_interval_seconds);
	ValidatePositive("slow_down_increment", config.slow_down_increment_seconds);
}

//===----------------------------------------------------------------------===//
// Client authentication
//===----------------------------------------------------------------------===//

SecretString BuildBasicAuthorization(const std::string &client_id, const SecretString &client_secret) {
	// RFC 6749 section 2.3.1: both parts are form-urlencoded before base64
	std::string credentials = http::UrlEncode(client_id) + ":" + http::UrlEncode(client_secret.Expose());

	// EVP_EncodeBlock writes 4 bytes per 3 input bytes plus a NUL
	std::vector<unsigned char> encoded(4 * ((credentials.size() + 2) / 3) + 1);
	int written = EVP_EncodeBlock(encoded.data(), reinterpret_cast<const unsigned char *>(credentials.data()),
	                              static_cast<int>(credentials.size()));
	SecureWipe(credentials);

	std::string header = "Authorization: Basic ";
	header.append(reinterpret_cast<const char *>(encoded.data()), static_cast<size_t>(std::max(written, 0)));
	std::fill(encoded.begin(), encoded.end(), 0);

	SecretString result(header);
	SecureWipe(header);
	return result;
}

//===----------------------------------------------------------------------===//
// OAuthClient
//===----------------------------------------------------------------------===//

OAuthClient::OAuthClient(ClientConfig config, std::shared_ptr<http::HttpTransport> transport)
    : config_(std::move(config)), transport_(std::move(transport)) {}

std::unique_ptr<OAuthClient> OAuthClient::Create(ClientConfig config, std::shared_ptr<http::HttpTransport> transport) {
	ValidateClientConfig(config);
	if (!transport) {
		throw ConfigurationException("OAuth client requires an HTTP transport");
	}
	return std::unique_ptr<OAuthClient>(new OAuthClient(std::move(config), std::move(transport)));
}

http::HttpRequest OAuthClient::BuildRequest(const std::string &url, http::FormParams &params,
                                            bool include_client_id, int64_t timeout_seconds) const {
	http::HttpRequest request;
	request.url = url;

	bool has_secret = !config_.client_secret.Empty();
	if (has_secret && config_.auth_method == ClientAuthMethod::BASIC) {
		request.headers.push_back(BuildBasicAuthorization(config_.client_id, config_.client_secret));
		if (include_client_id) {
			params.emplace_back("client_id", config_.client_id);
		}
	} else {
		params.emplace_back("client_id", config_.client_id);
		if (has_secret) {
			params.emplace_back("client_secret", config_.client_secret.Expose());
		}
	}

	std::string body = http::FormEncode(params);
	request.body = SecretString(body);
	SecureWipe(body);
	for (auto &param : params) {
		SecureWipe(param.second);
	}

	int64_t timeout = std::min(config_.http_timeout_seconds, timeout_seconds);
	request.timeout_seconds = static_cast<int>(std::max<int64_t>(timeout, 1));
	return request;
}

DeviceCodeResult OAuthClient::RequestDeviceCode() {
	http::FormParams params;
	if (!config_.scope.empty()) {
		params.emplace_back("scope", config_.scope);
	}
	auto request = BuildRequest(config_.device_code_url, params, true, config_.http_timeout_seconds);
	auto response = transport_->Post(request);

	if (response.TransportFailed()) {
		return DeviceCodeResult::Failure(OAuthError::Transport(response.error));
	}
	if (!response.Success()) {
		return DeviceCodeResult::Failure(DecodeErrorResponse(response.status, response.body));
	}

	OAuthError body_error;
	if (DecodeErrorInSuccessBody(response.body, body_error)) {
		return DeviceCodeResult::Failure(body_error);
	}

	DeviceCodeResult result;
	std::string error;
	if (!ParseDeviceCodeResponse(response.body, config_.poll_interval_seconds, DEFAULT_DEVICE_CODE_EXPIRES_SECONDS,
	                             result.response, error)) {
		SecureWipe(response.body);
		return DeviceCodeResult::Failure(OAuthError::Transport(error));
	}
	SecureWipe(response.body);
	result.success = true;
	return result;
}

static TokenPollStatus ClassifyTokenError(const OAuthError &error) {
	if (error.kind != OAuthErrorKind::PROTOCOL) {
		return TokenPollStatus::FAILED;
	}
	if (error.code == ERROR_AUTHORIZATION_PENDING) {
		return TokenPollStatus::AUTHORIZATION_PENDING;
	}
	if (error.code == ERROR_SLOW_DOWN) {
		return TokenPollStatus::SLOW_DOWN;
	}
	if (error.code == ERROR_EXPIRED_TOKEN) {
		return TokenPollStatus::EXPIRED_TOKEN;
	}
	if (error.code == ERROR_ACCESS_DENIED) {
		return TokenPollStatus::ACCESS_DENIED;
	}
	return TokenPollStatus::FAILED;
}

TokenPollResult OAuthClient::RequestToken(const SecretString &device_code, int64_t timeout_seconds) {
	http::FormParams params;
	params.emplace_back("grant_type", DEVICE_CODE_GRANT_TYPE);
	params.emplace_back("device_code", device_code.Expose());
	auto request = BuildRequest(config_.token_url, params, true, timeout_seconds);
	auto response = transport_->Post(request);

	if (response.TransportFailed()) {
		return TokenPollResult::Failure(TokenPollStatus::FAILED, OAuthError::Transport(response.error));
	}
	if (!response.Success()) {
		auto error = DecodeErrorResponse(response.status, response.body);
		return TokenPollResult::Failure(ClassifyTokenError(error), error);
	}

	OAuthError body_error;
	if (DecodeErrorInSuccessBody(response.body, body_error)) {
		return TokenPollResult::Failure(ClassifyTokenError(body_error), body_error);
	}

	TokenPollResult result;
	std::string error;
	bool parsed = ParseTokenResponse(response.body, result.token, error);
	SecureWipe(response.body);
	if (!parsed) {
		return TokenPollResult::Failure(TokenPollStatus::FAILED, OAuthError::Transport(error));
	}
	result.status = TokenPollStatus::SUCCESS;
	return result;
}

IntrospectionResult OAuthClient::Introspect(const SecretString &access_token, int64_t timeout_seconds) {
	http::FormParams params;
	params.emplace_back("token", access_token.Expose());
	params.emplace_back("token_type_hint", ACCESS_TOKEN_TYPE_HINT);
	auto request = BuildRequest(config_.introspection_url, params, false, timeout_seconds);
	auto response = transport_->Post(request);

	if (response.TransportFailed()) {
		return IntrospectionResult::Failure(OAuthError::Transport(response.error));
	}
	if (!response.Success()) {
		return IntrospectionResult::Failure(DecodeErrorResponse(response.status, response.body));
	}

	IntrospectionResult result;
	std::string error;
	if (!ParseIntrospectionResponse(response.body, result.response, error)) {
		OAuthError body_error;
		if (DecodeErrorInSuccessBody(response.body, body_error)) {
			return IntrospectionResult::Failure(body_error);
		}
		return IntrospectionResult::Failure(OAuthError::Transport(error));
	}
	result.success = true;
	return result;
}

std::shared_ptr<http::HttpTransport> CreateDefaultTransport(const ClientConfig &config) {
	http::HttpTransportOptions options;
	options.verify_tls = config.verify_tls;
	options.ca_bundle = config.ca_bundle;
	options.allow_insecure_http = config.allow_insecure_http;
	return std::make_shared<http::CurlHttpTransport>(options);
}

}  // namespace pam_oauth2
