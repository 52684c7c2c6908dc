//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// http_client.cpp
//
// libcurl transport. Each request uses its own easy handle; global libcurl
// initialisation runs once per process.
//===----------------------------------------------------------------------===//

#include "http/http_client.hpp"
#include "common/string_util.hpp"

#include <curl/curl.h>

#include <cctype>
#include <memory>
#include <mutex>

namespace pam_oauth2 {
namespace http {

//===----------------------------------------------------------------------===//
// CURL Helper Functions
//===----------------------------------------------------------------------===//

// Responses larger than this are truncated and reported as a transport error
static constexpr size_t MAX_RESPONSE_BYTES = 1024 * 1024;

static void EnsureCurlGlobalInit() {
	static std::once_flag once;
	std::call_once(once, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlEasyDeleter {
	void operator()(CURL *curl) const {
		curl_easy_cleanup(curl);
	}
};

struct CurlSlistDeleter {
	void operator()(curl_slist *list) const {
		curl_slist_free_all(list);
	}
};

using CurlHandle = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlSlistDeleter>;

struct ResponseBuffer {
	std::string data;
	bool overflow = false;
};

// Callback function for CURL to write response data
static size_t WriteCallback(void *contents, size_t size, size_t nmemb, void *userp) {
	auto *buffer = static_cast<ResponseBuffer *>(userp);
	size_t total_size = size * nmemb;
	if (buffer->data.size() + total_size > MAX_RESPONSE_BYTES) {
		buffer->overflow = true;
		return 0;  // aborts the transfer with CURLE_WRITE_ERROR
	}
	buffer->data.append(static_cast<char *>(contents), total_size);
	return total_size;
}

//===----------------------------------------------------------------------===//
// CurlHttpTransport
//===----------------------------------------------------------------------===//

CurlHttpTransport::CurlHttpTransport(HttpTransportOptions options) : options_(std::move(options)) {
	EnsureCurlGlobalInit();
}

HttpResponse CurlHttpTransport::Post(const HttpRequest &request) {
	HttpResponse response;

	if (!IsHttpUrl(request.url, options_.allow_insecure_http)) {
		response.error = "Refusing request to non-HTTPS or malformed URL";
		return response;
	}

	CurlHandle curl(curl_easy_init());
	if (!curl) {
		response.error = "Failed to initialize CURL";
		return response;
	}

	long timeout = request.timeout_seconds > 0 ? request.timeout_seconds : DEFAULT_HTTP_TIMEOUT_SECONDS;

	curl_slist *raw_headers = nullptr;
	std::string content_type_header = "Content-Type: " + request.content_type;
	raw_headers = curl_slist_append(raw_headers, content_type_header.c_str());
	raw_headers = curl_slist_append(raw_headers, "Accept: application/json");
	for (const auto &header : request.headers) {
		raw_headers = curl_slist_append(raw_headers, header.Expose().c_str());
	}
	CurlHeaderList headers(raw_headers);
	if (!headers) {
		response.error = "Failed to build request headers";
		return response;
	}

	ResponseBuffer buffer;
	char error_buffer[CURL_ERROR_SIZE];
	error_buffer[0] = '\0';

	curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
	curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.Expose().c_str());
	curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.Size()));
	curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
	curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
	curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &buffer);
	curl_easy_setopt(curl.get(), CURLOPT_ERRORBUFFER, error_buffer);
	curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout);
	curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, timeout);
	curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
	curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 0L);
	curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, options_.user_agent.c_str());
#if LIBCURL_VERSION_NUM >= 0x075500
	curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS_STR, options_.allow_insecure_http ? "http,https" : "https");
#else
	curl_easy_setopt(curl.get(), CURLOPT_PROTOCOLS,
	                 options_.allow_insecure_http ? (CURLPROTO_HTTP | CURLPROTO_HTTPS) : CURLPROTO_HTTPS);
#endif
	curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, options_.verify_tls ? 1L : 0L);
	curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, options_.verify_tls ? 2L : 0L);
	if (!options_.ca_bundle.empty()) {
		curl_easy_setopt(curl.get(), CURLOPT_CAINFO, options_.ca_bundle.c_str());
	}

	CURLcode res = curl_easy_perform(curl.get());

	if (buffer.overflow) {
		SecureWipe(buffer.data);
		response.error = "Response body exceeds size limit";
		return response;
	}

	if (res != CURLE_OK) {
		std::string detail = error_buffer[0] != '\0' ? std::string(error_buffer) : curl_easy_strerror(res);
		response.error = "HTTP request failed: " + detail;
		return response;
	}

	long http_code = 0;
	curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
	response.status = static_cast<int>(http_code);
	response.body = std::move(buffer.data);
	return response;
}

//===----------------------------------------------------------------------===//
// Encoding Helpers
//===----------------------------------------------------------------------===//

std::string UrlEncode(const std::string &value) {
	// RFC 3986 unreserved characters pass through; everything else is %XX
	static const char *const HEX = "0123456789ABCDEF";
	std::string result;
	result.reserve(value.size() * 3);
	for (unsigned char c : value) {
		if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
			result.push_back(static_cast<char>(c));
		} else {
			result.push_back('%');
			result.push_back(HEX[c >> 4]);
			result.push_back(HEX[c & 0x0F]);
		}
	}
	return result;
}

std::string FormEncode(const FormParams &params) {
	std::string body;
	for (const auto &param : params) {
		if (!body.empty()) {
			body += "&";
		}
		body += UrlEncode(param.first);
		body += "=";
		body += UrlEncode(param.second);
	}
	return body;
}

bool IsHttpUrl(const std::string &url, bool allow_insecure_http) {
	std::string rest;
	if (StringUtil::StartsWith(url, "https://")) {
		rest = url.substr(8);
	} else if (allow_insecure_http && StringUtil::StartsWith(url, "http://")) {
		rest = url.substr(7);
	} else {
		return false;
	}
	auto host_end = rest.find_first_of("/?#");
	std::string authority = rest.substr(0, host_end);
	if (authority.empty() || authority.find('@') != std::string::npos) {
		return false;
	}
	for (char c : url) {
		if (std::isspace(static_cast<unsigned char>(c)) || static_cast<unsigned char>(c) < 0x20) {
			return false;
		}
	}
	return true;
}

}  // namespace http
}  // namespace pam_oauth2
