#include "provider/http_transport.hpp"

#include <algorithm>
#include <cctype>
#include <curl/curl.h>

namespace warden::provider {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    const auto total = size * nmemb;
    auto* output = static_cast<std::string*>(userdata);
    output->append(ptr, total);
    return total;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    const auto total = size * nitems;
    const std::string header(buffer, total);
    auto* headers = static_cast<HeaderMap*>(userdata);

    const auto separator = header.find(':');
    if (separator != std::string::npos) {
        (*headers)[to_lower(trim(header.substr(0, separator)))] =
            trim(header.substr(separator + 1));
    }
    return total;
}

// Returning non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK.
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const std::atomic_bool*>(clientp);
    return (token != nullptr && token->load()) ? 1 : 0;
}

}  // namespace

CurlHttpTransport::CurlHttpTransport() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpTransport::~CurlHttpTransport() { curl_global_cleanup(); }

HttpResponse CurlHttpTransport::post_json(
    const std::string& url, const HeaderMap& headers, const std::string& body,
    const std::uint64_t timeout_ms, const std::shared_ptr<std::atomic_bool>& cancel_token) {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (curl == nullptr) {
        response.network_error = true;
        response.network_error_message = "curl_easy_init failed";
        return response;
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, "warden/0.1");
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));

    if (cancel_token) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, cancel_token.get());
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : headers) {
        const std::string line = key + ": " + value;
        header_list = curl_slist_append(header_list, line.c_str());
    }
    if (header_list != nullptr) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    const CURLcode code = curl_easy_perform(curl);
    if (code == CURLE_OPERATION_TIMEDOUT) {
        response.timeout = true;
        response.network_error_message = curl_easy_strerror(code);
    } else if (code == CURLE_ABORTED_BY_CALLBACK) {
        response.cancelled = true;
        response.network_error_message = "request cancelled";
    } else if (code != CURLE_OK) {
        response.network_error = true;
        response.network_error_message = curl_easy_strerror(code);
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    }

    if (header_list != nullptr) {
        curl_slist_free_all(header_list);
    }
    curl_easy_cleanup(curl);
    return response;
}

}  // namespace warden::provider
