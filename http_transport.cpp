#include "http_transport.h"
#include <curl/curl.h>
#include <memory>

namespace gptcli {
namespace detail {

inline void curl_deleter(CURL* curl) {
    if (curl) {
        curl_easy_cleanup(curl);
    }
}

inline void slist_deleter(struct curl_slist* list) {
    if (list) {
        curl_slist_free_all(list);
    }
}

// Standard CURL write callback function to append data to a std::string
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

} // namespace detail

CurlTransport::CurlTransport(long timeout_seconds) : m_timeout_seconds(timeout_seconds) {}

HttpResponse CurlTransport::post(const std::string& url,
                                 const std::vector<std::string>& headers,
                                 const std::string& body) {
    std::unique_ptr<CURL, decltype(&detail::curl_deleter)> curl{curl_easy_init(), detail::curl_deleter};
    if (!curl) {
        throw TransportError("Failed to initialize CURL", false);
    }

    std::unique_ptr<struct curl_slist, decltype(&detail::slist_deleter)> header_list{nullptr, detail::slist_deleter};
    // curl_slist_append returns the new head; only take ownership once it succeeded
    for (const auto& header : headers) {
        struct curl_slist* appended = curl_slist_append(header_list.get(), header.c_str());
        if (!appended) {
            throw TransportError("Failed to build request headers", false);
        }
        header_list.release();
        header_list.reset(appended);
    }

    HttpResponse response;

    // Set CURL options
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, detail::WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, m_timeout_seconds);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L); // Timeouts must not raise SIGALRM

    // Perform the request; HTTP error statuses are not transport errors
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw TransportError("API request failed: " + std::string(curl_easy_strerror(res)),
                             res == CURLE_OPERATION_TIMEDOUT);
    }

    // Get HTTP status code
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    return response;
}

} // namespace gptcli
