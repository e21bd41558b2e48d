#include "venues/rest_client.hpp"
#include "util/errors.hpp"

#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace {

// CURL write callback: append the body chunk to the std::string
size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* s) {
    size_t new_length = size * nmemb;
    s->append(static_cast<char*>(contents), new_length);
    return new_length;
}

// curl_global_init is not thread-safe; run it once before any easy handle.
void ensure_curl_global() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlDeleter {
    void operator()(CURL* c) const noexcept { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const noexcept { curl_slist_free_all(l); }
};

} // namespace

RestClient::RestClient(std::chrono::milliseconds timeout) : timeout_(timeout) {
    ensure_curl_global();
}

std::string RestClient::get(const std::string& url) const {
    std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
    if (!curl) {
        throw FeedError("curl_easy_init failed");
    }

    std::unique_ptr<curl_slist, SlistDeleter> headers(
        curl_slist_append(nullptr, "User-Agent: cex-book-collector/1.0"));

    std::string response_str;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_str);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        throw FeedError("GET " + url + " failed: " + curl_easy_strerror(res));
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status >= 300) {
        throw FeedError("GET " + url + " returned HTTP " + std::to_string(status) + ": " + response_str);
    }
    return response_str;
}
