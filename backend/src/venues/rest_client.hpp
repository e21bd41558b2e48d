#pragma once
#include <chrono>
#include <string>

// Minimal blocking HTTPS GET client for public market-data endpoints.
// Transport failures and non-2xx statuses throw FeedError.
class RestClient {
public:
    explicit RestClient(std::chrono::milliseconds timeout = std::chrono::seconds(10));

    std::string get(const std::string& url) const;

private:
    std::chrono::milliseconds timeout_;
};
