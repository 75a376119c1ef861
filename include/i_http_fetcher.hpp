// File: i_http_fetcher.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <string>

struct FetchResult
{
    bool ok = false;
    long httpStatus = 0;
    std::string body;
    std::string error;
};

class IHttpFetcher
{
public:
    // Returns a request id usable with cancel(). The callback runs on the fetcher's own thread.
    virtual uint64_t fetchAsync(const std::string &url, std::function<void(FetchResult result)> onComplete) = 0;

    // Abandons the transfer and closes its connection; the callback is never invoked afterwards.
    virtual void cancel(uint64_t requestId) = 0;

    virtual ~IHttpFetcher() = default;
};
