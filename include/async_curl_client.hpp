// File: async_curl_client.hpp
#pragma once

#include "i_http_fetcher.hpp"
#include <curl/curl.h>
#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <thread>

// Downloads small documents (.torrent files) on a curl_multi worker thread.
class AsyncCurlClient : public IHttpFetcher
{
public:
    explicit AsyncCurlClient(long timeoutSeconds = 15, size_t maxBodyBytes = 16 * 1024 * 1024);
    ~AsyncCurlClient();

    AsyncCurlClient(const AsyncCurlClient &) = delete;
    AsyncCurlClient &operator=(const AsyncCurlClient &) = delete;

    uint64_t fetchAsync(const std::string &url, std::function<void(FetchResult result)> onComplete) override;
    void cancel(uint64_t requestId) override;

private:
    struct Transfer
    {
        uint64_t id = 0;
        std::string url;
        std::string body;
        char errorBuffer[CURL_ERROR_SIZE] = {};
        bool tooLarge = false;
        size_t maxBodyBytes = 0;
        std::function<void(FetchResult result)> onComplete;
    };

    CURLM *multiHandle_;
    std::thread workerThread_;
    std::atomic<bool> isRunning_{true};
    const long timeoutSeconds_;
    const size_t maxBodyBytes_;

    // Easy handles are created here but only added to the multi handle by the worker
    std::deque<std::pair<CURL *, std::unique_ptr<Transfer>>> queued_;
    std::map<CURL *, std::unique_ptr<Transfer>> transfers_;
    std::set<uint64_t> cancelled_;
    uint64_t nextId_ = 1;
    std::mutex mutex_;
    // Serialises callbacks with cancel() so a cancelled transfer never reports
    std::mutex callbackMutex_;

    static size_t writeCallback(void *contents, size_t size, size_t nmemb, void *userp);
    void eventLoop();
    void addQueued();
    void dropCancelled();
    void finishTransfer(CURL *easyHandle, CURLcode result);
};
