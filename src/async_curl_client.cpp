// File: async_curl_client.cpp
#include "async_curl_client.hpp"
#include "logger.hpp"
#include <stdexcept>

AsyncCurlClient::AsyncCurlClient(long timeoutSeconds, size_t maxBodyBytes)
    : timeoutSeconds_(timeoutSeconds), maxBodyBytes_(maxBodyBytes)
{
    curl_global_init(CURL_GLOBAL_ALL);
    multiHandle_ = curl_multi_init();
    if (!multiHandle_)
    {
        curl_global_cleanup();
        throw std::runtime_error("Failed to initialize CURL multi handle");
    }
    workerThread_ = std::thread(&AsyncCurlClient::eventLoop, this);
}

AsyncCurlClient::~AsyncCurlClient()
{
    isRunning_ = false;
    if (workerThread_.joinable())
    {
        workerThread_.join();
    }

    for (auto &[easyHandle, transfer] : transfers_)
    {
        curl_multi_remove_handle(multiHandle_, easyHandle);
        curl_easy_cleanup(easyHandle);
    }
    for (auto &[easyHandle, transfer] : queued_)
    {
        curl_easy_cleanup(easyHandle);
    }

    curl_multi_cleanup(multiHandle_);
    curl_global_cleanup();
}

uint64_t AsyncCurlClient::fetchAsync(const std::string &url, std::function<void(FetchResult result)> onComplete)
{
    CURL *easyHandle = curl_easy_init();
    if (!easyHandle)
    {
        throw std::runtime_error("Failed to initialize CURL easy handle");
    }

    auto transfer = std::make_unique<Transfer>();
    transfer->url = url;
    transfer->maxBodyBytes = maxBodyBytes_;
    transfer->onComplete = std::move(onComplete);

    curl_easy_setopt(easyHandle, CURLOPT_URL, transfer->url.c_str());
    curl_easy_setopt(easyHandle, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(easyHandle, CURLOPT_WRITEDATA, transfer.get());
    curl_easy_setopt(easyHandle, CURLOPT_ERRORBUFFER, transfer->errorBuffer);
    curl_easy_setopt(easyHandle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(easyHandle, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(easyHandle, CURLOPT_TIMEOUT, timeoutSeconds_);
    curl_easy_setopt(easyHandle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(easyHandle, CURLOPT_USERAGENT, "swarmstream");

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = nextId_++;
    transfer->id = id;
    queued_.emplace_back(easyHandle, std::move(transfer));

    Logger::Log(LogLevel::DEBUG, "AsyncCurlClient::fetchAsync: Queued #" + std::to_string(id) + " " + url);
    return id;
}

void AsyncCurlClient::cancel(uint64_t requestId)
{
    std::lock_guard<std::mutex> callbackLock(callbackMutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_.insert(requestId);
}

size_t AsyncCurlClient::writeCallback(void *contents, size_t size, size_t nmemb, void *userp)
{
    auto *transfer = static_cast<Transfer *>(userp);
    size_t bytes = size * nmemb;
    if (transfer->body.size() + bytes > transfer->maxBodyBytes)
    {
        transfer->tooLarge = true;
        return 0; // aborts the transfer with CURLE_WRITE_ERROR
    }
    transfer->body.append(static_cast<char *>(contents), bytes);
    return bytes;
}

void AsyncCurlClient::addQueued()
{
    std::lock_guard<std::mutex> lock(mutex_);
    while (!queued_.empty())
    {
        auto [easyHandle, transfer] = std::move(queued_.front());
        queued_.pop_front();
        curl_multi_add_handle(multiHandle_, easyHandle);
        transfers_[easyHandle] = std::move(transfer);
    }
}

void AsyncCurlClient::dropCancelled()
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.empty())
    {
        return;
    }

    for (auto it = queued_.begin(); it != queued_.end();)
    {
        if (cancelled_.count(it->second->id))
        {
            curl_easy_cleanup(it->first);
            it = queued_.erase(it);
        }
        else
        {
            ++it;
        }
    }

    for (auto it = transfers_.begin(); it != transfers_.end();)
    {
        if (cancelled_.count(it->second->id))
        {
            Logger::Log(LogLevel::DEBUG, "AsyncCurlClient::dropCancelled: Abandoned #" + std::to_string(it->second->id) + " " + it->second->url);
            curl_multi_remove_handle(multiHandle_, it->first);
            curl_easy_cleanup(it->first);
            it = transfers_.erase(it);
        }
        else
        {
            ++it;
        }
    }

    // Anything left already finished
    cancelled_.clear();
}

void AsyncCurlClient::finishTransfer(CURL *easyHandle, CURLcode result)
{
    std::unique_ptr<Transfer> transfer;
    auto it = transfers_.find(easyHandle);
    if (it != transfers_.end())
    {
        transfer = std::move(it->second);
        transfers_.erase(it);
    }

    FetchResult fetchResult;
    curl_easy_getinfo(easyHandle, CURLINFO_RESPONSE_CODE, &fetchResult.httpStatus);
    curl_multi_remove_handle(multiHandle_, easyHandle);
    curl_easy_cleanup(easyHandle);

    if (!transfer)
    {
        return;
    }

    if (result != CURLE_OK)
    {
        fetchResult.error = transfer->tooLarge ? "Response exceeds " + std::to_string(transfer->maxBodyBytes) + " bytes"
                                               : (transfer->errorBuffer[0] ? std::string(transfer->errorBuffer) : std::string(curl_easy_strerror(result)));
    }
    else if (fetchResult.httpStatus >= 400)
    {
        fetchResult.error = "HTTP " + std::to_string(fetchResult.httpStatus);
    }
    else
    {
        fetchResult.ok = true;
        fetchResult.body = std::move(transfer->body);
    }

    if (!fetchResult.ok)
    {
        Logger::Log(LogLevel::WARN, "AsyncCurlClient::finishTransfer: " + transfer->url + " failed: " + fetchResult.error);
    }

    std::lock_guard<std::mutex> callbackLock(callbackMutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (cancelled_.erase(transfer->id) > 0)
        {
            return;
        }
    }

    if (transfer->onComplete)
    {
        transfer->onComplete(std::move(fetchResult));
    }
}

void AsyncCurlClient::eventLoop()
{
    while (isRunning_)
    {
        addQueued();
        dropCancelled();

        int runningHandles = 0;
        CURLMcode rc = curl_multi_perform(multiHandle_, &runningHandles);
        if (rc != CURLM_OK)
        {
            Logger::Log(LogLevel::ERROR, "AsyncCurlClient::eventLoop: curl_multi_perform: " + std::string(curl_multi_strerror(rc)));
        }

        int numMessages;
        CURLMsg *msg;
        while ((msg = curl_multi_info_read(multiHandle_, &numMessages)))
        {
            if (msg->msg == CURLMSG_DONE)
            {
                finishTransfer(msg->easy_handle, msg->data.result);
            }
        }

        // Returns early when a socket becomes ready
        int numFds = 0;
        curl_multi_wait(multiHandle_, nullptr, 0, 50, &numFds);
    }
}
