// File: response_writer.hpp
#pragma once
#include "source_handle.hpp"
#include <boost/system/error_code.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <utility>
#include <vector>

using WriteHandler = std::function<void(const boost::system::error_code &ec)>;

struct ResponseHead
{
    unsigned status = 200;
    uint64_t contentLength = 0;
    std::vector<std::pair<std::string, std::string>> fields;

    void set(const std::string &name, const std::string &value)
    {
        fields.emplace_back(name, value);
    }

    // Empty when the field is absent
    std::string get(const std::string &name) const
    {
        for (const auto &field : fields)
        {
            if (field.first == name)
                return field.second;
        }
        return {};
    }
};

// Client side of one HTTP response. Implemented over Beast in HttpSession.
class IResponseWriter
{
public:
    // Head to send in front of the first body write
    virtual void setHead(ResponseHead head) = 0;

    // Sends the pending head (once) followed by `chunk`. The handler is the
    // drain signal: the transport has taken the chunk and can accept another.
    virtual void asyncWriteBody(ByteChunk chunk, WriteHandler handler) = 0;

    // Sends the pending head with no body (HEAD requests, empty files).
    virtual void asyncWriteHead(WriteHandler handler) = 0;

    // JSON {"error": message}. Only valid while headersSent() is false.
    virtual void sendError(unsigned status, const std::string &message, std::vector<std::pair<std::string, std::string>> fields, bool keepAlive) = 0;

    virtual bool headersSent() const = 0;

    // The response ended normally; the connection may serve another request.
    virtual void complete() = 0;

    // Ends the connection without further writes (truncated body, disconnect).
    virtual void abort() = 0;

    virtual ~IResponseWriter() = default;
};
