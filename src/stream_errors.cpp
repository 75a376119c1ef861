// File: stream_errors.cpp
#include "stream_errors.hpp"

namespace
{
    class StreamCategory : public boost::system::error_category
    {
    public:
        const char *name() const noexcept override
        {
            return "swarmstream";
        }

        std::string message(int ev) const override
        {
            switch (static_cast<StreamErrc>(ev))
            {
            case StreamErrc::resolution_failed:
                return "Torrent not found for streaming";
            case StreamErrc::file_not_found:
                return "File not found";
            case StreamErrc::resolver_timeout:
                return "Resolver timeout";
            case StreamErrc::transfer_failed:
                return "Stream error";
            case StreamErrc::inactivity_timeout:
                return "Stream timeout";
            case StreamErrc::global_timeout:
                return "Global timeout reached";
            case StreamErrc::client_disconnected:
                return "Client disconnected";
            case StreamErrc::range_not_satisfiable:
                return "Range Not Satisfiable";
            default:
                return "Unknown stream error";
            }
        }
    };
}

const boost::system::error_category &streamCategory()
{
    static StreamCategory category;
    return category;
}

boost::system::error_code make_error_code(StreamErrc e)
{
    return {static_cast<int>(e), streamCategory()};
}

unsigned httpStatusFor(const boost::system::error_code &ec)
{
    if (ec.category() != streamCategory())
    {
        return 500;
    }

    switch (static_cast<StreamErrc>(ec.value()))
    {
    case StreamErrc::resolution_failed:
    case StreamErrc::file_not_found:
    case StreamErrc::resolver_timeout:
        return 404;
    case StreamErrc::range_not_satisfiable:
        return 416;
    case StreamErrc::inactivity_timeout:
    case StreamErrc::global_timeout:
        return 504;
    default:
        return 500;
    }
}
