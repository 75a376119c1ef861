// File: stream_errors.hpp
#pragma once
#include <boost/system/error_code.hpp>
#include <string>
#include <type_traits>

// Failure kinds of a single stream. A malformed Range header is not listed:
// it degrades to the default window instead of failing.
enum class StreamErrc
{
    resolution_failed = 1, // unknown identifier
    file_not_found,        // identifier resolved, file index out of range
    resolver_timeout,      // resolver did not answer in time
    transfer_failed,       // source read or client write failed
    inactivity_timeout,    // no data for streamTimeout
    global_timeout,        // request exceeded globalTimeout
    client_disconnected,
    range_not_satisfiable
};

const boost::system::error_category &streamCategory();

boost::system::error_code make_error_code(StreamErrc e);

// HTTP status a failure maps to while headers have not been sent yet.
unsigned httpStatusFor(const boost::system::error_code &ec);

namespace boost
{
    namespace system
    {
        template <>
        struct is_error_code_enum<StreamErrc> : std::true_type
        {
        };
    }
}
