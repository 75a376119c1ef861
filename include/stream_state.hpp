// File: stream_state.hpp
#pragma once
#include <string>

// INIT -> ACTIVE -> one of the four terminal states
enum class StreamState
{
    INIT,
    ACTIVE,
    COMPLETED,
    TIMED_OUT,
    ERRORED,
    DISCONNECTED
};

inline bool isTerminal(StreamState state)
{
    return state != StreamState::INIT && state != StreamState::ACTIVE;
}

inline std::string ToString(StreamState state)
{
    switch (state)
    {
    case StreamState::INIT:
        return "INIT";
    case StreamState::ACTIVE:
        return "ACTIVE";
    case StreamState::COMPLETED:
        return "COMPLETED";
    case StreamState::TIMED_OUT:
        return "TIMED_OUT";
    case StreamState::ERRORED:
        return "ERRORED";
    case StreamState::DISCONNECTED:
        return "DISCONNECTED";
    }
    return "UNKNOWN";
}
