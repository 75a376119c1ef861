// File: range_interpreter.hpp
#pragma once
#include <cstdint>
#include <optional>
#include <string>

// Byte interval [start, end] of a file of `total` bytes. For an empty file
// the window is empty (length() == 0).
struct RangeWindow
{
    uint64_t start = 0;
    uint64_t end = 0;
    uint64_t total = 0;
    bool isPartial = false;      // a Range header was present and honoured
    bool isInitialChunk = false; // header-less request bounded to the first chunk

    uint64_t length() const
    {
        return total == 0 ? 0 : end - start + 1;
    }

    unsigned status() const
    {
        return (isPartial || isInitialChunk) ? 206 : 200;
    }
};

struct RangeOptions
{
    uint64_t maxChunkSize = 1024 * 1024;
};

struct RangeOutcome
{
    RangeWindow window;
    bool headerPresent = false;
    bool malformed = false; // header present but unusable; window is the default one
};

// Never throws. A malformed or unsatisfiable header degrades to defaultWindow().
RangeOutcome interpretRange(const std::optional<std::string> &rangeHeader, uint64_t fileLength, const RangeOptions &options);

// Whole file when it fits in one chunk, otherwise the first maxChunkSize bytes.
RangeWindow defaultWindow(uint64_t fileLength, const RangeOptions &options);

// "bytes <start>-<end>/<total>"
std::string contentRangeValue(const RangeWindow &window);

// "bytes */<total>", sent with 416
std::string unsatisfiedRangeValue(uint64_t total);
