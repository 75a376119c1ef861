// File: range_interpreter.cpp
#include "range_interpreter.hpp"
#include "utils.hpp"
#include <algorithm>
#include <string_view>

namespace
{
    // Last byte of a window of at most `chunk` bytes starting at `start`, without overflow.
    uint64_t clampedEnd(uint64_t start, uint64_t fileLength, uint64_t chunk)
    {
        uint64_t remaining = fileLength - 1 - start;
        return start + std::min(remaining, chunk - 1);
    }

    struct ParsedSpec
    {
        uint64_t start = 0;
        std::optional<uint64_t> end;
    };

    std::optional<ParsedSpec> parseSpec(const std::string &header)
    {
        std::string value = trim(header);
        constexpr std::string_view unit = "bytes=";
        if (value.size() < unit.size() || to_lower(value.substr(0, unit.size())) != unit)
            return std::nullopt;

        std::string spec = value.substr(unit.size());
        if (spec.find(',') != std::string::npos)
            return std::nullopt; // multiple ranges are not served

        auto dash = spec.find('-');
        if (dash == std::string::npos)
            return std::nullopt;

        // Suffix ranges ("-500") have no start and are treated as malformed
        auto start = parse_u64(trim(spec.substr(0, dash)));
        if (!start)
            return std::nullopt;

        ParsedSpec parsed;
        parsed.start = *start;

        std::string endText = trim(spec.substr(dash + 1));
        if (!endText.empty())
        {
            auto end = parse_u64(endText);
            if (!end)
                return std::nullopt;
            parsed.end = *end;
        }

        return parsed;
    }
}

RangeWindow defaultWindow(uint64_t fileLength, const RangeOptions &options)
{
    RangeWindow window;
    window.total = fileLength;
    if (fileLength == 0)
    {
        return window;
    }

    window.start = 0;
    window.end = clampedEnd(0, fileLength, options.maxChunkSize);
    window.isInitialChunk = window.end < fileLength - 1;
    return window;
}

RangeOutcome interpretRange(const std::optional<std::string> &rangeHeader, uint64_t fileLength, const RangeOptions &options)
{
    RangeOutcome outcome;
    outcome.headerPresent = rangeHeader.has_value();

    if (!rangeHeader)
    {
        outcome.window = defaultWindow(fileLength, options);
        return outcome;
    }

    auto parsed = parseSpec(*rangeHeader);
    bool valid = parsed && fileLength > 0 && parsed->start < fileLength;
    if (valid && parsed->end)
    {
        valid = *parsed->end < fileLength && parsed->start <= *parsed->end;
    }

    if (!valid)
    {
        outcome.malformed = true;
        outcome.window = defaultWindow(fileLength, options);
        return outcome;
    }

    RangeWindow &window = outcome.window;
    window.total = fileLength;
    window.start = parsed->start;
    // An explicit closed range is honoured even beyond maxChunkSize
    window.end = parsed->end ? *parsed->end : clampedEnd(parsed->start, fileLength, options.maxChunkSize);
    window.isPartial = true;
    return outcome;
}

std::string contentRangeValue(const RangeWindow &window)
{
    return "bytes " + std::to_string(window.start) + "-" + std::to_string(window.end) + "/" + std::to_string(window.total);
}

std::string unsatisfiedRangeValue(uint64_t total)
{
    return "bytes */" + std::to_string(total);
}
