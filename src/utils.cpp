#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

// Function to trim leading and trailing whitespace from a string
std::string trim(const std::string &str)
{
    auto start = str.begin();
    while (start != str.end() && std::isspace(static_cast<unsigned char>(*start)))
        start++;

    auto end = str.end();
    while (end != start && std::isspace(static_cast<unsigned char>(*(end - 1))))
        end--;

    return std::string(start, end);
}

std::string to_lower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return value;
}

static int hex_value(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

std::optional<std::string> url_decode(std::string_view encoded)
{
    std::string decoded;
    decoded.reserve(encoded.size());

    for (size_t i = 0; i < encoded.size(); ++i)
    {
        char c = encoded[i];
        if (c == '%')
        {
            if (i + 2 >= encoded.size())
                return std::nullopt;

            int hi = hex_value(encoded[i + 1]);
            int lo = hex_value(encoded[i + 2]);
            if (hi < 0 || lo < 0)
                return std::nullopt;

            decoded.push_back(static_cast<char>((hi << 4) | lo));
            i += 2;
        }
        else
        {
            decoded.push_back(c);
        }
    }

    return decoded;
}

std::optional<uint64_t> parse_u64(std::string_view text)
{
    if (text.empty())
        return std::nullopt;

    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size())
        return std::nullopt;

    return value;
}
