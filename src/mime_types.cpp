// File: mime_types.cpp
#include "mime_types.hpp"
#include "utils.hpp"
#include <map>

namespace
{
    const std::map<std::string, std::string> &mimeTable()
    {
        static const std::map<std::string, std::string> table{
            {"mp4", "video/mp4"},
            {"m4v", "video/mp4"},
            {"mkv", "video/x-matroska"},
            {"webm", "video/webm"},
            {"avi", "video/x-msvideo"},
            {"mov", "video/quicktime"},
            {"wmv", "video/x-ms-wmv"},
            {"flv", "video/x-flv"},
            {"ts", "video/mp2t"},
            {"mts", "video/mp2t"},
            {"mpg", "video/mpeg"},
            {"mpeg", "video/mpeg"},
            {"ogv", "video/ogg"},
            {"3gp", "video/3gpp"},
            {"mp3", "audio/mpeg"},
            {"m4a", "audio/mp4"},
            {"aac", "audio/aac"},
            {"wav", "audio/wav"},
            {"ogg", "audio/ogg"},
            {"flac", "audio/flac"},
            {"srt", "application/x-subrip"},
            {"vtt", "text/vtt"},
            {"ass", "text/plain"},
            {"jpg", "image/jpeg"},
            {"jpeg", "image/jpeg"},
            {"png", "image/png"},
            {"gif", "image/gif"},
            {"webp", "image/webp"},
        };
        return table;
    }
}

std::string resolveContentType(const std::string &fileName, const std::string &fallback)
{
    auto dot = fileName.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == fileName.size())
    {
        return fallback;
    }

    // Extension of the last path component only
    auto slash = fileName.find_last_of('/');
    if (slash != std::string::npos && slash > dot)
    {
        return fallback;
    }

    auto it = mimeTable().find(to_lower(fileName.substr(dot + 1)));
    return it != mimeTable().end() ? it->second : fallback;
}
