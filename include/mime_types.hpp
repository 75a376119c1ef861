// File: mime_types.hpp
#pragma once
#include <string>

// Content-Type for a file name by extension, `fallback` when unknown.
std::string resolveContentType(const std::string &fileName, const std::string &fallback = "application/octet-stream");
