// File: seek_prioritizer.hpp
#pragma once
#include "source_handle.hpp"
#include <cstdint>
#include <optional>
#include <string>

struct PiecePlan
{
    uint32_t firstPiece = 0;
    uint32_t count = 0;
};

// Pulls the pieces right after a seek position to the front of the download queue.
class SeekPrioritizer
{
public:
    SeekPrioritizer(uint32_t windowPieces, bool enabled);

    // Window of up to windowPieces pieces starting at the piece holding `start`,
    // never past the file's last piece. Empty for start == 0.
    std::optional<PiecePlan> plan(uint64_t start, const ISourceFile &file) const;

    // Issues the hints. Failures are logged, never thrown. Returns true if hints were sent.
    bool apply(uint64_t start, ISourceFile &file, const std::string &streamId) const;

private:
    uint32_t windowPieces_;
    bool enabled_;
};
