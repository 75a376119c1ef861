// File: seek_prioritizer.cpp
#include "seek_prioritizer.hpp"
#include "logger.hpp"
#include <algorithm>
#include <exception>

SeekPrioritizer::SeekPrioritizer(uint32_t windowPieces, bool enabled)
    : windowPieces_(windowPieces), enabled_(enabled) {}

std::optional<PiecePlan> SeekPrioritizer::plan(uint64_t start, const ISourceFile &file) const
{
    if (!enabled_ || start == 0 || windowPieces_ == 0 || file.pieceLength() == 0 || start >= file.length())
    {
        return std::nullopt;
    }

    uint64_t startPiece = (file.offset() + start) / file.pieceLength();
    uint64_t lastPiece = file.lastPiece();
    if (startPiece > lastPiece)
    {
        return std::nullopt;
    }

    PiecePlan plan;
    plan.firstPiece = static_cast<uint32_t>(startPiece);
    plan.count = static_cast<uint32_t>(std::min<uint64_t>(windowPieces_, lastPiece - startPiece + 1));
    return plan;
}

bool SeekPrioritizer::apply(uint64_t start, ISourceFile &file, const std::string &streamId) const
{
    auto piecePlan = plan(start, file);
    if (!piecePlan)
    {
        return false;
    }

    IPrioritizable *target = file.prioritizable();
    if (!target)
    {
        Logger::Log(LogLevel::DEBUG, "SeekPrioritizer::apply: [" + streamId + "] Source does not support piece hints, skipping.");
        return false;
    }

    try
    {
        target->prioritizePieces(piecePlan->firstPiece, piecePlan->count);
        Logger::Log(LogLevel::DEBUG, "SeekPrioritizer::apply: [" + streamId + "] Prioritized pieces " +
                                         std::to_string(piecePlan->firstPiece) + "-" +
                                         std::to_string(piecePlan->firstPiece + piecePlan->count - 1) +
                                         " for seek to byte " + std::to_string(start));
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::Log(LogLevel::WARN, "SeekPrioritizer::apply: [" + streamId + "] Error prioritizing pieces: " + std::string(e.what()));
    }

    return false;
}
