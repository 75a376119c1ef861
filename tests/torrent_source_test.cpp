#include <gtest/gtest.h>
#include "stream_errors.hpp"
#include "torrent_fixtures.hpp"
#include <thread>

namespace swarmstream::tests {

#define TEST_CLASS TorrentSource

    namespace {
        struct Collected
        {
            std::vector<char> bytes;
            std::vector<size_t> chunks;
            boost::system::error_code ec;
            bool done = false;
        };

        // Reads until the stream reports an error or end of file
        void readAll(IReadStream &stream, std::shared_ptr<Collected> out, size_t maxBytes)
        {
            stream.asyncRead(maxBytes, [&stream, out, maxBytes](const boost::system::error_code &ec, ByteChunk chunk)
                             {
                                 if (ec)
                                 {
                                     out->ec = ec;
                                     out->done = true;
                                     return;
                                 }
                                 out->bytes.insert(out->bytes.end(), chunk->begin(), chunk->end());
                                 out->chunks.push_back(chunk->size());
                                 readAll(stream, out, maxBytes); });
        }

        class TorrentSourceFixture : public ::testing::Test
        {
        protected:
            void SetUp() override
            {
                lt::add_torrent_params params;
                params.ti = std::make_shared<lt::torrent_info>(*pack.info);
                params.save_path = dir.path().string();
                params.flags |= lt::torrent_flags::seed_mode;
                params.flags &= ~lt::torrent_flags::paused;
                params.flags &= ~lt::torrent_flags::auto_managed;
                handle = session.add_torrent(std::move(params));

                auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
                while (!handle.status().is_seeding && std::chrono::steady_clock::now() < deadline)
                {
                    std::vector<lt::alert *> alerts;
                    session.pop_alerts(&alerts);
                    std::this_thread::sleep_for(std::chrono::milliseconds(10));
                }
                ASSERT_TRUE(handle.status().is_seeding);
            }

            // Forwards read_piece_alert to the dispatcher and runs posted handlers
            template <typename Predicate>
            bool pumpUntil(Predicate predicate)
            {
                auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
                while (!predicate())
                {
                    if (std::chrono::steady_clock::now() > deadline)
                        return false;
                    session.wait_for_alert(std::chrono::milliseconds(10));
                    std::vector<lt::alert *> alerts;
                    session.pop_alerts(&alerts);
                    for (lt::alert *alert : alerts)
                    {
                        if (auto *piece = lt::alert_cast<lt::read_piece_alert>(alert))
                            dispatcher->onReadPiece(infoHashHex(piece->handle.info_hashes()), *piece);
                    }
                    ioc.restart();
                    ioc.poll();
                }
                return true;
            }

            std::unique_ptr<TorrentReadStream> openStream(int fileIndex, uint64_t start, uint64_t end, const std::string &sourceId = "")
            {
                return std::make_unique<TorrentReadStream>(ioc, handle, pack.info, sourceId.empty() ? pack.id : sourceId,
                                                           fileIndex, start, end, dispatcher, 1000);
            }

            std::string payload(uint64_t absoluteStart, uint64_t absoluteEnd) const
            {
                return std::string(pack.payload.begin() + static_cast<std::ptrdiff_t>(absoluteStart),
                                   pack.payload.begin() + static_cast<std::ptrdiff_t>(absoluteEnd) + 1);
            }

            TempDir dir;
            PackTorrent pack{dir};
            boost::asio::io_context ioc;
            lt::session session{offlineSettings()};
            lt::torrent_handle handle;
            std::shared_ptr<PieceDispatcher> dispatcher = std::make_shared<PieceDispatcher>();
        };
    }

    TEST_F(TorrentSourceFixture, SlicesReadsAtPieceBoundaries) {
        // b.bin starts at byte 20000, so [10000, 30000] spans pieces 1 to 3
        auto stream = openStream(1, 10000, 30000);
        auto out = std::make_shared<Collected>();
        readAll(*stream, out, 64 * 1024);

        ASSERT_TRUE(pumpUntil([&out]()
                              { return out->done; }));
        EXPECT_EQ(out->ec, boost::system::error_code(boost::asio::error::eof));
        EXPECT_EQ(out->chunks, (std::vector<size_t>{2768, 16384, 849}));
        EXPECT_EQ(std::string(out->bytes.begin(), out->bytes.end()), payload(30000, 50000));
        EXPECT_EQ(dispatcher->waiterCount(), 0u);
    }

    TEST_F(TorrentSourceFixture, CachedPieceServesFollowUpReads) {
        auto stream = openStream(0, 0, PackTorrent::PieceLength - 1);

        ByteChunk first;
        stream->asyncRead(4096, [&first](const boost::system::error_code &ec, ByteChunk chunk)
                          { ASSERT_FALSE(ec); first = chunk; });
        EXPECT_EQ(dispatcher->waiterCount(), 1u);
        ASSERT_TRUE(pumpUntil([&first]()
                              { return first != nullptr; }));

        ByteChunk second;
        stream->asyncRead(4096, [&second](const boost::system::error_code &ec, ByteChunk chunk)
                          { ASSERT_FALSE(ec); second = chunk; });
        // Same piece: no new request
        EXPECT_EQ(dispatcher->waiterCount(), 0u);
        ioc.restart();
        ioc.poll();

        ASSERT_TRUE(second);
        EXPECT_EQ(std::string(first->begin(), first->end()), payload(0, 4095));
        EXPECT_EQ(std::string(second->begin(), second->end()), payload(4096, 8191));
    }

    TEST_F(TorrentSourceFixture, ReadersOfOnePieceShareOneRequest) {
        auto a = openStream(0, 0, 99);
        auto b = openStream(0, 200, 299);

        ByteChunk fromA;
        ByteChunk fromB;
        a->asyncRead(1024, [&fromA](const boost::system::error_code &, ByteChunk chunk)
                     { fromA = chunk; });
        b->asyncRead(1024, [&fromB](const boost::system::error_code &, ByteChunk chunk)
                     { fromB = chunk; });
        EXPECT_EQ(dispatcher->waiterCount(), 2u);

        ASSERT_TRUE(pumpUntil([&]()
                              { return fromA && fromB; }));
        EXPECT_EQ(std::string(fromA->begin(), fromA->end()), payload(0, 99));
        EXPECT_EQ(std::string(fromB->begin(), fromB->end()), payload(200, 299));
        EXPECT_EQ(dispatcher->waiterCount(), 0u);
    }

    TEST_F(TorrentSourceFixture, ClosedStreamNeverCallsBack) {
        auto a = openStream(0, 0, 99);
        auto b = openStream(0, 200, 299);

        bool aDone = false;
        bool bCalled = false;
        a->asyncRead(1024, [&](const boost::system::error_code &, ByteChunk)
                     {
                         aDone = true;
                         b->close(); });
        b->asyncRead(1024, [&bCalled](const boost::system::error_code &, ByteChunk)
                     { bCalled = true; });

        ASSERT_TRUE(pumpUntil([&aDone]()
                              { return aDone; }));
        ioc.restart();
        ioc.poll();
        EXPECT_FALSE(bCalled);
    }

    TEST_F(TorrentSourceFixture, CancelFromEarlierHandlerSkipsWaiter) {
        uint64_t second = 0;
        int firstCalls = 0;
        int secondCalls = 0;
        std::shared_ptr<const std::vector<char>> again;

        dispatcher->request(pack.id, handle, lt::piece_index_t(0), 1000,
                            [&](const boost::system::error_code &ec, std::shared_ptr<const std::vector<char>> piece)
                            {
                                ASSERT_FALSE(ec);
                                ASSERT_TRUE(piece);
                                ++firstCalls;
                                dispatcher->cancel(second);
                                // Asking again starts a fresh request for the same piece
                                dispatcher->request(pack.id, handle, lt::piece_index_t(0), 1000,
                                                    [&again](const boost::system::error_code &, std::shared_ptr<const std::vector<char>> data)
                                                    { again = data; });
                            });
        second = dispatcher->request(pack.id, handle, lt::piece_index_t(0), 1000,
                                     [&secondCalls](const boost::system::error_code &, std::shared_ptr<const std::vector<char>>)
                                     { ++secondCalls; });
        EXPECT_EQ(dispatcher->waiterCount(), 2u);

        ASSERT_TRUE(pumpUntil([&firstCalls]()
                              { return firstCalls == 1; }));
        EXPECT_EQ(secondCalls, 0);
        EXPECT_EQ(dispatcher->waiterCount(), 1u);

        ASSERT_TRUE(pumpUntil([&again]()
                              { return again != nullptr; }));
        EXPECT_EQ(again->size(), static_cast<size_t>(PackTorrent::PieceLength));
        EXPECT_EQ(secondCalls, 0);
        EXPECT_EQ(dispatcher->waiterCount(), 0u);
    }

    TEST_F(TorrentSourceFixture, FailSourceFailsOnlyItsReaders) {
        const std::string other = "feedfacefeedfacefeedfacefeedfacefeedface";
        auto failing = openStream(0, 0, 99, other);
        auto healthy = openStream(0, 0, 99);

        boost::system::error_code failedWith;
        bool failedCalled = false;
        ByteChunk fromHealthy;
        failing->asyncRead(1024, [&](const boost::system::error_code &ec, ByteChunk chunk)
                           {
                               failedCalled = true;
                               failedWith = ec;
                               EXPECT_FALSE(chunk); });
        healthy->asyncRead(1024, [&fromHealthy](const boost::system::error_code &, ByteChunk chunk)
                           { fromHealthy = chunk; });
        EXPECT_EQ(dispatcher->waiterCount(), 2u);

        dispatcher->failSource(other, make_error_code(StreamErrc::transfer_failed));
        EXPECT_EQ(dispatcher->waiterCount(), 1u);

        ASSERT_TRUE(pumpUntil([&]()
                              { return failedCalled && fromHealthy; }));
        EXPECT_EQ(failedWith, make_error_code(StreamErrc::transfer_failed));
        EXPECT_EQ(std::string(fromHealthy->begin(), fromHealthy->end()), payload(0, 99));
    }

    TEST_F(TorrentSourceFixture, InvalidHandleFailsTheRead) {
        TorrentReadStream stream(ioc, lt::torrent_handle{}, pack.info, pack.id, 0, 0, 99, dispatcher, 1000);

        bool called = false;
        boost::system::error_code result;
        stream.asyncRead(1024, [&](const boost::system::error_code &ec, ByteChunk)
                         {
                             called = true;
                             result = ec; });
        EXPECT_EQ(dispatcher->waiterCount(), 0u);

        ioc.restart();
        ioc.poll();
        ASSERT_TRUE(called);
        EXPECT_EQ(result, make_error_code(StreamErrc::transfer_failed));
    }

    TEST_F(TorrentSourceFixture, ExposesFileGeometryAfterMetadata) {
        TorrentConfig config = offlineTorrentConfig(dir);
        TorrentSource source(ioc, handle, pack.id, dispatcher, config);

        EXPECT_FALSE(source.hasMetadata());
        EXPECT_EQ(source.fileCount(), 0u);
        EXPECT_EQ(source.name(), pack.id);

        source.onMetadata();
        ASSERT_TRUE(source.hasMetadata());
        EXPECT_EQ(source.name(), "pack");
        ASSERT_EQ(source.fileCount(), 2u);
        EXPECT_EQ(source.file(2), nullptr);

        auto first = source.file(0);
        EXPECT_EQ(first->firstPiece(), 0u);
        EXPECT_EQ(first->lastPiece(), 1u);

        auto second = source.file(1);
        EXPECT_EQ(second, source.file(1));
        EXPECT_EQ(second->name(), "pack/b.bin");
        EXPECT_EQ(second->length(), PackTorrent::SecondSize);
        EXPECT_EQ(second->offset(), PackTorrent::FirstSize);
        EXPECT_EQ(second->pieceLength(), static_cast<uint64_t>(PackTorrent::PieceLength));
        EXPECT_EQ(second->firstPiece(), 1u);
        EXPECT_EQ(second->lastPiece(), 3u);
        EXPECT_NE(second->prioritizable(), nullptr);

        EXPECT_THROW(second->openReadStream(0, PackTorrent::SecondSize), std::out_of_range);
        EXPECT_THROW(second->openReadStream(10, 5), std::out_of_range);
        EXPECT_NO_THROW(second->openReadStream(0, PackTorrent::SecondSize - 1));
    }
}
