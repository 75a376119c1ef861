#include <gtest/gtest.h>
#include "mime_types.hpp"

namespace swarmstream::tests {

#define TEST_CLASS MimeTypes

    TEST(TEST_CLASS, KnownExtensions) {
        EXPECT_EQ(resolveContentType("movie.mp4"), "video/mp4");
        EXPECT_EQ(resolveContentType("Show/S01E01.mkv"), "video/x-matroska");
        EXPECT_EQ(resolveContentType("clip.webm"), "video/webm");
        EXPECT_EQ(resolveContentType("track.flac"), "audio/flac");
        EXPECT_EQ(resolveContentType("subs.vtt"), "text/vtt");
    }

    TEST(TEST_CLASS, ExtensionIsCaseInsensitive) {
        EXPECT_EQ(resolveContentType("MOVIE.MP4"), "video/mp4");
        EXPECT_EQ(resolveContentType("Clip.Mkv"), "video/x-matroska");
    }

    TEST(TEST_CLASS, UnknownFallsBack) {
        EXPECT_EQ(resolveContentType("readme.nfo"), "application/octet-stream");
        EXPECT_EQ(resolveContentType("noextension"), "application/octet-stream");
        EXPECT_EQ(resolveContentType("trailingdot."), "application/octet-stream");
        EXPECT_EQ(resolveContentType("dir.mp4/file"), "application/octet-stream");
        EXPECT_EQ(resolveContentType("data.bin", "application/x-custom"), "application/x-custom");
    }
}
