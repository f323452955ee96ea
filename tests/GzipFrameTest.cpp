#include <gtest/gtest.h>

#include <stdint.h>
#include <string>

#include "GzipFrame.h"

// Fixed header with the given FLG byte, mtime 0, XFL 0, OS 3 (unix).
static std::string gz_header(uint8_t flags, uint8_t method = 8)
{
    const char h[] = {'\x1f', '\x8b', (char)method, (char)flags, 0, 0, 0, 0, 0, 3};
    return std::string(h, sizeof(h));
}

// CRC32 (not checked here) plus little-endian ISIZE.
static std::string gz_trailer(uint32_t isize)
{
    std::string t(4, '\0');
    for (int i = 0; i < 4; ++i) t.push_back((char)((isize >> (8 * i)) & 0xff));
    return t;
}

static const std::string DEFLATE_DATA("\x4b\x4c\x4a\x06\x00", 5);   // raw deflate of "abc"

TEST(GzipFrameTest, PlainHeader)
{
    const std::string in = gz_header(0) + DEFLATE_DATA + gz_trailer(3);
    GzipFrame f;
    std::string err;
    ASSERT_TRUE(gzip_frame(in, f, err)) << err;
    EXPECT_EQ(10u, f.dataOffset);
    EXPECT_EQ(DEFLATE_DATA.size(), f.dataLen);
    EXPECT_EQ(3u, f.isize);
    EXPECT_EQ(DEFLATE_DATA, in.substr(f.dataOffset, f.dataLen));
}

TEST(GzipFrameTest, SkipsFileName)
{
    const std::string name("now.json\0", 9);
    const std::string in = gz_header(0x08) + name + DEFLATE_DATA + gz_trailer(3);
    GzipFrame f;
    std::string err;
    ASSERT_TRUE(gzip_frame(in, f, err)) << err;
    EXPECT_EQ(19u, f.dataOffset);
    EXPECT_EQ(DEFLATE_DATA, in.substr(f.dataOffset, f.dataLen));
}

TEST(GzipFrameTest, SkipsExtraField)
{
    const std::string extra("\x03\x00xyz", 5);
    const std::string in = gz_header(0x04) + extra + DEFLATE_DATA + gz_trailer(3);
    GzipFrame f;
    std::string err;
    ASSERT_TRUE(gzip_frame(in, f, err)) << err;
    EXPECT_EQ(15u, f.dataOffset);
    EXPECT_EQ(DEFLATE_DATA, in.substr(f.dataOffset, f.dataLen));
}

TEST(GzipFrameTest, SkipsEveryOptionalField)
{
    const std::string fields("\x02\x00qq" "a\0" "b\0" "\xaa\xbb", 10);
    const std::string in = gz_header(0x1e) + fields + DEFLATE_DATA + gz_trailer(3);
    GzipFrame f;
    std::string err;
    ASSERT_TRUE(gzip_frame(in, f, err)) << err;
    EXPECT_EQ(20u, f.dataOffset);
    EXPECT_EQ(DEFLATE_DATA, in.substr(f.dataOffset, f.dataLen));
}

TEST(GzipFrameTest, UnterminatedFileNameIsTruncated)
{
    const std::string in = gz_header(0x08) + "no-terminator-here" + gz_trailer(3);
    GzipFrame f;
    std::string err;
    EXPECT_FALSE(gzip_frame(in, f, err));
    EXPECT_EQ("truncated gzip header", err);
}

TEST(GzipFrameTest, ExtraLengthPastEndIsTruncated)
{
    const std::string in = gz_header(0x04) + std::string("\xff\x00", 2) + DEFLATE_DATA + gz_trailer(3);
    GzipFrame f;
    std::string err;
    EXPECT_FALSE(gzip_frame(in, f, err));
    EXPECT_EQ("truncated gzip header", err);
}

TEST(GzipFrameTest, HeaderWithoutDataIsTruncated)
{
    const std::string in = gz_header(0) + gz_trailer(3);
    GzipFrame f;
    std::string err;
    EXPECT_FALSE(gzip_frame(in, f, err));
    EXPECT_EQ("truncated gzip header", err);
}

TEST(GzipFrameTest, RejectsNonGzip)
{
    GzipFrame f;
    std::string err;

    EXPECT_FALSE(gzip_frame("{\"code\":\"200\",\"now\":{}}", f, err));
    EXPECT_EQ("not a deflate gzip stream", err);

    // right magic, too short for header plus trailer
    EXPECT_FALSE(gzip_frame(std::string("\x1f\x8b\x08\x00", 4), f, err));

    // compression method other than deflate
    EXPECT_FALSE(gzip_frame(gz_header(0, 7) + DEFLATE_DATA + gz_trailer(3), f, err));
    EXPECT_EQ("not a deflate gzip stream", err);

    EXPECT_FALSE(looks_gzip(""));
    EXPECT_TRUE(looks_gzip(gz_header(0) + gz_trailer(0)));
}

TEST(GzipFrameTest, InflatedSizeBounds)
{
    GzipFrame f;
    std::string err;

    EXPECT_FALSE(gzip_frame(gz_header(0) + DEFLATE_DATA + gz_trailer(0), f, err));
    EXPECT_EQ("inflated size 0 out of range", err);

    EXPECT_FALSE(gzip_frame(gz_header(0) + DEFLATE_DATA + gz_trailer(GZIP_MAX_INFLATED + 1), f, err));
    EXPECT_NE(std::string::npos, err.find("out of range"));

    EXPECT_FALSE(gzip_frame(gz_header(0) + DEFLATE_DATA + gz_trailer(0xffffffffu), f, err));

    ASSERT_TRUE(gzip_frame(gz_header(0) + DEFLATE_DATA + gz_trailer(GZIP_MAX_INFLATED), f, err)) << err;
    EXPECT_EQ(GZIP_MAX_INFLATED, f.isize);
}
