#include <cursor/CursorIcon.hpp>
#include <cursor/XCursorReader.hpp>

#include "../shared/ThemeFixture.hpp"

#include <gtest/gtest.h>

using namespace Kcursor;
using Tests::CThemeFixture;
using Tests::SXImageDesc;

class XCursorReaderTest : public ::testing::Test {
  protected:
    void SetUp() override {
        m_path = (m_fixture.base() / "left_ptr").string();

        // three sizes, 32 is animated
        CThemeFixture::writeXCursor(m_path,
                                    {
                                        SXImageDesc{.size = 24, .width = 24, .height = 24, .xhot = 1, .yhot = 2, .argb = 0xFF102030},
                                        SXImageDesc{.size = 32, .width = 32, .height = 32, .xhot = 3, .yhot = 4, .delay = 50, .argb = 0x80402010},
                                        SXImageDesc{.size = 32, .width = 32, .height = 32, .xhot = 3, .yhot = 4, .delay = 60, .argb = 0xFF000000},
                                        SXImageDesc{.size = 48, .width = 40, .height = 48, .xhot = 5, .yhot = 6},
                                    });
    }

    CThemeFixture m_fixture;
    std::string   m_path;
};

TEST_F(XCursorReaderTest, picksNearestSize) {
    const auto FRAMES = XCursorReader::load(m_path, 30);
    ASSERT_TRUE(FRAMES.has_value());
    ASSERT_EQ(FRAMES->size(), 2u);

    EXPECT_EQ(FRAMES->at(0).size, 32u);
    EXPECT_EQ(FRAMES->at(0).delay, 50u);
    EXPECT_EQ(FRAMES->at(1).size, 32u);
    EXPECT_EQ(FRAMES->at(1).delay, 60u);
}

TEST_F(XCursorReaderTest, exactSize) {
    const auto FRAMES = XCursorReader::load(m_path, 48);
    ASSERT_TRUE(FRAMES.has_value());
    ASSERT_EQ(FRAMES->size(), 1u);

    const auto& F = FRAMES->front();
    EXPECT_EQ(F.size, 48u);
    EXPECT_EQ(F.width, 40u);
    EXPECT_EQ(F.height, 48u);
    EXPECT_EQ(F.xhot, 5u);
    EXPECT_EQ(F.yhot, 6u);
    EXPECT_EQ(F.delay, 0u);
    EXPECT_EQ(F.pixels.size(), 40u * 48u * 4u);
}

TEST_F(XCursorReaderTest, outOfRangeRequestsClamp) {
    auto FRAMES = XCursorReader::load(m_path, 1);
    ASSERT_TRUE(FRAMES.has_value());
    EXPECT_EQ(FRAMES->front().size, 24u);

    FRAMES = XCursorReader::load(m_path, 512);
    ASSERT_TRUE(FRAMES.has_value());
    EXPECT_EQ(FRAMES->front().size, 48u);
}

TEST_F(XCursorReaderTest, tieGoesToFirstInFile) {
    // 28 is 4 away from both 24 and 32
    const auto FRAMES = XCursorReader::load(m_path, 28);
    ASSERT_TRUE(FRAMES.has_value());
    ASSERT_EQ(FRAMES->size(), 1u);
    EXPECT_EQ(FRAMES->front().size, 24u);
}

TEST_F(XCursorReaderTest, convertsToRGBA) {
    const auto FRAMES = XCursorReader::load(m_path, 24);
    ASSERT_TRUE(FRAMES.has_value());

    const auto& PX = FRAMES->front().pixels;
    ASSERT_EQ(PX.size(), 24u * 24u * 4u);
    EXPECT_EQ(PX[0], 0x10);
    EXPECT_EQ(PX[1], 0x20);
    EXPECT_EQ(PX[2], 0x30);
    EXPECT_EQ(PX[3], 0xFF);

    const auto HALF = XCursorReader::load(m_path, 32);
    ASSERT_TRUE(HALF.has_value());
    EXPECT_EQ(HALF->front().pixels[0], 0x40);
    EXPECT_EQ(HALF->front().pixels[1], 0x20);
    EXPECT_EQ(HALF->front().pixels[2], 0x10);
    EXPECT_EQ(HALF->front().pixels[3], 0x80);
}

TEST_F(XCursorReaderTest, repeatableOutput) {
    const CCursorIcon ICON{SXCursorSource{.path = m_path}};

    const auto        A = ICON.frames(32);
    const auto        B = ICON.frames(32);
    ASSERT_TRUE(A.has_value());
    ASSERT_TRUE(B.has_value());
    ASSERT_EQ(A->size(), B->size());
    for (size_t i = 0; i < A->size(); ++i) {
        EXPECT_EQ(A->at(i).pixels, B->at(i).pixels);
    }
}

TEST(XCursorReader, unreadableOrInvalidIsNotFound) {
    CThemeFixture fixture;

    auto          result = XCursorReader::load((fixture.base() / "missing").string(), 24);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().type, FRAMES_ERROR_NOT_FOUND);

    CThemeFixture::writeFile(fixture.base() / "garbage", "this is not an xcursor file");
    result = XCursorReader::load((fixture.base() / "garbage").string(), 24);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().type, FRAMES_ERROR_NOT_FOUND);

    CThemeFixture::writeFile(fixture.base() / "empty", "");
    result = XCursorReader::load((fixture.base() / "empty").string(), 24);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().type, FRAMES_ERROR_NOT_FOUND);
}
