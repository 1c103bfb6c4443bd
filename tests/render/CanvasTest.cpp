#include <gtest/gtest.h>
#include <charta/charta.h>

using namespace charta;

// ============================================================================
// CanvasTest - 문자 캔버스 테스트 (보호 영역, 넓은 글자, 직렬화)
// ============================================================================

// --- Serialization ---

TEST(CanvasTest, BlankCanvas_SerializesToEmptyString) {
    Canvas canvas(4, 3);
    EXPECT_EQ(canvas.toString(), "");
}

TEST(CanvasTest, ToString_TrimsTrailingSpacesAndRows) {
    Canvas canvas(5, 4);
    canvas.set(1, 0, U'a');
    canvas.set(0, 1, U'b');
    canvas.set(3, 1, U'c');

    EXPECT_EQ(canvas.toString(), " a\nb  c");
}

TEST(CanvasTest, ToString_KeepsInteriorBlankRows) {
    Canvas canvas(3, 3);
    canvas.set(0, 0, U'x');
    canvas.set(0, 2, U'y');

    EXPECT_EQ(canvas.toString(), "x\n\ny");
}

TEST(CanvasTest, ToString_NoTrailingNewline) {
    Canvas canvas(2, 2);
    canvas.set(0, 1, U'─');

    std::string out = canvas.toString();
    ASSERT_FALSE(out.empty());
    EXPECT_NE(out.back(), '\n');
    EXPECT_EQ(out, "\n─");
}

// --- Cell access ---

TEST(CanvasTest, OutOfBounds_IgnoredAndBlank) {
    Canvas canvas(2, 2);

    EXPECT_FALSE(canvas.set(5, 0, U'x'));
    EXPECT_FALSE(canvas.set(-1, 0, U'x'));
    EXPECT_EQ(canvas.at(9, 9), Canvas::BLANK);
}

TEST(CanvasTest, NegativeSize_Throws) {
    EXPECT_THROW(Canvas(-1, 3), std::invalid_argument);
}

// --- Protection ---

TEST(CanvasTest, ProtectedCells_RefuseDraw) {
    Canvas canvas(5, 5);
    canvas.protect({1, 1, 2, 2});

    EXPECT_TRUE(canvas.isProtected(1, 1));
    EXPECT_TRUE(canvas.isProtected(2, 2));
    EXPECT_FALSE(canvas.isProtected(3, 3));

    EXPECT_FALSE(canvas.draw(1, 1, U'│'));
    EXPECT_EQ(canvas.at(1, 1), Canvas::BLANK);
    EXPECT_TRUE(canvas.draw(0, 0, U'│'));
}

TEST(CanvasTest, Set_IgnoresProtection) {
    Canvas canvas(3, 3);
    canvas.protect({0, 0, 3, 3});

    EXPECT_TRUE(canvas.set(1, 1, U'x'));
    EXPECT_EQ(canvas.at(1, 1), U'x');
}

// --- Text ---

TEST(CanvasTest, WriteText_ReturnsDisplayWidth) {
    Canvas canvas(10, 1);

    EXPECT_EQ(canvas.writeText(1, 0, "abc"), 3);
    EXPECT_EQ(canvas.toString(), " abc");
}

TEST(CanvasTest, WideGlyph_OccupiesTwoCells) {
    Canvas canvas(6, 1);

    EXPECT_EQ(canvas.writeText(0, 0, "한x"), 3);
    EXPECT_EQ(canvas.at(0, 0), U'한');
    EXPECT_EQ(canvas.at(1, 0), Canvas::CONTINUATION);
    EXPECT_EQ(canvas.at(2, 0), U'x');
    EXPECT_EQ(canvas.toString(), "한x");
}

TEST(CanvasTest, OverwritingHalfOfWideGlyph_BlanksOtherHalf) {
    Canvas canvas(4, 1);
    canvas.writeText(0, 0, "한");

    canvas.set(1, 0, U'-');

    EXPECT_EQ(canvas.at(0, 0), Canvas::BLANK);
    EXPECT_EQ(canvas.toString(), " -");
}

TEST(CanvasTest, WriteText_RespectsProtection) {
    Canvas canvas(6, 1);
    canvas.protect({2, 0, 1, 1});

    canvas.writeText(0, 0, "abcd", true);

    EXPECT_EQ(canvas.at(2, 0), Canvas::BLANK);
    EXPECT_EQ(canvas.toString(), "ab d");
}
