#include "parser/CellContent.hpp"

#include <gtest/gtest.h>

using TableScrape::CellContent;

TEST(CellContentTest, MeaningfulTagSet) {
    for (const char* tag : {"div", "span", "a", "p", "strong", "em", "b", "i"}) {
        EXPECT_TRUE(CellContent::isMeaningfulTag(tag)) << tag;
    }
    for (const char* tag : {"td", "br", "img", "u", "table", "DIV"}) {
        EXPECT_FALSE(CellContent::isMeaningfulTag(tag)) << tag;
    }
}

TEST(CellContentTest, DirectTextIsTrimmed) {
    CellContent cell;
    cell.appendText("  Los Angeles \n");
    EXPECT_EQ(cell.resolve(), "Los Angeles");
}

TEST(CellContentTest, EmptyCellResolvesToEmptyString) {
    CellContent cell;
    EXPECT_EQ(cell.resolve(), "");
}

TEST(CellContentTest, NestedElementWinsOverDirectText) {
    CellContent cell;
    cell.appendText("Prefix ");
    cell.openElement("span");
    cell.appendText(" Value ");
    cell.closeElement("span");
    cell.appendText(" suffix");
    EXPECT_TRUE(cell.hasCapture());
    EXPECT_EQ(cell.resolve(), "Value");
}

TEST(CellContentTest, FirstSiblingWins) {
    CellContent cell;
    cell.openElement("div");
    cell.appendText("30");
    cell.closeElement("div");
    cell.openElement("div");
    cell.appendText("thirty");
    cell.closeElement("div");
    EXPECT_EQ(cell.resolve(), "30");
}

TEST(CellContentTest, CaptureIncludesNestedChildren) {
    CellContent cell;
    cell.openElement("div");
    cell.appendText("Outer ");
    cell.openElement("b");
    cell.appendText("bold");
    cell.closeElement("b");
    EXPECT_TRUE(cell.isCapturing());
    cell.appendText(" text");
    cell.closeElement("div");
    EXPECT_FALSE(cell.isCapturing());
    EXPECT_EQ(cell.resolve(), "Outer bold text");
}

TEST(CellContentTest, BlankFirstElementRearmsCapture) {
    CellContent cell;
    cell.openElement("span");
    cell.appendText("  ");
    cell.closeElement("span");
    EXPECT_FALSE(cell.hasCapture());
    cell.openElement("b");
    cell.appendText("Real");
    cell.closeElement("b");
    EXPECT_EQ(cell.resolve(), "Real");
}

TEST(CellContentTest, CaptureStillOpenAtCellEnd) {
    CellContent cell;
    cell.appendText("raw ");
    cell.openElement("a");
    cell.appendText("link");
    EXPECT_TRUE(cell.isCapturing());
    EXPECT_EQ(cell.resolve(), "link");
}

TEST(CellContentTest, ClosingOuterElementPopsInnerOnes) {
    CellContent cell;
    cell.openElement("div");
    cell.openElement("span");
    cell.openElement("em");
    EXPECT_EQ(cell.openElementCount(), 3u);
    cell.appendText("deep");
    cell.closeElement("div");
    EXPECT_EQ(cell.openElementCount(), 0u);
    EXPECT_EQ(cell.resolve(), "deep");
}

TEST(CellContentTest, UnmatchedCloseIsIgnored) {
    CellContent cell;
    cell.openElement("span");
    cell.appendText("kept");
    cell.closeElement("div");
    EXPECT_EQ(cell.openElementCount(), 1u);
    EXPECT_TRUE(cell.isCapturing());
    cell.closeElement("span");
    EXPECT_EQ(cell.resolve(), "kept");
}

TEST(CellContentTest, RawFallbackCollectsAllText) {
    CellContent cell;
    cell.appendText(" a ");
    cell.openElement("span");
    cell.closeElement("span");
    cell.appendText(" b ");
    EXPECT_EQ(cell.resolve(), "a  b");
}

// The capture belongs to the first meaningful element as a whole: text after a
// nested child closes still counts until that element itself closes.
TEST(CellContentTest, CaptureEndsWhenFirstElementCloses) {
    CellContent cell;
    cell.openElement("div");
    cell.openElement("span");
    cell.appendText("X");
    cell.closeElement("span");
    EXPECT_TRUE(cell.isCapturing());
    cell.appendText("Y");
    cell.closeElement("div");
    EXPECT_EQ(cell.resolve(), "XY");
}
