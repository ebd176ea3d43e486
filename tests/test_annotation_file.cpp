#include <gtest/gtest.h>

#include "annotation_file.hpp"
#include "test_support.hpp"

using namespace tei_standoff;
using tei_standoff::testing::TempDir;

TEST(AnnotationFileTest, RoundTripPreservesOrderAndValues) {
    TempDir dir;
    const std::vector<AnnotationEntry> entries = {
        {"w:b-c", "second"},
        {"w:a-b", ""},
        {"w:c-d", "back\\slash"},
        {"w:d-e", "two\nlines"},
        {"w:e-f", "with spaces and \\n literal"},
    };

    Error error;
    ASSERT_TRUE(write_annotation(dir / "nested" / "w", entries, error)) << error.message;

    std::vector<AnnotationEntry> read;
    ASSERT_TRUE(read_annotation(dir / "nested" / "w", read, error)) << error.message;
    EXPECT_EQ(read, entries);
}

TEST(AnnotationFileTest, FileIsLineOriented) {
    TempDir dir;
    Error error;
    ASSERT_TRUE(write_annotation(dir / "a", {{"k", "x\ny\\z"}}, error));
    EXPECT_EQ(tei_standoff::testing::read_file(dir / "a"), "k x\\ny\\\\z\n");
}

TEST(AnnotationFileTest, SplitsOnFirstDelimiterOnly) {
    TempDir dir;
    tei_standoff::testing::write_file(dir / "a", "key some value here\n");

    std::vector<AnnotationEntry> read;
    Error error;
    ASSERT_TRUE(read_annotation(dir / "a", read, error));
    ASSERT_EQ(read.size(), 1u);
    EXPECT_EQ(read[0].first, "key");
    EXPECT_EQ(read[0].second, "some value here");
}

TEST(AnnotationFileTest, LineWithoutDelimiterIsCorrupt) {
    TempDir dir;
    tei_standoff::testing::write_file(dir / "a", "good value\nbroken\n");

    std::vector<AnnotationEntry> read;
    Error error;
    EXPECT_FALSE(read_annotation(dir / "a", read, error));
    EXPECT_EQ(error.kind, ErrorKind::CorruptAnnotation);
    EXPECT_NE(error.message.find("line 2"), std::string::npos);
}

TEST(AnnotationFileTest, MissingFileIsIoError) {
    TempDir dir;
    std::vector<AnnotationEntry> read;
    Error error;
    EXPECT_FALSE(read_annotation(dir / "missing", read, error));
    EXPECT_EQ(error.kind, ErrorKind::Io);
}

TEST(AnnotationStoreTest, SetReplacesInPlace) {
    AnnotationStore store;
    store.set("a", "1");
    store.set("b", "2");
    store.set("a", "3");

    ASSERT_EQ(store.size(), 2u);
    EXPECT_EQ(store.entries()[0], (AnnotationEntry{"a", "3"}));
    EXPECT_EQ(store.entries()[1], (AnnotationEntry{"b", "2"}));
    ASSERT_NE(store.find("b"), nullptr);
    EXPECT_EQ(*store.find("b"), "2");
    EXPECT_EQ(store.find("c"), nullptr);
}

TEST(AnnotationEscapeTest, UnescapeInvertsEscape) {
    for (const std::string value : {"", "\\", "\\n", "\n\\\n", "a\\\\nb"}) {
        EXPECT_EQ(unescape_annotation_value(escape_annotation_value(value)), value);
    }
}
