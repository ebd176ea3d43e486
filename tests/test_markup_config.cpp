#include <gtest/gtest.h>

#include "markup_config.hpp"

using namespace tei_standoff;

TEST(MarkupConfigTest, BuildsAnnotationGroups) {
    MarkupConfigSpec spec;
    spec.elements = {"s", "W+Lw", "w:POS+lw:pos"};
    spec.annotations = {"sentence", "token", "pos"};

    MarkupConfig config;
    Error error;
    ASSERT_TRUE(build_markup_config(spec, config, error)) << error.message;

    ASSERT_NE(config.annotation_for("s", ""), nullptr);
    EXPECT_EQ(*config.annotation_for("s", ""), "sentence");
    EXPECT_EQ(*config.annotation_for("w", ""), "token");
    EXPECT_EQ(*config.annotation_for("lw", ""), "token");
    EXPECT_EQ(*config.annotation_for("lw", "pos"), "pos");
    EXPECT_EQ(config.annotation_for("w", "lemma"), nullptr);
    EXPECT_EQ(config.annotation_names, (std::vector<std::string>{"sentence", "token", "pos"}));
    EXPECT_EQ(config.header_element, kDefaultHeaderElement);
}

TEST(MarkupConfigTest, SharedAnnotationNameListedOnce) {
    MarkupConfigSpec spec;
    spec.elements = {"w", "lw"};
    spec.annotations = {"token", "token"};

    MarkupConfig config;
    Error error;
    ASSERT_TRUE(build_markup_config(spec, config, error));
    EXPECT_EQ(config.annotation_names, (std::vector<std::string>{"token"}));
}

TEST(MarkupConfigTest, SkipAndAnnotateMustBeDisjoint) {
    MarkupConfigSpec spec;
    spec.elements = {"w+s"};
    spec.annotations = {"token"};
    spec.skip = {"note", "s"};

    MarkupConfig config;
    Error error;
    EXPECT_FALSE(build_markup_config(spec, config, error));
    EXPECT_EQ(error.kind, ErrorKind::InvalidConfiguration);
    EXPECT_NE(error.message.find("disjoint"), std::string::npos);
}

TEST(MarkupConfigTest, LengthMismatchIsRejected) {
    MarkupConfigSpec spec;
    spec.elements = {"w", "s"};
    spec.annotations = {"token"};

    MarkupConfig config;
    Error error;
    EXPECT_FALSE(build_markup_config(spec, config, error));
    EXPECT_EQ(error.kind, ErrorKind::InvalidConfiguration);
}

TEST(MarkupConfigTest, OverlapGroupsPermitEveryPair) {
    MarkupConfigSpec spec;
    spec.overlap = {"p+S+page"};

    MarkupConfig config;
    Error error;
    ASSERT_TRUE(build_markup_config(spec, config, error));
    EXPECT_TRUE(config.overlap_permitted("p", "s"));
    EXPECT_TRUE(config.overlap_permitted("s", "p"));
    EXPECT_TRUE(config.overlap_permitted("page", "s"));
    EXPECT_FALSE(config.overlap_permitted("p", "p"));
    EXPECT_FALSE(config.overlap_permitted("p", "w"));
}

TEST(MarkupConfigTest, SkipEntriesAreRecorded) {
    MarkupConfigSpec spec;
    spec.skip = {"note", "w:id"};
    spec.header = "TEIHeader";

    MarkupConfig config;
    Error error;
    ASSERT_TRUE(build_markup_config(spec, config, error));
    EXPECT_TRUE(config.is_skipped("note", ""));
    EXPECT_TRUE(config.is_skipped("w", "id"));
    EXPECT_FALSE(config.is_skipped("w", ""));
    EXPECT_EQ(config.header_element, "teiheader");
}

TEST(MarkupConfigTest, SplitList) {
    EXPECT_EQ(split_list("a  b\tc\n", ' '), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_EQ(split_list("a++b", '+'), (std::vector<std::string>{"a", "b"}));
    EXPECT_TRUE(split_list("", ',').empty());
}
