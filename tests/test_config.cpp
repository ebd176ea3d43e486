#include <gtest/gtest.h>

#include "config.hpp"

#include <string>
#include <vector>

using namespace tei_standoff;

namespace {

bool parse(std::vector<std::string> args, AppConfig& config, std::string& error) {
    args.insert(args.begin(), "tei-standoff");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    return parse_args(static_cast<int>(args.size()), argv.data(), config, error);
}

}  // namespace

TEST(ConfigTest, ParseCommand) {
    AppConfig config;
    std::string error;
    ASSERT_TRUE(parse(
        {"parse", "--input", "corpus", "--output", "out", "--elements", "s w+lw w:pos", "--annotations",
         "sentence token pos", "--overlap", "p+s", "--workers", "3", "--no-progress"},
        config, error)) << error;

    EXPECT_EQ(config.command, Command::Parse);
    EXPECT_EQ(config.input_path.string(), "corpus");
    EXPECT_EQ(config.markup.elements, (std::vector<std::string>{"s", "w+lw", "w:pos"}));
    EXPECT_EQ(config.markup.annotations, (std::vector<std::string>{"sentence", "token", "pos"}));
    EXPECT_EQ(config.markup.overlap, (std::vector<std::string>{"p+s"}));
    EXPECT_EQ(config.workers, 3u);
    EXPECT_FALSE(config.show_progress);
}

TEST(ConfigTest, SegmentDefaultsPrefixToDocumentDirectory) {
    AppConfig config;
    std::string error;
    ASSERT_TRUE(parse({"segment", "--text", "out/doc1/text", "--chunk", "out/doc1/sentence", "--out",
                       "out/doc1/token"}, config, error)) << error;

    EXPECT_EQ(config.command, Command::Segment);
    EXPECT_EQ(config.prefix, "doc1");
    EXPECT_EQ(config.segmenter, "word");
    EXPECT_EQ(config.element, "w");
    EXPECT_FALSE(config.existing_path.has_value());
}

TEST(ConfigTest, ExportDefaultsDocId) {
    AppConfig config;
    std::string error;
    ASSERT_TRUE(parse({"export-xml", "--text", "out/doc1/text", "--annotation-dir", "out/doc1", "--output",
                       "doc1.xml"}, config, error)) << error;
    EXPECT_EQ(config.doc_id, "doc1");
    EXPECT_EQ(config.root_name, "text");
}

TEST(ConfigTest, Errors) {
    AppConfig config;
    std::string error;
    EXPECT_FALSE(parse({"translate"}, config, error));
    EXPECT_EQ(error, "Unknown command: translate");

    config = AppConfig{};
    error.clear();
    EXPECT_FALSE(parse({"parse", "--input", "x"}, config, error));
    EXPECT_EQ(error, "--output is required");

    config = AppConfig{};
    error.clear();
    EXPECT_FALSE(parse({"analyze", "--input"}, config, error));
    EXPECT_EQ(error, "Missing value for --input");

    config = AppConfig{};
    error.clear();
    EXPECT_FALSE(parse({"analyze", "--input", "x", "--max-count", "many"}, config, error));
    EXPECT_EQ(error, "Invalid integer for --max-count: many");

    config = AppConfig{};
    error.clear();
    EXPECT_FALSE(parse({"--help"}, config, error));
    EXPECT_EQ(error, "help");
}
