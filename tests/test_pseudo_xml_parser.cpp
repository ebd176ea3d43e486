#include <gtest/gtest.h>

#include "corpus_text.hpp"
#include "edge.hpp"
#include "pseudo_xml_parser.hpp"
#include "test_support.hpp"

#include <string>
#include <vector>

using namespace tei_standoff;
using tei_standoff::testing::TempDir;

namespace {

MarkupConfig make_config(
    std::vector<std::string> elements,
    std::vector<std::string> annotations,
    std::vector<std::string> overlap = {}
) {
    MarkupConfigSpec spec;
    spec.elements = std::move(elements);
    spec.annotations = std::move(annotations);
    spec.overlap = std::move(overlap);

    MarkupConfig config;
    Error error;
    EXPECT_TRUE(build_markup_config(spec, config, error)) << error.message;
    return config;
}

std::size_t position_of(const PseudoXmlParser& parser, const std::string& anchor) {
    std::size_t position = 0;
    EXPECT_TRUE(parser.anchors().find_position(anchor, position)) << anchor;
    return position;
}

}  // namespace

class PseudoXmlParserTest : public ::testing::Test {
protected:
    DiagnosticSink sink;
};

TEST_F(PseudoXmlParserTest, OverlapKeepsBothEdgesAndWarnsOnce) {
    const auto config = make_config({"a", "b"}, {"a", "b"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("<a><b></a></b>");

    ASSERT_EQ(parser.edges().size(), 2u);
    EXPECT_EQ(edge_name(parser.edges()[0]), "a");
    EXPECT_EQ(edge_name(parser.edges()[1]), "b");
    EXPECT_EQ(sink.count(DiagnosticKind::OverlappingElements), 1u);
    EXPECT_EQ(sink.warnings(), 1u);
    EXPECT_EQ(sink.errors(), 0u);
}

TEST_F(PseudoXmlParserTest, OverlappingSpansCoverTheirText) {
    const auto config = make_config({"a", "b"}, {"a", "b"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("<a>x<b>y</a>z</b>");

    EXPECT_EQ(parser.text(), "xyz");
    ASSERT_EQ(parser.edges().size(), 2u);
    const std::string& a = parser.edges()[0];
    const std::string& b = parser.edges()[1];
    EXPECT_EQ(position_of(parser, edge_start(a)), 0u);
    EXPECT_EQ(position_of(parser, edge_end(a)), 2u);
    EXPECT_EQ(position_of(parser, edge_start(b)), 1u);
    EXPECT_EQ(position_of(parser, edge_end(b)), 3u);
    EXPECT_EQ(sink.count(DiagnosticKind::OverlappingElements), 1u);
}

TEST_F(PseudoXmlParserTest, PermittedOverlapDoesNotWarn) {
    const auto config = make_config({"a", "b"}, {"a", "b"}, {"a+b"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("<a><b></a></b>");

    EXPECT_EQ(parser.edges().size(), 2u);
    EXPECT_EQ(sink.count(DiagnosticKind::OverlappingElements), 0u);
}

TEST_F(PseudoXmlParserTest, UnterminatedElementIsAutoClosed) {
    const auto config = make_config({"a"}, {"a"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("<a>text");

    ASSERT_EQ(parser.edges().size(), 1u);
    const std::string& a = parser.edges()[0];
    EXPECT_EQ(position_of(parser, edge_start(a)), 0u);
    EXPECT_EQ(position_of(parser, edge_end(a)), 4u);
    EXPECT_EQ(sink.count(DiagnosticKind::AutoClosedElement), 1u);
    EXPECT_EQ(sink.warnings(), 1u);
    EXPECT_EQ(parser.open_element_count(), 0u);
}

TEST_F(PseudoXmlParserTest, StrayEndTagIsReportedAndParsingContinues) {
    const auto config = make_config({"a"}, {"a"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("</b><a>x</a>");

    EXPECT_EQ(sink.count(DiagnosticKind::UnmatchedEndTag), 1u);
    EXPECT_EQ(sink.errors(), 1u);
    ASSERT_EQ(parser.edges().size(), 1u);
    EXPECT_EQ(edge_name(parser.edges()[0]), "a");
    EXPECT_EQ(sink.count(DiagnosticKind::AutoClosedElement), 0u);
}

TEST_F(PseudoXmlParserTest, StrayEndTagInsideOpenElementLeavesItOpen) {
    const auto config = make_config({"a"}, {"a"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("<a></b><a>x</a>");

    EXPECT_EQ(sink.count(DiagnosticKind::UnmatchedEndTag), 1u);
    EXPECT_EQ(sink.count(DiagnosticKind::AutoClosedElement), 1u);
    EXPECT_EQ(sink.count(DiagnosticKind::OverlappingElements), 0u);
    ASSERT_EQ(parser.edges().size(), 2u);
    for (const auto& edge : parser.edges()) {
        EXPECT_EQ(edge_name(edge), "a");
        EXPECT_EQ(position_of(parser, edge_start(edge)), 0u);
        EXPECT_EQ(position_of(parser, edge_end(edge)), 1u);
    }
    EXPECT_EQ(parser.text(), "x");
}

TEST_F(PseudoXmlParserTest, EndTagClosesMostRecentOfSameName) {
    const auto config = make_config({"a"}, {"a"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("<a>x<a>y</a>z</a>");

    ASSERT_EQ(parser.edges().size(), 2u);
    EXPECT_EQ(position_of(parser, edge_start(parser.edges()[0])), 1u);
    EXPECT_EQ(position_of(parser, edge_end(parser.edges()[0])), 2u);
    EXPECT_EQ(position_of(parser, edge_start(parser.edges()[1])), 0u);
    EXPECT_EQ(position_of(parser, edge_end(parser.edges()[1])), 3u);
    EXPECT_EQ(sink.warnings(), 0u);
}

TEST_F(PseudoXmlParserTest, HeaderIsExcludedFromText) {
    const auto config = make_config({"text"}, {"text"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("<teiHeader><title>T</title><!-- c --></teiHeader><text>body</text>");

    EXPECT_EQ(parser.text(), "body");
    ASSERT_EQ(parser.edges().size(), 1u);
    EXPECT_EQ(sink.count(DiagnosticKind::SkippedElement), 0u);
    EXPECT_EQ(sink.count(DiagnosticKind::CommentInHeader), 1u);
}

TEST_F(PseudoXmlParserTest, AttributesGoToTheirAnnotations) {
    const auto config = make_config({"w", "w:pos"}, {"token", "pos"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("<w pos=\"NN\" id=\"1\">ord</w> <w pos=\"VB\" id=\"2\">kom</w>");

    EXPECT_EQ(parser.text(), "ord kom");

    const auto& pos = parser.annotations().at("pos");
    ASSERT_EQ(pos.size(), 2u);
    EXPECT_EQ(pos.entries()[0].second, "NN");
    EXPECT_EQ(pos.entries()[1].second, "VB");
    EXPECT_EQ(edge_name(pos.entries()[0].first), "w");

    const auto& token = parser.annotations().at("token");
    ASSERT_EQ(token.size(), 2u);
    EXPECT_EQ(token.entries()[0].first, pos.entries()[0].first);
    EXPECT_EQ(token.entries()[0].second, "");

    // warned once, then suppressed
    EXPECT_EQ(sink.count(DiagnosticKind::SkippedElement), 1u);
}

TEST_F(PseudoXmlParserTest, UnconfiguredElementWarnsOnce) {
    const auto config = make_config({"s"}, {"s"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("<s><hi>a</hi><hi>b</hi></s>");

    EXPECT_EQ(sink.count(DiagnosticKind::SkippedElement), 1u);
    EXPECT_EQ(parser.edges().size(), 3u);
    EXPECT_EQ(parser.annotations().at("s").size(), 1u);
}

TEST_F(PseudoXmlParserTest, TextTokensAreAnchoredOnBothSides) {
    const auto config = make_config({"s"}, {"s"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("<s>Hej, du 42</s>");

    EXPECT_EQ(parser.text(), "Hej, du 42");
    std::vector<std::size_t> positions;
    for (const auto& [position, anchor] : parser.anchors().position_to_anchor()) {
        positions.push_back(position);
    }
    EXPECT_EQ(positions, (std::vector<std::size_t>{0, 3, 4, 5, 7, 8, 10}));
}

TEST_F(PseudoXmlParserTest, ReferencesResolveOrAreDropped) {
    const auto config = make_config({"p"}, {"p"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("<p>a&amp;b&eacute;&#1;&bogus;&#x41;</p>");

    EXPECT_EQ(parser.text(), "a&b\xc3\xa9" "A");
    EXPECT_EQ(sink.count(DiagnosticKind::ControlCharacterReference), 1u);
    EXPECT_EQ(sink.count(DiagnosticKind::UnknownEntity), 1u);
    EXPECT_EQ(sink.errors(), 2u);
}

TEST_F(PseudoXmlParserTest, CommentBecomesZeroWidthElement) {
    const auto config = make_config({"p", "comment:value"}, {"p", "comment"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("<p>a<!-- hi -->b</p>");

    EXPECT_EQ(parser.text(), "ab");
    const auto& comments = parser.annotations().at("comment");
    ASSERT_EQ(comments.size(), 1u);
    EXPECT_EQ(comments.entries()[0].second, " hi ");
    const std::string& edge = comments.entries()[0].first;
    EXPECT_EQ(edge_start(edge), edge_end(edge));
    EXPECT_EQ(position_of(parser, edge_start(edge)), 1u);
    EXPECT_EQ(sink.count(DiagnosticKind::Comment), 1u);
    EXPECT_EQ(sink.count(DiagnosticKind::SkippedElement), 0u);
}

TEST_F(PseudoXmlParserTest, ByteOrderMarkIsStripped) {
    const auto config = make_config({"p"}, {"p"});
    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("\xef\xbb\xbf<p>x</p>");

    EXPECT_EQ(parser.text(), "x");
}

TEST_F(PseudoXmlParserTest, XmlDeclarationOnlyAtStart) {
    const auto config = make_config({"p"}, {"p"});
    {
        PseudoXmlParser parser(config, "doc", 100, sink);
        parser.parse("<?xml version=\"1.0\"?><p>x</p>");
    }
    EXPECT_EQ(sink.errors(), 0u);

    PseudoXmlParser parser(config, "doc", 100, sink);
    parser.parse("<p>x</p><?xml version=\"1.0\"?><?php echo ?>");
    EXPECT_EQ(sink.count(DiagnosticKind::MisplacedXmlDeclaration), 1u);
    EXPECT_EQ(sink.count(DiagnosticKind::ProcessingInstruction), 1u);
}

TEST_F(PseudoXmlParserTest, SameSeedGivesSameAnchors) {
    const auto config = make_config({"s"}, {"s"});
    PseudoXmlParser first(config, "doc", 100, sink);
    PseudoXmlParser second(config, "doc", 100, sink);
    first.parse("<s>one two</s>");
    second.parse("<s>one two</s>");

    EXPECT_EQ(first.anchors().position_to_anchor(), second.anchors().position_to_anchor());
    EXPECT_EQ(first.edges(), second.edges());
}

TEST_F(PseudoXmlParserTest, ParseFileWritesTextAndAnnotations) {
    TempDir dir;
    tei_standoff::testing::write_file(dir / "in.xml", "<text><s>Ett # tv\xc3\xa5</s></text>");
    const auto config = make_config({"s", "text"}, {"sentence", "text"});

    ParseStats stats;
    Error error;
    ASSERT_TRUE(parse_file(dir / "in.xml", "doc", dir / "out" / "text", dir / "out", config, sink, stats, error))
        << error.message;
    EXPECT_EQ(stats.edges, 2u);
    EXPECT_EQ(stats.warnings, 0u);

    CorpusText corpus;
    ASSERT_TRUE(read_corpus_text(dir / "out" / "text", corpus, error)) << error.message;
    EXPECT_EQ(corpus.text, "Ett # tv\xc3\xa5");
    EXPECT_EQ(corpus.text.size(), stats.text_bytes);
    EXPECT_EQ(corpus.position_to_anchor.size(), stats.anchors);

    std::vector<AnnotationEntry> sentences;
    ASSERT_TRUE(read_annotation(dir / "out" / "sentence", sentences, error)) << error.message;
    ASSERT_EQ(sentences.size(), 1u);
    EXPECT_EQ(corpus.anchor_to_position.at(edge_start(sentences[0].first)), 0u);
    EXPECT_EQ(corpus.anchor_to_position.at(edge_end(sentences[0].first)), corpus.text.size());
    EXPECT_TRUE(std::filesystem::exists(dir / "out" / "text"));
}

TEST_F(PseudoXmlParserTest, ParseFileWithDelimiterAndSpaceInPrefixReadsBack) {
    TempDir dir;
    tei_standoff::testing::write_file(dir / "in.xml", "<text><s>Hej du</s></text>");
    const auto config = make_config({"s", "text"}, {"sentence", "text"});

    ParseStats stats;
    Error error;
    ASSERT_TRUE(parse_file(dir / "in.xml", "a#b c", dir / "out" / "text", dir / "out", config, sink, stats, error))
        << error.message;

    CorpusText corpus;
    ASSERT_TRUE(read_corpus_text(dir / "out" / "text", corpus, error)) << error.message;
    EXPECT_EQ(corpus.text, "Hej du");
    EXPECT_EQ(corpus.position_to_anchor.size(), stats.anchors);

    std::vector<AnnotationEntry> sentences;
    ASSERT_TRUE(read_annotation(dir / "out" / "sentence", sentences, error)) << error.message;
    ASSERT_EQ(sentences.size(), 1u);
    const std::string& edge = sentences[0].first;
    EXPECT_EQ(edge.find('#'), std::string::npos);
    EXPECT_EQ(edge.find(' '), std::string::npos);
    ASSERT_TRUE(corpus.anchor_to_position.contains(edge_start(edge)));
    ASSERT_TRUE(corpus.anchor_to_position.contains(edge_end(edge)));
    EXPECT_EQ(corpus.anchor_to_position.at(edge_start(edge)), 0u);
    EXPECT_EQ(corpus.anchor_to_position.at(edge_end(edge)), corpus.text.size());
}

TEST_F(PseudoXmlParserTest, ParseFileReportsMissingSource) {
    TempDir dir;
    const auto config = make_config({"s"}, {"s"});
    ParseStats stats;
    Error error;
    EXPECT_FALSE(parse_file(dir / "missing.xml", "doc", dir / "text", dir.path(), config, sink, stats, error));
    EXPECT_EQ(error.kind, ErrorKind::Io);
}
