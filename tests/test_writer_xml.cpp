#include <gtest/gtest.h>

#include "test_support.hpp"
#include "writer_xml.hpp"

#include <sstream>

using namespace tei_standoff;
using tei_standoff::testing::TempDir;

namespace {

MarkupConfig make_config(std::vector<std::string> elements, std::vector<std::string> annotations) {
    MarkupConfigSpec spec;
    spec.elements = std::move(elements);
    spec.annotations = std::move(annotations);
    MarkupConfig config;
    Error error;
    EXPECT_TRUE(build_markup_config(spec, config, error)) << error.message;
    return config;
}

CorpusText make_corpus(const std::string& text, const PositionToAnchor& anchors) {
    CorpusText corpus;
    corpus.text = text;
    corpus.position_to_anchor = anchors;
    for (const auto& [position, anchor] : anchors) {
        corpus.anchor_to_position[anchor] = position;
    }
    return corpus;
}

std::string to_string(const pugi::xml_document& doc) {
    std::ostringstream out;
    doc.save(out, "", pugi::format_raw | pugi::format_no_declaration);
    return out.str();
}

}  // namespace

TEST(WriterXmlTest, NestedElementsWithAttributes) {
    const auto corpus = make_corpus("ab cd", {{0, "a0"}, {2, "a2"}, {3, "a3"}, {5, "a5"}});
    const auto config = make_config({"s", "w", "w:pos"}, {"s", "w", "pos"});
    const AnnotationSet annotations = {
        {"s", {{"s:a0-a5", ""}}},
        {"w", {{"w:a0-a2", ""}, {"w:a3-a5", ""}}},
        {"pos", {{"w:a0-a2", "NN"}, {"w:a3-a5", ""}}},
    };

    pugi::xml_document doc;
    Error error;
    ASSERT_TRUE(build_xml_document(corpus, config, annotations, XmlExportOptions{}, doc, error)) << error.message;
    EXPECT_EQ(to_string(doc), "<s><w pos=\"NN\">ab</w> <w>cd</w></s>");
}

TEST(WriterXmlTest, EmptyAttributesOnRequest) {
    const auto corpus = make_corpus("ab", {{0, "a0"}, {2, "a2"}});
    const auto config = make_config({"w", "w:pos"}, {"w", "pos"});
    const AnnotationSet annotations = {
        {"w", {{"w:a0-a2", ""}}},
        {"pos", {{"w:a0-a2", ""}}},
    };

    XmlExportOptions options;
    options.include_empty_attributes = true;
    pugi::xml_document doc;
    Error error;
    ASSERT_TRUE(build_xml_document(corpus, config, annotations, options, doc, error));
    EXPECT_EQ(to_string(doc), "<w pos=\"\">ab</w>");
}

TEST(WriterXmlTest, OverlapIsSplitIntoFragments) {
    const auto corpus = make_corpus("abcd", {{0, "p0"}, {1, "p1"}, {3, "p3"}, {4, "p4"}});
    const auto config = make_config({"a", "b"}, {"a", "b"});
    const AnnotationSet annotations = {
        {"a", {{"a:p0-p3", ""}}},
        {"b", {{"b:p1-p4", ""}}},
    };

    pugi::xml_document doc;
    Error error;
    ASSERT_TRUE(build_xml_document(corpus, config, annotations, XmlExportOptions{}, doc, error));
    EXPECT_EQ(
        to_string(doc),
        "<text><a>a<b _overlap=\"doc-1\">bc</b></a><b _overlap=\"doc-1\">d</b></text>"
    );
}

TEST(WriterXmlTest, ZeroWidthElementsStayInPlace) {
    const auto corpus = make_corpus("ab cd", {{0, "a0"}, {2, "a2"}, {3, "a3"}, {5, "a5"}});
    const auto config = make_config({"s", "w", "comment:value"}, {"s", "w", "comment"});
    const AnnotationSet annotations = {
        {"s", {{"s:a0-a5", ""}}},
        {"w", {{"w:a0-a2", ""}, {"w:a3-a5", ""}}},
        {"comment", {{"comment:a2-a2", "note"}}},
    };

    pugi::xml_document doc;
    Error error;
    ASSERT_TRUE(build_xml_document(corpus, config, annotations, XmlExportOptions{}, doc, error));

    const pugi::xml_node comment = doc.child("s").child("comment");
    ASSERT_TRUE(comment);
    EXPECT_STREQ(comment.attribute("value").value(), "note");
    EXPECT_FALSE(comment.first_child());
    EXPECT_STREQ(comment.previous_sibling().name(), "w");
    EXPECT_STREQ(comment.previous_sibling().child_value(), "ab");
}

TEST(WriterXmlTest, TextWithoutElementsIsWrapped) {
    const auto corpus = make_corpus("plain", {});
    const auto config = make_config({"s"}, {"s"});

    XmlExportOptions options;
    options.root_name = "body";
    pugi::xml_document doc;
    Error error;
    ASSERT_TRUE(build_xml_document(corpus, config, {}, options, doc, error));
    EXPECT_EQ(to_string(doc), "<body>plain</body>");
}

TEST(WriterXmlTest, UnknownAnchorFails) {
    const auto corpus = make_corpus("ab", {{0, "a0"}, {2, "a2"}});
    const auto config = make_config({"w"}, {"w"});
    const AnnotationSet annotations = {{"w", {{"w:a0-zz", ""}}}};

    pugi::xml_document doc;
    Error error;
    EXPECT_FALSE(build_xml_document(corpus, config, annotations, XmlExportOptions{}, doc, error));
    EXPECT_EQ(error.kind, ErrorKind::UnknownAnchor);
}

TEST(WriterXmlTest, WritesFile) {
    TempDir dir;
    const auto corpus = make_corpus("ab", {{0, "a0"}, {2, "a2"}});
    const auto config = make_config({"w"}, {"w"});
    const AnnotationSet annotations = {{"w", {{"w:a0-a2", ""}}}};

    Error error;
    ASSERT_TRUE(write_xml_output(dir / "out" / "doc.xml", corpus, config, annotations, XmlExportOptions{}, error))
        << error.message;

    pugi::xml_document doc;
    ASSERT_TRUE(doc.load_file((dir / "out" / "doc.xml").c_str()));
    EXPECT_STREQ(doc.child("w").child_value(), "ab");
}
