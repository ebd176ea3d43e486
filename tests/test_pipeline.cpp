#include <gtest/gtest.h>

#include "corpus_text.hpp"
#include "pipeline.hpp"
#include "test_support.hpp"

#include <atomic>
#include <stdexcept>

using namespace tei_standoff;
using tei_standoff::testing::TempDir;

namespace {

MarkupConfig sentence_config() {
    MarkupConfigSpec spec;
    spec.elements = {"s"};
    spec.annotations = {"sentence"};
    MarkupConfig config;
    Error error;
    EXPECT_TRUE(build_markup_config(spec, config, error)) << error.message;
    return config;
}

ParseJob make_job(const TempDir& dir, const std::string& name) {
    ParseJob job;
    job.source = dir / (name + ".xml");
    job.prefix = name;
    job.annotation_dir = dir / "out" / name;
    job.text_path = job.annotation_dir / "text";
    return job;
}

}  // namespace

TEST(PipelineTest, ParsesDocumentsIndependently) {
    TempDir dir;
    tei_standoff::testing::write_file(dir / "one.xml", "<s>first</s>");
    tei_standoff::testing::write_file(dir / "two.xml", "<s>second</s><x>");
    tei_standoff::testing::write_file(dir / "three.xml", "<s>third</s>");

    const std::vector<ParseJob> jobs = {make_job(dir, "one"), make_job(dir, "two"), make_job(dir, "three")};
    std::atomic<std::size_t> last_done{0};
    std::vector<ParseJobResult> results;
    BatchStats stats;
    std::string error;

    ASSERT_TRUE(parse_documents_parallel(jobs, sentence_config(), 2, results, stats, error,
        [&](std::size_t done, std::size_t) { last_done = done; })) << error;

    EXPECT_EQ(stats.documents_total, 3u);
    EXPECT_EQ(stats.documents_failed, 0u);
    EXPECT_EQ(stats.workers_used, 2u);
    EXPECT_EQ(last_done.load(), 3u);
    ASSERT_EQ(results.size(), 3u);

    for (std::size_t i = 0; i < jobs.size(); ++i) {
        EXPECT_TRUE(results[i].ok);
        EXPECT_TRUE(std::filesystem::exists(jobs[i].text_path));
        EXPECT_TRUE(std::filesystem::exists(jobs[i].annotation_dir / "sentence"));
    }
    // <x> is unconfigured and left open
    EXPECT_EQ(results[0].stats.warnings, 0u);
    EXPECT_EQ(results[1].stats.warnings, 2u);

    CorpusText corpus;
    Error read_error;
    ASSERT_TRUE(read_corpus_text(jobs[2].text_path, corpus, read_error));
    EXPECT_EQ(corpus.text, "third");
}

TEST(PipelineTest, FailedDocumentDoesNotStopOthers) {
    TempDir dir;
    tei_standoff::testing::write_file(dir / "good.xml", "<s>ok</s>");

    const std::vector<ParseJob> jobs = {make_job(dir, "missing"), make_job(dir, "good")};
    std::vector<ParseJobResult> results;
    BatchStats stats;
    std::string error;

    EXPECT_FALSE(parse_documents_parallel(jobs, sentence_config(), 4, results, stats, error));
    EXPECT_EQ(error, "1 of 2 documents failed");
    EXPECT_EQ(stats.documents_failed, 1u);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_FALSE(results[0].ok);
    EXPECT_FALSE(results[0].error.empty());
    EXPECT_TRUE(results[1].ok);
}

TEST(PipelineTest, EmptyBatch) {
    std::vector<ParseJobResult> results;
    BatchStats stats;
    std::string error;
    EXPECT_TRUE(parse_documents_parallel({}, sentence_config(), 4, results, stats, error));
    EXPECT_EQ(stats.documents_total, 0u);
}

TEST(PipelineTest, ThrowingParserFailsOnlyItsDocument) {
    TempDir dir;
    const std::vector<ParseJob> jobs = {make_job(dir, "plain"), make_job(dir, "odd"), make_job(dir, "good")};
    const DocumentParser parser = [](const ParseJob& job, const MarkupConfig&, DiagnosticSink& sink, ParseStats&, Error&) {
        if (job.prefix == "plain") {
            throw std::runtime_error("disk on fire");
        }
        if (job.prefix == "odd") {
            throw 42;
        }
        sink.info("parsed " + job.prefix);
        return true;
    };

    std::vector<ParseJobResult> results;
    BatchStats stats;
    std::string error;
    EXPECT_FALSE(parse_documents_parallel(jobs, sentence_config(), 2, parser, results, stats, error));
    EXPECT_EQ(error, "2 of 3 documents failed");
    EXPECT_EQ(stats.documents_failed, 2u);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_FALSE(results[0].ok);
    EXPECT_EQ(results[0].error, "disk on fire");
    EXPECT_FALSE(results[1].ok);
    EXPECT_EQ(results[1].error, "Unknown parse error");
    EXPECT_TRUE(results[2].ok);
    EXPECT_EQ(results[2].diagnostics.size(), 1u);
}
