#include <gtest/gtest.h>
#include <chrono>
#include "ocrd/pipeline.hpp"
#include "test_support.hpp"

using namespace ocrd;
using namespace std::chrono_literals;
using ocrd::testing::TempDir;
using ocrd::testing::readFile;
using ocrd::testing::writeFile;

namespace {

// Pipeline whose command is `/bin/sh <script>`, so the script sees the
// regular argument list as $1..$N.
ProcessPipeline shellPipeline(const TempDir& dir, const std::string& body, std::chrono::seconds timeout = 0s) {
    auto script = dir.path() / "pipeline.sh";
    writeFile(script, body);
    return ProcessPipeline({"/bin/sh", script.string()}, timeout);
}

}

TEST(PipelineTest, ArgumentsTranslateOptions) {
    ProcessPipeline pipeline({"python", "-m", "olmocr.pipeline"}, 0s);
    PipelineOptions all;
    EXPECT_EQ(pipeline.buildArguments("/w/job", "/w/job_a.pdf", all),
              (std::vector<std::string>{"python", "-m", "olmocr.pipeline", "/w/job", "--markdown",
                                        "--extract_tables", "--extract_figures", "--pdfs", "/w/job_a.pdf"}));

    PipelineOptions none;
    none.markdown = false;
    none.extractTables = false;
    none.extractFigures = false;
    EXPECT_EQ(pipeline.buildArguments("/w/job", "/w/job_a.pdf", none),
              (std::vector<std::string>{"python", "-m", "olmocr.pipeline", "/w/job", "--pdfs", "/w/job_a.pdf"}));
}

TEST(PipelineTest, SuccessfulRunWritesMarkdown) {
    TempDir dir;
    auto pipeline = shellPipeline(dir,
        "mkdir -p \"$1/markdown\"\n"
        "echo \"# converted\" > \"$1/markdown/doc.md\"\n"
        "echo progress >&2\n");
    auto workspace = dir.path() / "job";
    std::filesystem::create_directories(workspace);

    PipelineResult result = pipeline.run(workspace, dir.path() / "job_doc.pdf", PipelineOptions{});
    EXPECT_TRUE(result.ok);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_TRUE(result.error.empty());
    EXPECT_EQ(readFile(workspace / "markdown" / "doc.md"), "# converted\n");
}

TEST(PipelineTest, ScriptReceivesSourceAfterPdfsFlag) {
    TempDir dir;
    auto pipeline = shellPipeline(dir,
        "while [ $# -gt 0 ]; do\n"
        "  if [ \"$1\" = \"--pdfs\" ]; then echo \"$2\"; fi\n"
        "  shift\n"
        "done\n");
    PipelineResult result = pipeline.run(dir.path(), "/data/in put.pdf", PipelineOptions{});
    ASSERT_TRUE(result.ok);
    EXPECT_EQ(result.output, "/data/in put.pdf\n");
}

TEST(PipelineTest, NonZeroExitReportsTrimmedStderr) {
    TempDir dir;
    auto pipeline = shellPipeline(dir, "echo 'model not found' >&2\necho '' >&2\nexit 3\n");
    PipelineResult result = pipeline.run(dir.path(), dir.path() / "a.pdf", PipelineOptions{});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_EQ(result.error, "model not found");
}

TEST(PipelineTest, SilentFailureReportsExitCode) {
    TempDir dir;
    auto pipeline = shellPipeline(dir, "exit 4\n");
    PipelineResult result = pipeline.run(dir.path(), dir.path() / "a.pdf", PipelineOptions{});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "pipeline exited with code 4");
}

TEST(PipelineTest, KilledBySignal) {
    TempDir dir;
    auto pipeline = shellPipeline(dir, "kill -9 $$\n");
    PipelineResult result = pipeline.run(dir.path(), dir.path() / "a.pdf", PipelineOptions{});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "pipeline terminated by signal 9");
}

TEST(PipelineTest, MissingExecutableFails) {
    TempDir dir;
    std::string missing = (dir.path() / "no-such-binary").string();
    ProcessPipeline pipeline({missing}, 0s);
    PipelineResult result = pipeline.run(dir.path(), dir.path() / "a.pdf", PipelineOptions{});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.exitCode, 127);
    EXPECT_EQ(result.error, "cannot execute " + missing);
}

TEST(PipelineTest, LargeStderrDoesNotDeadlock) {
    TempDir dir;
    auto pipeline = shellPipeline(dir, "head -c 4000000 /dev/zero | tr '\\000' x >&2\nexit 1\n", 30s);
    PipelineResult result = pipeline.run(dir.path(), dir.path() / "a.pdf", PipelineOptions{});
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.exitCode, 1);
    EXPECT_LE(result.error.size(), 1024u * 1024u);
    EXPECT_EQ(result.error.front(), 'x');
}

TEST(PipelineTest, TimeoutKillsChild) {
    TempDir dir;
    auto pipeline = shellPipeline(dir, "sleep 30\n", 1s);
    auto start = std::chrono::steady_clock::now();
    PipelineResult result = pipeline.run(dir.path(), dir.path() / "a.pdf", PipelineOptions{});
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error, "pipeline timed out after 1 seconds");
    EXPECT_LT(elapsed, 10s);
}
