#include "cli/upload_runner.h"
#include "core/executor_test_fixture.h"
#include "support/fake_transfer_client.h"
#include "support/temp_files.h"
#include <memory>
#include <sstream>

using namespace std::chrono_literals;
using namespace upload;
using test_utils::FakeTransferClient;

class UploadRunnerTest : public ExecutorTest {
  protected:
    void TearDown() override {
        ExecutorTest::TearDown();
        runner.reset();
        coordinator.reset();
    }

    cli::UploadRunner& make_runner(std::chrono::milliseconds completion_timeout = 0ms) {
        UploadOptions options;
        options.chunk_size = 1024;
        options.completion_timeout = completion_timeout;
        options.allowed_extensions = {".pdf"};
        coordinator = std::make_unique<UploadCoordinator>(executor,
                                                          client,
                                                          "5c3e1a52-0000-4000-8000-000000000002",
                                                          options);
        coordinator->set_status_observer(
            [this](const UploadStatus& status) { display.update(status); });
        runner = std::make_unique<cli::UploadRunner>(executor, *coordinator, display, errors);
        return *runner;
    }

    test_utils::TempDir dir;
    FakeTransferClient client;
    std::ostringstream out;
    std::ostringstream errors;
    cli::ProgressDisplay display{out};
    std::unique_ptr<UploadCoordinator> coordinator;
    std::unique_ptr<cli::UploadRunner> runner;
};

TEST_F(UploadRunnerTest, StuckUploadIsCancelledBeforeNextFile) {
    auto& runner = make_runner(50ms);
    const auto first = dir.write_file("first.pdf", 3000);
    const auto second = dir.write_file("second.pdf", 500);

    EXPECT_FALSE(runner.run({first.string(), second.string()}, 0ms));

    auto calls = client.calls();
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_FALSE(calls[2].whole);
    EXPECT_EQ(calls[2].filename, "first.pdf");
    EXPECT_TRUE(calls[3].whole);
    EXPECT_EQ(calls[3].filename, "second.pdf");

    const auto status = coordinator->status();
    EXPECT_EQ(status.state, UploadState::Completed);
    EXPECT_EQ(status.filename, "second.pdf");

    const auto text = errors.str();
    EXPECT_NE(text.find("first.pdf: Upload cancelled."), std::string::npos);
    EXPECT_EQ(text.find("already in progress"), std::string::npos);
    EXPECT_EQ(text.find("second.pdf"), std::string::npos);
}

TEST_F(UploadRunnerTest, ExpiredWaitCancelsAssemblingUpload) {
    auto& runner = make_runner();
    const auto first = dir.write_file("first.pdf", 2048);
    const auto second = dir.write_file("second.pdf", 2048);

    EXPECT_FALSE(runner.run({first.string(), second.string()}, 50ms));

    auto calls = client.calls();
    ASSERT_EQ(calls.size(), 4u);
    EXPECT_EQ(calls[2].filename, "second.pdf");
    EXPECT_EQ(calls[2].index, 0u);
    EXPECT_EQ(calls[3].filename, "second.pdf");

    // The second upload is abandoned the same way once its wait runs out.
    EXPECT_EQ(coordinator->status().state, UploadState::Failed);
    EXPECT_EQ(coordinator->status().error->kind, ErrorKind::Cancelled);
    const auto text = errors.str();
    EXPECT_NE(text.find("first.pdf: Upload cancelled."), std::string::npos);
    EXPECT_NE(text.find("second.pdf: Upload cancelled."), std::string::npos);
}

TEST_F(UploadRunnerTest, CompletedFilesSucceed) {
    auto& runner = make_runner();
    const auto first = dir.write_file("first.pdf", 100);
    const auto second = dir.write_file("second.pdf", 200);

    EXPECT_TRUE(runner.run({first.string(), second.string()}, 0ms));

    EXPECT_EQ(client.calls().size(), 2u);
    EXPECT_TRUE(errors.str().empty());
}

TEST_F(UploadRunnerTest, RejectedFileDoesNotStopTheRest) {
    auto& runner = make_runner();
    const auto good = dir.write_file("good.pdf", 100);

    EXPECT_FALSE(runner.run({(dir.path() / "missing.pdf").string(), good.string()}, 0ms));

    auto calls = client.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].filename, "good.pdf");
    EXPECT_NE(errors.str().find("missing.pdf"), std::string::npos);
}

TEST_F(UploadRunnerTest, InterruptStopsBeforeNextFile) {
    auto& runner = make_runner();
    const auto file = dir.write_file("file.pdf", 100);

    runner.interrupt();
    EXPECT_FALSE(runner.run({file.string()}, 0ms));

    EXPECT_TRUE(client.calls().empty());
}
