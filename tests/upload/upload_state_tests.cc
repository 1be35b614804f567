#include "upload/upload_state.h"
#include <gtest/gtest.h>

using namespace upload;

namespace {
UploadStatus transferring(std::uint64_t total) {
    auto status = transition(UploadStatus{}, events::FileSelected{"report.pdf"});
    return transition(status, events::TransferStarted{total});
}

UploadStatus assembling(const DocumentId& id = "42") {
    auto status = transferring(2);
    status = transition(status, events::ChunkAcknowledged{0, id});
    return transition(status, events::ChunkAcknowledged{1, id});
}
} // namespace

TEST(UploadStateTest, ProgressRoundsUp) {
    EXPECT_EQ(progress_for(0, 3), 0);
    EXPECT_EQ(progress_for(1, 3), 34);
    EXPECT_EQ(progress_for(2, 3), 67);
    EXPECT_EQ(progress_for(3, 3), 100);
    EXPECT_EQ(progress_for(1, 0), 0);
    EXPECT_EQ(progress_for(5, 4), 100);
}

TEST(UploadStateTest, FileSelectedResetsToIdle) {
    auto status = assembling();
    status = transition(status, events::Cancelled{});
    ASSERT_EQ(status.state, UploadState::Failed);

    auto next = transition(status, events::FileSelected{"notes.txt"});
    EXPECT_EQ(next.state, UploadState::Idle);
    EXPECT_EQ(next.filename, "notes.txt");
    EXPECT_EQ(next.progress, 0);
    EXPECT_FALSE(next.document_id.has_value());
    EXPECT_FALSE(next.error.has_value());
}

TEST(UploadStateTest, FileSelectedIgnoredWhileInFlight) {
    auto status = transferring(3);
    EXPECT_EQ(transition(status, events::FileSelected{"other.pdf"}), status);
}

TEST(UploadStateTest, ChunksAdvanceProgressAndAdoptFirstId) {
    auto status = transferring(3);
    EXPECT_EQ(status.state, UploadState::Transferring);
    EXPECT_EQ(status.message, "Uploading...");

    status = transition(status, events::ChunkAcknowledged{0, "42"});
    EXPECT_EQ(status.progress, 34);
    EXPECT_EQ(status.message, "Chunk 1 uploaded");
    EXPECT_EQ(status.document_id, "42");

    status = transition(status, events::ChunkAcknowledged{1, "43"});
    EXPECT_EQ(status.progress, 67);
    EXPECT_EQ(status.document_id, "42");

    status = transition(status, events::ChunkAcknowledged{2, "42"});
    EXPECT_EQ(status.state, UploadState::Assembling);
    EXPECT_EQ(status.progress, 100);
    EXPECT_EQ(status.message, "Assembling and processing...");
}

TEST(UploadStateTest, WholeFileCompletesDirectlyFromIdle) {
    auto status = transition(UploadStatus{}, events::FileSelected{"small.pdf"});
    status = transition(status, events::WholeFileAcknowledged{"7"});

    EXPECT_EQ(status.state, UploadState::Completed);
    EXPECT_EQ(status.progress, 100);
    EXPECT_EQ(status.document_id, "7");
    EXPECT_EQ(status.message, "Upload complete!");
}

TEST(UploadStateTest, FailureKeepsPartialProgress) {
    auto status = transferring(5);
    status = transition(status, events::ChunkAcknowledged{0, "9"});
    status = transition(status, events::ChunkAcknowledged{1, "9"});
    status = transition(status,
                        events::TransferFailed{UploadError{ErrorKind::Transport, 500, "Disk full"}});

    EXPECT_EQ(status.state, UploadState::Failed);
    EXPECT_EQ(status.progress, 40);
    EXPECT_EQ(status.message, "Disk full");
    ASSERT_TRUE(status.error.has_value());
    EXPECT_EQ(status.error->http_status, 500u);
}

TEST(UploadStateTest, TerminalStatesIgnoreTransferEvents) {
    auto status = assembling();
    status = transition(status, events::ProcessingCompleted{"42", "report.pdf"});
    ASSERT_EQ(status.state, UploadState::Completed);

    EXPECT_EQ(transition(status, events::ChunkAcknowledged{0, "42"}), status);
    EXPECT_EQ(transition(status, events::TransferFailed{UploadError{}}), status);
    EXPECT_EQ(transition(status, events::Cancelled{}), status);
    EXPECT_EQ(transition(status, events::ProcessingStalled{}), status);
}

TEST(UploadStateTest, OnlyMatchingCompletionCompletes) {
    auto status = assembling("42");

    EXPECT_EQ(transition(status, events::ProcessingCompleted{"41", "x.pdf"}), status);

    auto done = transition(status, events::ProcessingCompleted{"42", "report.pdf"});
    EXPECT_EQ(done.state, UploadState::Completed);
    EXPECT_EQ(done.message, "Processing complete!");
}

TEST(UploadStateTest, CompletionIgnoredInIdle) {
    auto status = transition(UploadStatus{}, events::FileSelected{"a.pdf"});
    EXPECT_EQ(transition(status, events::ProcessingCompleted{"42", "a.pdf"}), status);
}

TEST(UploadStateTest, EarlyCompletionIsRemembered) {
    auto status = transferring(2);
    status = transition(status, events::ChunkAcknowledged{0, "42"});
    status = transition(status, events::ProcessingCompleted{"42", "report.pdf"});

    EXPECT_EQ(status.state, UploadState::Transferring);
    EXPECT_TRUE(status.completion_pending);

    status = transition(status, events::ChunkAcknowledged{1, "42"});
    EXPECT_EQ(status.state, UploadState::Assembling);
    EXPECT_TRUE(status.completion_pending);
}

TEST(UploadStateTest, StallMarksStuckButStillCompletes) {
    auto status = transition(assembling(), events::ProcessingStalled{});
    EXPECT_EQ(status.state, UploadState::Assembling);
    EXPECT_TRUE(status.stuck);
    EXPECT_EQ(status.message, "Still processing on the server...");
    ASSERT_TRUE(status.error.has_value());
    EXPECT_EQ(status.error->kind, ErrorKind::StuckProcessing);

    status = transition(status, events::ProcessingCompleted{"42", "report.pdf"});
    EXPECT_EQ(status.state, UploadState::Completed);
    EXPECT_FALSE(status.stuck);
    EXPECT_FALSE(status.error.has_value());
}

TEST(UploadStateTest, ChannelLossNeverFailsSession) {
    auto status = transition(assembling(), events::ChannelLost{});
    EXPECT_EQ(status.state, UploadState::Assembling);
    EXPECT_TRUE(status.channel_lost);
    EXPECT_EQ(status.message, "Notification channel lost; completion may not be reported.");

    status = transition(status, events::ChannelRestored{});
    EXPECT_FALSE(status.channel_lost);
    EXPECT_EQ(status.message, "Assembling and processing...");
}

TEST(UploadStateTest, CancelFailsInFlightSession) {
    auto status = transition(transferring(3), events::Cancelled{});
    EXPECT_EQ(status.state, UploadState::Failed);
    ASSERT_TRUE(status.error.has_value());
    EXPECT_EQ(status.error->kind, ErrorKind::Cancelled);
    EXPECT_EQ(status.message, "Upload cancelled.");

    auto idle = transition(UploadStatus{}, events::FileSelected{"a.pdf"});
    EXPECT_EQ(transition(idle, events::Cancelled{}), idle);
}

TEST(UploadStateTest, StateNames) {
    EXPECT_EQ(to_string(UploadState::Assembling), "Assembling");
    EXPECT_TRUE(is_terminal(UploadState::Completed));
    EXPECT_TRUE(is_terminal(UploadState::Failed));
    EXPECT_FALSE(is_terminal(UploadState::Transferring));
}
