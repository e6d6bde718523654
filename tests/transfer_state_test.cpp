#include <gtest/gtest.h>
#include <rangefetch/progress.hpp>
#include <rangefetch/transfer_state.hpp>

using namespace rangefetch;

TEST(TransferStateTest, StartsIdleWithUnknownSize) {
    TransferState state;
    EXPECT_EQ(state.status(), TransferStatus::Idle);
    EXPECT_EQ(state.totalBytes(), -1);
    EXPECT_EQ(state.transferredBytes(), 0);
    EXPECT_TRUE(state.errorMessage().empty());
}

TEST(TransferStateTest, BeginIsRejectedWhileDownloading) {
    TransferState state;
    ASSERT_TRUE(state.begin(true).has_value());
    EXPECT_EQ(state.status(), TransferStatus::Downloading);
    EXPECT_FALSE(state.begin(true).has_value());
    EXPECT_FALSE(state.begin(false).has_value());
}

TEST(TransferStateTest, FreshBeginResetsCountersResumeKeepsThem) {
    TransferState state;
    const auto first = state.begin(true);
    ASSERT_TRUE(first);
    state.setTotalIfUnknown(*first, 1000);
    state.addTransferred(*first, 400);
    state.assignFile(*first, "data.bin", "/tmp/data.bin");

    state.pause();
    const auto resumed = state.begin(false);
    ASSERT_TRUE(resumed);
    EXPECT_EQ(state.totalBytes(), 1000);
    EXPECT_EQ(state.transferredBytes(), 400);
    EXPECT_EQ(state.filepath(), "/tmp/data.bin");

    state.cancel();
    const auto fresh = state.begin(true);
    ASSERT_TRUE(fresh);
    EXPECT_EQ(state.totalBytes(), -1);
    EXPECT_EQ(state.transferredBytes(), 0);
    EXPECT_TRUE(state.filepath().empty());
}

TEST(TransferStateTest, PauseAndCancelAreUnconditional) {
    TransferState state;
    state.pause();
    EXPECT_EQ(state.status(), TransferStatus::Paused);
    state.cancel();
    EXPECT_EQ(state.status(), TransferStatus::Cancelled);

    state.cancelIfActive();
    EXPECT_EQ(state.status(), TransferStatus::Cancelled);
}

TEST(TransferStateTest, CompletesOnlyWhileDownloading) {
    TransferState state;
    const auto run = state.begin(true);
    ASSERT_TRUE(run);
    EXPECT_TRUE(state.isActive(*run));

    state.pause();
    EXPECT_FALSE(state.isActive(*run));
    EXPECT_FALSE(state.completeIfActive(*run));
    EXPECT_EQ(state.status(), TransferStatus::Paused);

    const auto resumed = state.begin(false);
    ASSERT_TRUE(resumed);
    EXPECT_TRUE(state.completeIfActive(*resumed));
    EXPECT_EQ(state.status(), TransferStatus::Complete);
}

TEST(TransferStateTest, StaleRunCannotTouchState) {
    TransferState state;
    const auto stale = state.begin(true);
    ASSERT_TRUE(stale);
    state.setTotalIfUnknown(*stale, 10);
    state.pause();

    const auto current = state.begin(false);
    ASSERT_TRUE(current);
    ASSERT_NE(*stale, *current);

    state.addTransferred(*stale, 5);
    state.fail(*stale, "late failure");
    EXPECT_FALSE(state.isActive(*stale));
    EXPECT_FALSE(state.completeIfActive(*stale));

    EXPECT_EQ(state.status(), TransferStatus::Downloading);
    EXPECT_EQ(state.transferredBytes(), 0);
    EXPECT_TRUE(state.errorMessage().empty());
}

TEST(TransferStateTest, TotalIsSetOnce) {
    TransferState state;
    const auto run = state.begin(true);
    ASSERT_TRUE(run);
    state.setTotalIfUnknown(*run, 1000);
    state.setTotalIfUnknown(*run, 600);
    EXPECT_EQ(state.totalBytes(), 1000);

    state.addTransferred(*run, 400);
    state.restart(*run, 1200);
    EXPECT_EQ(state.totalBytes(), 1200);
    EXPECT_EQ(state.transferredBytes(), 0);
}

TEST(TransferStateTest, FileIsAssignedOncePerDownload) {
    TransferState state;
    const auto run = state.begin(true);
    ASSERT_TRUE(run);
    state.assignFile(*run, "a.bin", "dir/a.bin");
    state.assignFile(*run, "b.bin", "dir/b.bin");
    EXPECT_EQ(state.filename(), "a.bin");
    EXPECT_EQ(state.filepath(), "dir/a.bin");
}

TEST(TransferStateTest, FailureRecordsMessageAndNextBeginClearsIt) {
    TransferState state;
    const auto run = state.begin(true);
    ASSERT_TRUE(run);
    state.fail(*run, "Bad Gateway!");
    EXPECT_EQ(state.status(), TransferStatus::Error);
    EXPECT_EQ(state.errorMessage(), "Bad Gateway!");

    ASSERT_TRUE(state.begin(true));
    EXPECT_TRUE(state.errorMessage().empty());
}

TEST(TransferStateTest, StatusNames) {
    EXPECT_EQ(toString(TransferStatus::Idle), "Idle");
    EXPECT_EQ(toString(TransferStatus::Downloading), "Downloading");
    EXPECT_EQ(toString(TransferStatus::Paused), "Paused");
    EXPECT_EQ(toString(TransferStatus::Cancelled), "Cancelled");
    EXPECT_EQ(toString(TransferStatus::Complete), "Complete");
    EXPECT_EQ(toString(TransferStatus::Error), "Error");

    EXPECT_TRUE(isTerminal(TransferStatus::Complete));
    EXPECT_TRUE(isTerminal(TransferStatus::Cancelled));
    EXPECT_TRUE(isTerminal(TransferStatus::Error));
    EXPECT_FALSE(isTerminal(TransferStatus::Paused));
}

TEST(ProgressTest, PercentOfKnownTotal) {
    EXPECT_FLOAT_EQ(computeProgress(-1, 0), 0.0F);
    EXPECT_FLOAT_EQ(computeProgress(0, 0), 0.0F);
    EXPECT_FLOAT_EQ(computeProgress(1000, 0), 0.0F);
    EXPECT_FLOAT_EQ(computeProgress(1000, 400), 40.0F);
    EXPECT_FLOAT_EQ(computeProgress(1000, 1000), 100.0F);
    EXPECT_FLOAT_EQ(computeProgress(1000, 1500), 100.0F);
}
