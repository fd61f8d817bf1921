#include <gtest/gtest.h>
#include "chunkup/transfer/upload_controller.hpp"

using namespace chunkup::transfer;
using chunkup::storage::UploadStatus;

TEST(UploadControllerTest, TransitionTable) {
    EXPECT_TRUE(UploadController::can_transition(UploadStatus::PREPARING, UploadStatus::UPLOADING));
    EXPECT_TRUE(UploadController::can_transition(UploadStatus::PAUSED, UploadStatus::UPLOADING));
    EXPECT_TRUE(UploadController::can_transition(UploadStatus::UPLOADING, UploadStatus::PAUSED));
    EXPECT_TRUE(UploadController::can_transition(UploadStatus::UPLOADING, UploadStatus::COMPLETED));
    EXPECT_TRUE(UploadController::can_transition(UploadStatus::PAUSED, UploadStatus::ERROR));

    EXPECT_FALSE(UploadController::can_transition(UploadStatus::PREPARING, UploadStatus::PAUSED));
    EXPECT_FALSE(UploadController::can_transition(UploadStatus::COMPLETED, UploadStatus::UPLOADING));
    EXPECT_FALSE(UploadController::can_transition(UploadStatus::ERROR, UploadStatus::UPLOADING));
    EXPECT_FALSE(UploadController::can_transition(UploadStatus::ERROR, UploadStatus::COMPLETED));
    EXPECT_FALSE(UploadController::can_transition(UploadStatus::UPLOADING, UploadStatus::PREPARING));
}

TEST(UploadControllerTest, PauseResumeCycle) {
    UploadController controller;
    EXPECT_EQ(controller.status(), UploadStatus::PREPARING);
    EXPECT_FALSE(controller.should_schedule());

    EXPECT_TRUE(controller.start());
    EXPECT_TRUE(controller.should_schedule());

    auto first = controller.token();
    EXPECT_TRUE(controller.pause());
    EXPECT_EQ(controller.status(), UploadStatus::PAUSED);
    EXPECT_TRUE(first.is_cancelled());
    EXPECT_FALSE(controller.should_schedule());

    EXPECT_FALSE(controller.pause());

    EXPECT_TRUE(controller.resume());
    EXPECT_EQ(controller.status(), UploadStatus::UPLOADING);
    EXPECT_FALSE(controller.token().is_cancelled());
    EXPECT_TRUE(first.is_cancelled());
}

TEST(UploadControllerTest, ResumeRequiresPause) {
    UploadController controller;
    EXPECT_FALSE(controller.resume());

    controller.start();
    EXPECT_FALSE(controller.resume());
}

TEST(UploadControllerTest, CancelIsTerminal) {
    UploadController controller;
    controller.start();
    auto token = controller.token();

    EXPECT_TRUE(controller.cancel());
    EXPECT_EQ(controller.status(), UploadStatus::ERROR);
    EXPECT_TRUE(controller.is_cancelled());
    EXPECT_TRUE(controller.is_terminal());
    EXPECT_TRUE(token.is_cancelled());

    EXPECT_FALSE(controller.cancel());
    EXPECT_FALSE(controller.start());
    EXPECT_FALSE(controller.resume());
    EXPECT_FALSE(controller.complete());
}

TEST(UploadControllerTest, FailIsNotCancel) {
    UploadController controller;
    controller.start();

    EXPECT_TRUE(controller.fail());
    EXPECT_EQ(controller.status(), UploadStatus::ERROR);
    EXPECT_FALSE(controller.is_cancelled());
    EXPECT_TRUE(controller.is_terminal());
}

TEST(UploadControllerTest, CompleteFromUploading) {
    UploadController controller;
    EXPECT_FALSE(controller.complete());

    controller.start();
    EXPECT_TRUE(controller.complete());
    EXPECT_TRUE(controller.is_terminal());
    EXPECT_FALSE(controller.pause());
}

TEST(UploadControllerTest, StartFromPausedSession) {
    UploadController controller(UploadStatus::PAUSED);
    EXPECT_TRUE(controller.start());
    EXPECT_EQ(controller.status(), UploadStatus::UPLOADING);
}

TEST(CancellationTokenTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_EQ(token.on_cancel([]() {}), 0u);
}

TEST(CancellationTokenTest, CallbacksRunOnceOnCancel) {
    CancellationSource source;
    auto token = source.token();

    int fired = 0;
    token.on_cancel([&fired]() { ++fired; });
    token.on_cancel([&fired]() { ++fired; });

    source.cancel();
    source.cancel();
    EXPECT_EQ(fired, 2);
    EXPECT_TRUE(token.is_cancelled());
}

TEST(CancellationTokenTest, RemovedCallbackDoesNotRun) {
    CancellationSource source;
    auto token = source.token();

    bool fired = false;
    auto registration = token.on_cancel([&fired]() { fired = true; });
    EXPECT_NE(registration, 0u);
    token.remove(registration);

    source.cancel();
    EXPECT_FALSE(fired);
}

TEST(CancellationTokenTest, RegisteringAfterCancelRunsImmediately) {
    CancellationSource source;
    source.cancel();

    bool fired = false;
    auto registration = source.token().on_cancel([&fired]() { fired = true; });
    EXPECT_TRUE(fired);
    EXPECT_EQ(registration, 0u);
}
