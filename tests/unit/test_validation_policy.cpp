#include <gtest/gtest.h>
#include "chunkup/transfer/validation_policy.hpp"
#include "chunkup/transfer/upload_error.hpp"

using namespace chunkup::transfer;
using chunkup::storage::FileInfo;

TEST(FileValidationPolicyTest, AcceptsSupportedAudio) {
    FileValidationPolicy policy;
    auto result = policy.validate(FileInfo{"song.mp3", 5 * 1024 * 1024, "audio/mpeg"});
    EXPECT_TRUE(result.valid);
    EXPECT_TRUE(result.error.empty());
}

TEST(FileValidationPolicyTest, TypeMatchIsCaseInsensitive) {
    FileValidationPolicy policy;
    EXPECT_TRUE(policy.validate(FileInfo{"clip.mov", 10, "Video/QuickTime"}).valid);
}

TEST(FileValidationPolicyTest, RejectsEmptyFile) {
    FileValidationPolicy policy;
    auto result = policy.validate(FileInfo{"empty.wav", 0, "audio/wav"});
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, "File is empty");
}

TEST(FileValidationPolicyTest, RejectsOversizedFile) {
    FileValidationPolicy policy(1000, {"audio/wav"});
    auto result = policy.validate(FileInfo{"big.wav", 1001, "audio/wav"});
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error.rfind("File size exceeds maximum limit of 1000 bytes", 0), 0u);

    EXPECT_TRUE(policy.validate(FileInfo{"edge.wav", 1000, "audio/wav"}).valid);
}

TEST(FileValidationPolicyTest, DefaultLimitIsTwoGigabytes) {
    FileValidationPolicy policy;
    EXPECT_EQ(policy.max_file_size(), 2147483648ULL);
    EXPECT_FALSE(policy.validate(FileInfo{"huge.mp4", 2147483649ULL, "video/mp4"}).valid);
}

TEST(FileValidationPolicyTest, RejectsUnsupportedType) {
    FileValidationPolicy policy;
    auto result = policy.validate(FileInfo{"notes.txt", 100, "text/plain"});
    EXPECT_FALSE(result.valid);
    EXPECT_EQ(result.error, "Unsupported file type: text/plain");
}

TEST(FileValidationPolicyTest, EmptyAllowListAcceptsAnything) {
    FileValidationPolicy policy(1 << 20, {});
    EXPECT_TRUE(policy.validate(FileInfo{"notes.txt", 100, "text/plain"}).valid);
}

TEST(UploadErrorTest, Messages) {
    EXPECT_EQ(UploadError::chunk_failed(3, 4).message(), "Failed to upload chunk 3 after 3 retries");
    EXPECT_EQ(UploadError::chunk_failed(0, 1).retries(), 0u);
    EXPECT_EQ(UploadError::merge_failed("HTTP 500").message(), "Failed to merge chunks: HTTP 500");
    EXPECT_EQ(UploadError::cancelled().message(), "Upload cancelled");
    EXPECT_EQ(UploadError::validation_failed("File is empty").message(), "File is empty");
    EXPECT_EQ(UploadError::session_not_found("upload_x").message(), "Upload session not found: upload_x");
    EXPECT_EQ(to_string(UploadErrorKind::SESSION_LOCKED), "session_locked");
}

TEST(UploadErrorTest, OutcomeHelpers) {
    auto ok = UploadOutcome::completed("upload_a", "/uploads/a.wav");
    EXPECT_TRUE(ok.success());
    EXPECT_FALSE(ok.cancelled());

    auto cancelled = UploadOutcome::failed("upload_a", UploadError::cancelled());
    EXPECT_FALSE(cancelled.success());
    EXPECT_TRUE(cancelled.cancelled());
}
