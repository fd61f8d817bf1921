#pragma once

#include "upload_controller.hpp"
#include "upload_service.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <cstdint>

namespace chunkup::transfer {

struct RetryOutcome {
    bool success;
    std::uint32_t attempts;
    std::string last_error;
    bool aborted;   // stopped by the cancellation token, not by the retry cap
};

// Bounded retry around one chunk transfer. Every failure is retried the same way
// until max_retries is spent.
class RetryPolicy {
public:
    static constexpr std::uint32_t DEFAULT_MAX_RETRIES = 3;

    using Attempt = std::function<void(std::uint32_t attempt_number, UploadService::ChunkHandler handler)>;
    using Completion = std::function<void(const RetryOutcome&)>;

    explicit RetryPolicy(std::uint32_t max_retries = DEFAULT_MAX_RETRIES,
                         std::chrono::milliseconds retry_delay = std::chrono::milliseconds(0));

    std::uint32_t max_retries() const { return max_retries_; }
    std::uint32_t max_attempts() const { return max_retries_ + 1; }
    std::chrono::milliseconds retry_delay() const { return retry_delay_; }

    bool should_retry(std::uint32_t attempts_made) const { return attempts_made < max_attempts(); }

    // Runs attempt until it succeeds, the cap is reached or the token fires.
    // done is always invoked exactly once, never from inside execute().
    void execute(boost::asio::io_context& io_context,
                 CancellationToken token,
                 Attempt attempt,
                 Completion done) const;

private:
    std::uint32_t max_retries_;
    std::chrono::milliseconds retry_delay_;
};

} // namespace chunkup::transfer
