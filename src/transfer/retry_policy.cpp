#include "chunkup/transfer/retry_policy.hpp"
#include "chunkup/core/logger.hpp"
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <memory>
#include <string>

namespace chunkup::transfer {

namespace {

struct RetryState : std::enable_shared_from_this<RetryState> {
    boost::asio::io_context& io_context;
    CancellationToken token;
    RetryPolicy::Attempt attempt;
    RetryPolicy::Completion done;
    RetryPolicy policy;
    boost::asio::steady_timer timer;
    std::uint32_t attempts = 0;
    std::string last_error;
    CancellationToken::Registration wake = 0;

    RetryState(boost::asio::io_context& io, CancellationToken tok, RetryPolicy::Attempt fn,
               RetryPolicy::Completion completion, const RetryPolicy& retry_policy)
        : io_context(io)
        , token(std::move(tok))
        , attempt(std::move(fn))
        , done(std::move(completion))
        , policy(retry_policy)
        , timer(io) {}

    void run() {
        if (token.is_cancelled()) {
            finish(RetryOutcome{false, attempts, last_error.empty() ? "Aborted" : last_error, true});
            return;
        }

        ++attempts;
        auto self = shared_from_this();
        attempt(attempts, [self](ChunkResponse response) {
            self->on_response(std::move(response));
        });
    }

    void on_response(ChunkResponse response) {
        if (response.success) {
            finish(RetryOutcome{true, attempts, {}, false});
            return;
        }

        if (token.is_cancelled()) {
            finish(RetryOutcome{false, attempts, response.error, true});
            return;
        }

        if (!policy.should_retry(attempts)) {
            finish(RetryOutcome{false, attempts, response.error, false});
            return;
        }

        LOG_DEBUG("Attempt {} failed ({}), retrying", attempts, response.error);
        last_error = std::move(response.error);

        auto self = shared_from_this();
        if (policy.retry_delay().count() > 0) {
            timer.expires_after(policy.retry_delay());
            timer.async_wait([self](const boost::system::error_code& ec) {
                self->token.remove(self->wake);
                self->wake = 0;
                if (ec == boost::asio::error::operation_aborted || self->token.is_cancelled()) {
                    self->finish(RetryOutcome{false, self->attempts, self->last_error, true});
                    return;
                }
                self->run();
            });

            // A pause or cancel must not sit out the whole delay.
            std::weak_ptr<RetryState> weak = self;
            wake = token.on_cancel([weak]() {
                if (auto state = weak.lock()) {
                    boost::asio::post(state->io_context, [state]() { state->timer.cancel(); });
                }
            });
        } else {
            boost::asio::post(io_context, [self]() { self->run(); });
        }
    }

    void finish(RetryOutcome outcome) {
        auto self = shared_from_this();
        boost::asio::post(io_context, [self, outcome = std::move(outcome)]() {
            self->done(outcome);
        });
    }
};

}

RetryPolicy::RetryPolicy(std::uint32_t max_retries, std::chrono::milliseconds retry_delay)
    : max_retries_(max_retries)
    , retry_delay_(retry_delay) {
}

void RetryPolicy::execute(boost::asio::io_context& io_context,
                          CancellationToken token,
                          Attempt attempt,
                          Completion done) const {
    auto state = std::make_shared<RetryState>(io_context, std::move(token), std::move(attempt),
                                              std::move(done), *this);
    boost::asio::post(io_context, [state]() { state->run(); });
}

} // namespace chunkup::transfer
