#pragma once

#include "chunkup/network/protocol.hpp"
#include "chunkup/transfer/upload_service.hpp"
#include "chunkup/transfer/validation_policy.hpp"
#include <boost/asio/io_context.hpp>
#include <chrono>
#include <string>

namespace chunkup::network {

// UploadService that talks to an UploadServer. Every chunk or merge call opens
// its own connection on the caller's io_context; a cancelled token closes it.
class RemoteUploadService : public transfer::UploadService {
public:
    static constexpr std::chrono::seconds DEFAULT_REQUEST_TIMEOUT{60};

    RemoteUploadService(boost::asio::io_context& io_context,
                        std::string host,
                        std::uint16_t port,
                        transfer::FileValidationPolicy policy = {});

    void set_request_timeout(std::chrono::milliseconds timeout) { request_timeout_ = timeout; }

    transfer::ValidationResult validate_file(const storage::FileInfo& file) override;

    void async_upload_chunk(transfer::ChunkRequest request,
                            transfer::CancellationToken token,
                            ChunkHandler handler) override;

    void async_merge_chunks(transfer::MergeRequest request,
                            transfer::CancellationToken token,
                            MergeHandler handler) override;

    const std::string& host() const { return host_; }
    std::uint16_t port() const { return port_; }

private:
    boost::asio::io_context& io_context_;
    std::string host_;
    std::uint16_t port_;
    transfer::FileValidationPolicy policy_;
    std::chrono::milliseconds request_timeout_;
};

} // namespace chunkup::network
