#include "chunkup/core/command_handler.hpp"
#include "chunkup/core/config.hpp"
#include "chunkup/core/logger.hpp"
#include "chunkup/core/utils.hpp"
#include "chunkup/network/remote_upload_service.hpp"
#include "chunkup/network/upload_server.hpp"
#include "chunkup/storage/byte_source.hpp"
#include "chunkup/storage/session_store.hpp"
#include "chunkup/storage/storage_config.hpp"
#include "chunkup/transfer/upload_manager.hpp"
#include "chunkup/transfer/validation_policy.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <csignal>
#include <iostream>
#include <iomanip>
#include <optional>
#include <set>

namespace chunkup::core {

namespace {

using utils::StringUtils;

const std::set<std::string> kModes = {"fast", "balanced", "precision"};

std::shared_ptr<storage::SessionStore> open_store() {
    auto& config = Config::instance();
    auto path = utils::FileUtils::expand_home(config.get_string("store.path", "chunkup.db"));

    auto store = std::make_shared<storage::SessionStore>(path);
    if (!store->initialize()) {
        return nullptr;
    }
    return store;
}

std::shared_ptr<network::RemoteUploadService> make_service(boost::asio::io_context& io_context) {
    auto& config = Config::instance();
    transfer::FileValidationPolicy policy(
        config.get_uint64("upload.max_file_size", transfer::FileValidationPolicy::DEFAULT_MAX_FILE_SIZE),
        transfer::FileValidationPolicy::default_allowed_types());

    return std::make_shared<network::RemoteUploadService>(
        io_context,
        config.get_string("server.host", "127.0.0.1"),
        static_cast<std::uint16_t>(config.get_int("server.port", 9440)),
        std::move(policy));
}

void print_progress(const transfer::UploadProgress& progress) {
    constexpr int width = 30;
    int filled = progress.percentage * width / 100;

    std::cout << "\r  [" << std::string(filled, '#') << std::string(width - filled, ' ') << "] "
              << std::setw(3) << progress.percentage << "%  "
              << StringUtils::format_bytes(progress.uploaded_bytes) << " / "
              << StringUtils::format_bytes(progress.total_bytes) << "  "
              << StringUtils::format_bytes(static_cast<std::uint64_t>(progress.speed)) << "/s";

    if (progress.remaining_time > 0) {
        std::cout << "  ETA " << StringUtils::format_duration(
            std::chrono::milliseconds(static_cast<std::int64_t>(progress.remaining_time * 1000)));
    }
    std::cout << "   " << std::flush;
}

// Runs the io_context until the upload finishes or SIGINT pauses it.
CommandResult run_upload(boost::asio::io_context& io_context,
                         transfer::UploadManager& manager,
                         const std::string& upload_id,
                         std::optional<transfer::UploadOutcome>& outcome,
                         const std::string& file_path) {
    boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
    bool paused = false;

    signals.async_wait([&](const boost::system::error_code& ec, int) {
        if (ec) return;
        paused = manager.pause(upload_id);
    });

    // Completion may already be queued (validation failures are reported that way).
    while (!outcome && !paused && io_context.run_one() > 0) {
    }

    signals.cancel();
    io_context.run();
    std::cout << "\n";

    if (outcome) {
        if (outcome->success()) {
            std::cout << "✓ Upload complete\n";
            std::cout << "  Upload ID: " << outcome->upload_id << "\n";
            std::cout << "  Stored as: " << outcome->storage_path << "\n";
            return CommandResult::ok("Upload completed");
        }

        const auto& error = *outcome->error;
        if (error.kind == transfer::UploadErrorKind::MERGE_FAILED) {
            std::cout << "All chunks were uploaded; the session is kept for another finalize attempt.\n";
        } else if (error.kind == transfer::UploadErrorKind::CHUNK_FAILED) {
            std::cout << "Resume with: chunkup resume " << outcome->upload_id << " " << file_path << "\n";
        }
        return CommandResult::error(error.message());
    }

    std::cout << "Upload paused.\n";
    std::cout << "Resume with: chunkup resume " << upload_id << " " << file_path << "\n";
    return CommandResult::ok("Upload paused");
}

}

CommandResult ServeCommandHandler::execute(const std::vector<std::string>& args) {
    auto& config = Config::instance();

    storage::StorageConfig storage_config;
    storage_config.staging_directory = utils::FileUtils::expand_home(
        config.get_string("server.staging_dir", "./chunkup_data/staging"));
    storage_config.storage_directory = utils::FileUtils::expand_home(
        config.get_string("server.storage_dir", "./chunkup_data/files"));

    auto host = config.get_string("server.host", "127.0.0.1");
    auto port = static_cast<std::uint16_t>(config.get_int("server.port", 9440));

    try {
        network::UploadServer server(storage_config, host, port);
        if (!server.start()) {
            return CommandResult::error("Failed to start upload server on " + host + ":" + std::to_string(port));
        }

        std::cout << "Upload server listening on " << host << ":" << server.port() << "\n";
        std::cout << "  Staging: " << storage_config.staging_directory.string() << "\n";
        std::cout << "  Storage: " << storage_config.storage_directory.string() << "\n";
        std::cout << "Press Ctrl+C to stop.\n";

        boost::asio::io_context io_context;
        boost::asio::signal_set signals(io_context, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code&, int) {});
        io_context.run();

        server.stop();
        return CommandResult::ok("Server stopped");

    } catch (const std::exception& e) {
        return CommandResult::error("Server failed: " + std::string(e.what()));
    }
}

CommandResult UploadCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto& config = Config::instance();
    std::filesystem::path file_path = utils::FileUtils::expand_home(args[1]);

    if (!utils::FileUtils::is_file(file_path)) {
        return CommandResult::error("File does not exist: " + file_path.string());
    }

    auto mode = config.get_string("upload.mode", "balanced");
    if (kModes.count(mode) == 0) {
        return CommandResult::error("Unknown mode: " + mode + " (expected fast, balanced or precision)");
    }

    try {
        auto store = open_store();
        if (!store) {
            return CommandResult::error("Failed to open session database");
        }

        auto source = std::make_shared<storage::FileByteSource>(file_path, config.get_string("upload.type"));
        if (!source->is_open()) {
            return CommandResult::error("Cannot read file: " + file_path.string());
        }

        boost::asio::io_context io_context;
        transfer::UploadManager manager(io_context, make_service(io_context), store,
                                        transfer::ManagerOptions::from_config(config));
        manager.purge_expired();

        std::cout << "Uploading " << source->info().name << " ("
                  << StringUtils::format_bytes(source->info().size) << ", " << source->info().type << ")\n";

        std::optional<transfer::UploadOutcome> outcome;
        auto upload_id = manager.upload_file(source,
            [&outcome](const transfer::UploadOutcome& result) { outcome = result; },
            print_progress,
            {{"mode", mode}});

        if (!upload_id.empty()) {
            std::cout << "  Upload ID: " << upload_id << "\n";
        }

        return run_upload(io_context, manager, upload_id, outcome, file_path.string());

    } catch (const std::exception& e) {
        return CommandResult::error("Upload failed: " + std::string(e.what()));
    }
}

CommandResult ResumeCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 3) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto& config = Config::instance();
    const auto& upload_id = args[1];
    std::filesystem::path file_path = utils::FileUtils::expand_home(args[2]);

    try {
        auto store = open_store();
        if (!store) {
            return CommandResult::error("Failed to open session database");
        }

        auto stored = store->load(upload_id);
        if (!stored) {
            return CommandResult::error("Upload session not found: " + upload_id);
        }

        boost::asio::io_context io_context;
        transfer::UploadManager manager(io_context, make_service(io_context), store,
                                        transfer::ManagerOptions::from_config(config));

        std::cout << "Resuming " << stored->file_name << " at " << stored->percentage() << "% ("
                  << stored->uploaded_chunks.size() << "/" << stored->total_chunks << " chunks)\n";

        std::optional<transfer::UploadOutcome> outcome;
        auto on_done = [&outcome](const transfer::UploadOutcome& result) { outcome = result; };

        if (stored->is_complete()) {
            manager.retry_finalize(upload_id, on_done, {{"mode", config.get_string("upload.mode", "balanced")}});
        } else {
            // The stored type wins over extension guessing so a matching file is accepted.
            auto type = config.get_string("upload.type", stored->file_type);
            auto source = std::make_shared<storage::FileByteSource>(file_path, type);
            if (!source->is_open()) {
                return CommandResult::error("Cannot read file: " + file_path.string());
            }
            manager.resume_upload(upload_id, source, on_done, print_progress,
                                  {{"mode", config.get_string("upload.mode", "balanced")}});
        }

        return run_upload(io_context, manager, upload_id, outcome, file_path.string());

    } catch (const std::exception& e) {
        return CommandResult::error("Resume failed: " + std::string(e.what()));
    }
}

CommandResult ListCommandHandler::execute(const std::vector<std::string>& args) {
    auto store = open_store();
    if (!store) {
        return CommandResult::error("Failed to open session database");
    }

    auto uploads = store->list_resumable(utils::TimeUtils::now());
    if (uploads.empty()) {
        std::cout << "No resumable uploads.\n";
        return CommandResult::ok();
    }

    std::cout << "Resumable uploads (" << uploads.size() << "):\n";
    for (const auto& upload : uploads) {
        std::cout << "  " << upload.upload_id << "\n";
        std::cout << "    File: " << upload.file_name << " (" << StringUtils::format_bytes(upload.file_size) << ")\n";
        std::cout << "    Progress: " << upload.progress << "%\n";
        std::cout << "    Expires: " << utils::TimeUtils::format_timestamp(upload.expires_at) << "\n";
    }

    return CommandResult::ok();
}

CommandResult CancelCommandHandler::execute(const std::vector<std::string>& args) {
    if (args.size() < 2) {
        return CommandResult::error("Usage: " + get_usage());
    }

    auto store = open_store();
    if (!store) {
        return CommandResult::error("Failed to open session database");
    }

    boost::asio::io_context io_context;
    transfer::UploadManager manager(io_context, make_service(io_context), store,
                                    transfer::ManagerOptions::from_config(Config::instance()));

    if (!manager.cancel(args[1])) {
        return CommandResult::error("No cancellable upload with id " + args[1]);
    }

    std::cout << "✓ Upload " << args[1] << " discarded\n";
    return CommandResult::ok();
}

CommandResult PurgeCommandHandler::execute(const std::vector<std::string>& args) {
    auto store = open_store();
    if (!store) {
        return CommandResult::error("Failed to open session database");
    }

    auto removed = store->purge_expired(utils::TimeUtils::now());
    std::cout << "Removed " << removed << " expired upload session(s)\n";
    return CommandResult::ok();
}

} // namespace chunkup::core
