#pragma once

#include <string>
#include <utility>

namespace chunkup::core {

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT,
    INVALID_STATE,
    NOT_FOUND,
    FILE_READ_ERROR,
    FILE_WRITE_ERROR,
    CHECKSUM_MISMATCH,
    INCOMPLETE_UPLOAD,
    DATABASE_ERROR,
    NETWORK_ERROR,
    PROTOCOL_ERROR
};

struct Result {
    ErrorCode error;
    std::string message;

    Result(ErrorCode err = ErrorCode::SUCCESS, std::string msg = "")
        : error(err), message(std::move(msg)) {}

    bool success() const { return error == ErrorCode::SUCCESS; }
    operator bool() const { return success(); }
};

} // namespace chunkup::core
