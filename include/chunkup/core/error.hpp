#pragma once

#include <string>

namespace chunkup {

/**
 * @brief Failure categories reported by the upload engine and object stores
 */
enum class ErrorCode {
    WriterClosed,        ///< write() after close()
    WriterCancelled,     ///< commit() after cancel()
    UploadFailed,        ///< chunk target creation, streaming or commit failed
    NoObjects,           ///< commit found no sub-objects for the path
    IncompleteUpload,    ///< sub-objects do not tile the written byte range
    ComposeFailed,
    DeleteFailed,
    ListFailed,
    NotFound,
    PreconditionFailed,  ///< generation mismatch on compose or delete
    InvalidArgument,
    IoError
};

const char* to_string(ErrorCode code) noexcept;

struct Error {
    ErrorCode code = ErrorCode::IoError;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    /// "<CodeName>: <message>", used in log lines
    std::string describe() const;
};

} // namespace chunkup
