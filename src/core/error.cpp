#include "chunkup/core/error.hpp"

namespace chunkup {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::WriterClosed: return "WriterClosed";
        case ErrorCode::WriterCancelled: return "WriterCancelled";
        case ErrorCode::UploadFailed: return "UploadFailed";
        case ErrorCode::NoObjects: return "NoObjects";
        case ErrorCode::IncompleteUpload: return "IncompleteUpload";
        case ErrorCode::ComposeFailed: return "ComposeFailed";
        case ErrorCode::DeleteFailed: return "DeleteFailed";
        case ErrorCode::ListFailed: return "ListFailed";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::PreconditionFailed: return "PreconditionFailed";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
    }
    return "Unknown";
}

std::string Error::describe() const {
    std::string out = to_string(code);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

} // namespace chunkup
