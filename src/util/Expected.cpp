#include "util/Expected.hpp"

namespace monosync {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "ok";
        case ErrorCode::InvalidArgs: return "invalid-args";
        case ErrorCode::NotARepository: return "not-a-repository";
        case ErrorCode::AlreadyInitialized: return "already-initialized";
        case ErrorCode::IoError: return "io-error";
        case ErrorCode::CorruptObject: return "corrupt-object";
        case ErrorCode::NotFound: return "not-found";
        case ErrorCode::UnsyncedAncestor: return "unsynced-ancestor";
        case ErrorCode::MappingConflict: return "mapping-conflict";
        case ErrorCode::RebaseConflict: return "rebase-conflict";
        case ErrorCode::TooManyRetries: return "too-many-retries";
        case ErrorCode::HookRejected: return "hook-rejected";
        case ErrorCode::InternalError: return "internal-error";
    }
    return "unknown";
}

std::string Error::describe() const {
    std::string out = std::string(errorCodeName(code)) + ": " + message;
    for (const auto& d : details) {
        out += "\n  ";
        out += d;
    }
    return out;
}

}
