#pragma once

#include <string>
#include <utility>
#include <vector>

namespace monosync {

enum class ErrorCode {
    None = 0,
    InvalidArgs,
    NotARepository,
    AlreadyInitialized,
    IoError,
    CorruptObject,
    NotFound,
    UnsyncedAncestor,   // rewrite attempted before a parent was synced
    MappingConflict,    // one source commit claimed by two different targets
    RebaseConflict,     // pushed batch overlaps files changed on the bookmark
    TooManyRetries,     // bookmark kept moving under the pushrebase
    HookRejected,       // a push hook refused a pushed commit
    InternalError
};

/// Short stable name for an error code (used in CLI output and logs)
const char* errorCodeName(ErrorCode code);

/**
 * @brief Failure description returned through Expected
 *
 * `details` holds the context needed to diagnose a failure without access
 * to internal state: the conflicting paths of a RebaseConflict, the existing
 * and attempted target ids of a MappingConflict, the identifier that did not
 * resolve for NotFound.
 */
struct Error {
    ErrorCode code{ErrorCode::None};
    std::string message;
    std::vector<std::string> details{};

    std::string describe() const;
};

template <typename T>
class Expected {
public:
    Expected(const T& value) : hasValue(true), value_(value) {}
    Expected(T&& value) : hasValue(true), value_(std::move(value)) {}
    Expected(const Error& err) : hasValue(false), error_(err) {}
    Expected(Error&& err) : hasValue(false), error_(std::move(err)) {}

    bool has_value() const { return hasValue; }
    explicit operator bool() const { return hasValue; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

private:
    bool hasValue{false};
    T value_{};
    Error error_{};
};

template <>
class Expected<void> {
public:
    Expected() : ok(true) {}
    Expected(const Error& err) : ok(false), error_(err) {}
    Expected(Error&& err) : ok(false), error_(std::move(err)) {}
    bool has_value() const { return ok; }
    explicit operator bool() const { return ok; }
    const Error& error() const { return error_; }

private:
    bool ok{false};
    Error error_{};
};

}
