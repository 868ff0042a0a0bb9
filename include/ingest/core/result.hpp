#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace ingest {

/**
 * @brief Failure classes used across the pipeline
 *
 * Transient      - worth retrying (5xx, transport, timeout)
 * ChunkRejected  - server refused the chunk (non-5xx), never retried
 * FileAborted    - the whole file is abandoned (read failure, health check)
 * Cancelled      - caller raised the cancellation token; not a failure
 * Persistence    - cache / index I/O, logged and swallowed by the stores
 * InvalidArgument, Shutdown - programming / lifecycle errors
 */
enum class ErrorCode {
    Transient,
    ChunkRejected,
    FileAborted,
    Cancelled,
    Persistence,
    InvalidArgument,
    Shutdown
};

struct Error {
    ErrorCode code = ErrorCode::Transient;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool is_cancelled() const noexcept { return code == ErrorCode::Cancelled; }
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Transient: return "transient";
        case ErrorCode::ChunkRejected: return "chunk_rejected";
        case ErrorCode::FileAborted: return "file_aborted";
        case ErrorCode::Cancelled: return "cancelled";
        case ErrorCode::Persistence: return "persistence";
        case ErrorCode::InvalidArgument: return "invalid_argument";
        case ErrorCode::Shutdown: return "shutdown";
    }
    return "unknown";
}

// Helper wrapper types for disambiguation when T == E
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = Error>
class Result {
private:
    std::variant<T, E> data_;

public:
    Result(OkValue<T> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}
    Result(ErrValue<E> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(ErrValue<E> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
Result<T> Ok(T value) { return Result<T>(OkValue<T>(std::move(value))); }

inline Result<void> Ok() { return Result<void>(); }

template<typename T, typename E = Error>
Result<T, E> Err(E error) { return Result<T, E>(ErrValue<E>(std::move(error))); }

template<typename T>
Result<T> Err(ErrorCode code, std::string message) {
    return Result<T>(ErrValue<Error>(Error{code, std::move(message)}));
}

} // namespace ingest
