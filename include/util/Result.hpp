#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace tankobon::util {

enum class ErrorKind {
    Decode,
    InvalidDimensions,
    Fetch,
    ExtractionEmpty,
    NavigationTimeout,
    Assembly,
    ArtifactIO,
    FatalRun,
};

struct Error {
    ErrorKind kind = ErrorKind::FatalRun;
    std::string message;
};

const char* to_string(ErrorKind kind);

// Value-or-error return used across component boundaries.
// T must not be Error itself.
template <typename T>
class Result {
public:
    Result(T value) : data_(std::move(value)) {}
    Result(Error error) : data_(std::move(error)) {}

    static Result failure(ErrorKind kind, std::string message) {
        return Result(Error{kind, std::move(message)});
    }

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    T& value() & { return std::get<T>(data_); }
    const T& value() const& { return std::get<T>(data_); }
    T&& value() && { return std::get<T>(std::move(data_)); }

    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

using Status = Result<std::monostate>;

inline Status success() {
    return Status(std::monostate{});
}

// FatalRunError: aborts the whole run and surfaces to the caller
class RunError : public std::runtime_error {
public:
    explicit RunError(const std::string& message) : std::runtime_error(message) {}
};

}  // namespace tankobon::util
