#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace GS {

struct Error {
    enum class Code {
        UnknownError = 0,
        InvalidArgument,
        MalformedInput,
        NotFound,
        IoError,
        ConfigurationError,
        SurfaceMismatch,
        SchemaViolation,
        Leakage,
        WorkerFailure
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto makeError(Error::Code code, std::string message) -> Error {
    return Error{code, std::move(message)};
}

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::IoError:
        return "io_error";
    case Error::Code::ConfigurationError:
        return "configuration_error";
    case Error::Code::SurfaceMismatch:
        return "surface_mismatch";
    case Error::Code::SchemaViolation:
        return "schema_violation";
    case Error::Code::Leakage:
        return "leakage";
    case Error::Code::WorkerFailure:
        return "worker_failure";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace GS
