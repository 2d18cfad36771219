#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace DJ {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NoSuchPath,
        InvalidPath,
        InvalidType,
        MalformedInput,
        TypeMismatch,
        NotFound,
        ReferenceNotFound,
        ArithmeticError,
        ImportFormatError,
        PersistFormatError,
        IoError
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NoSuchPath:
        return "no_such_path";
    case Error::Code::InvalidPath:
        return "invalid_path";
    case Error::Code::InvalidType:
        return "invalid_type";
    case Error::Code::MalformedInput:
        return "malformed_input";
    case Error::Code::TypeMismatch:
        return "type_mismatch";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::ReferenceNotFound:
        return "reference_not_found";
    case Error::Code::ArithmeticError:
        return "arithmetic_error";
    case Error::Code::ImportFormatError:
        return "import_format_error";
    case Error::Code::PersistFormatError:
        return "persist_format_error";
    case Error::Code::IoError:
        return "io_error";
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

} // namespace DJ
