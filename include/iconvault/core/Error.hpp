#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace IV {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        FileTooLarge,
        EmptyFile,
        ExtensionMismatch,
        MimeMismatch,
        MalformedJson,
        MalformedXml,
        EmptySvg,
        DoctypeNotAllowed,
        EntityNotAllowed,
        ScriptNotAllowed,
        InvalidSvg,
        SanitizationFailed,
        StorageFailed,
        NotFound,
        InvalidOptions
    };

    enum class Category {
        Validation,
        Format,
        Security,
        Sanitization,
        Storage,
        Internal
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
    case Error::Code::FileTooLarge:
        return "file_too_large";
    case Error::Code::EmptyFile:
        return "empty_file";
    case Error::Code::ExtensionMismatch:
        return "extension_mismatch";
    case Error::Code::MimeMismatch:
        return "mime_mismatch";
    case Error::Code::MalformedJson:
        return "malformed_json";
    case Error::Code::MalformedXml:
        return "malformed_xml";
    case Error::Code::EmptySvg:
        return "empty_svg";
    case Error::Code::DoctypeNotAllowed:
        return "doctype_not_allowed";
    case Error::Code::EntityNotAllowed:
        return "entity_not_allowed";
    case Error::Code::ScriptNotAllowed:
        return "script_not_allowed";
    case Error::Code::InvalidSvg:
        return "invalid_svg";
    case Error::Code::SanitizationFailed:
        return "sanitization_failed";
    case Error::Code::StorageFailed:
        return "storage_failed";
    case Error::Code::NotFound:
        return "not_found";
    case Error::Code::InvalidOptions:
        return "invalid_options";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto errorCategory(Error::Code code) -> Error::Category {
    switch (code) {
    case Error::Code::FileTooLarge:
    case Error::Code::EmptyFile:
    case Error::Code::ExtensionMismatch:
    case Error::Code::MimeMismatch:
        return Error::Category::Validation;
    case Error::Code::MalformedJson:
    case Error::Code::MalformedXml:
    case Error::Code::EmptySvg:
    case Error::Code::InvalidSvg:
        return Error::Category::Format;
    case Error::Code::DoctypeNotAllowed:
    case Error::Code::EntityNotAllowed:
    case Error::Code::ScriptNotAllowed:
        return Error::Category::Security;
    case Error::Code::SanitizationFailed:
        return Error::Category::Sanitization;
    case Error::Code::StorageFailed:
    case Error::Code::NotFound:
        return Error::Category::Storage;
    case Error::Code::InvalidError:
    case Error::Code::UnknownError:
    case Error::Code::InvalidOptions:
        return Error::Category::Internal;
    }
    return Error::Category::Internal;
}

[[nodiscard]] inline auto errorCategoryToString(Error::Category category) -> std::string_view {
    switch (category) {
    case Error::Category::Validation:
        return "validation";
    case Error::Category::Format:
        return "format";
    case Error::Category::Security:
        return "security";
    case Error::Category::Sanitization:
        return "sanitization";
    case Error::Category::Storage:
        return "storage";
    case Error::Category::Internal:
        return "internal";
    }
    return "internal";
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

} // namespace IV
