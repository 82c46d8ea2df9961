#include <iconvault/core/Error.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace IV;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::InvalidOptions);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto runtimeCode = code;
            auto label       = errorCodeToString(runtimeCode);
            CHECK_FALSE(label.empty());
            // describeError should echo the label when message is absent.
            Error e{runtimeCode, {}};
            CHECK(describeError(e) == std::string{label});
            CHECK_FALSE(errorCategoryToString(errorCategory(runtimeCode)).empty());
        }

        Error withMsg{Error::Code::FileTooLarge, "bad"};
        CHECK(describeError(withMsg) == "file_too_large:bad");

        Error withoutMsg{Error::Code::DoctypeNotAllowed, {}};
        CHECK(describeError(withoutMsg) == "doctype_not_allowed");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
        Error synthetic{static_cast<Error::Code>(999), {}};
        CHECK(describeError(synthetic) == "unknown_error");
    }

    TEST_CASE("Codes map onto the error taxonomy") {
        CHECK(errorCategory(Error::Code::FileTooLarge) == Error::Category::Validation);
        CHECK(errorCategory(Error::Code::EmptyFile) == Error::Category::Validation);
        CHECK(errorCategory(Error::Code::ExtensionMismatch) == Error::Category::Validation);
        CHECK(errorCategory(Error::Code::MimeMismatch) == Error::Category::Validation);
        CHECK(errorCategory(Error::Code::MalformedJson) == Error::Category::Format);
        CHECK(errorCategory(Error::Code::MalformedXml) == Error::Category::Format);
        CHECK(errorCategory(Error::Code::InvalidSvg) == Error::Category::Format);
        CHECK(errorCategory(Error::Code::DoctypeNotAllowed) == Error::Category::Security);
        CHECK(errorCategory(Error::Code::EntityNotAllowed) == Error::Category::Security);
        CHECK(errorCategory(Error::Code::ScriptNotAllowed) == Error::Category::Security);
        CHECK(errorCategory(Error::Code::SanitizationFailed) == Error::Category::Sanitization);
        CHECK(errorCategory(Error::Code::StorageFailed) == Error::Category::Storage);
        CHECK(errorCategoryToString(Error::Category::Security) == "security");
    }
}
