#include <composespace/core/Error.hpp>

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace CS;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        // Walk the enum at runtime so every label is exercised.
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::NotSupported);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::DeserializationFailure, "bad"};
        CHECK(describeError(withMsg) == "deserialization_failure:bad");

        Error overflow{Error::Code::SchedulingOverflow, {}};
        CHECK(describeError(overflow) == "scheduling_overflow");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("CompositionError carries its Error") {
        CompositionError ex{Error{Error::Code::DuplicateKey, "child 'a'"}};
        CHECK(ex.error().code == Error::Code::DuplicateKey);
        CHECK(std::string{ex.what()} == "duplicate_key:child 'a'");
    }
}
