// tests/test_verification.cpp
#include <catch2/catch_test_macros.hpp>
#include "verify/verification.h"

using namespace planflow;

namespace {

VerifySpec spec(VerifyType type, std::string value = "") {
    return VerifySpec{type, std::move(value)};
}

} // namespace

TEST_CASE("Missing verify spec always passes", "[verify]") {
    VerificationEvaluator evaluator;
    REQUIRE(evaluator.verify(std::nullopt, ""));
    REQUIRE(evaluator.verify(std::nullopt, "Traceback: boom"));
}

TEST_CASE("output_contains and output_not_contains ignore case", "[verify]") {
    VerificationEvaluator evaluator;
    auto contains = spec(VerifyType::OUTPUT_CONTAINS, "Passed");
    REQUIRE(evaluator.verify(contains, "12 tests PASSED"));
    REQUIRE_FALSE(evaluator.verify(contains, "12 tests failed"));

    auto not_contains = spec(VerifyType::OUTPUT_NOT_CONTAINS, "traceback");
    REQUIRE(evaluator.verify(not_contains, "all good"));
    REQUIRE_FALSE(evaluator.verify(not_contains, "Traceback (most recent call last)"));
}

TEST_CASE("exit_code_zero looks for error markers", "[verify]") {
    VerificationEvaluator evaluator;
    auto exit_zero = spec(VerifyType::EXIT_CODE_ZERO);
    REQUIRE(evaluator.verify(exit_zero, "build finished"));
    REQUIRE_FALSE(evaluator.verify(exit_zero, "ERROR: missing header"));
    REQUIRE_FALSE(evaluator.verify(exit_zero, "process finished with Exit Code 2"));
}

TEST_CASE("any_output needs non-whitespace text", "[verify]") {
    VerificationEvaluator evaluator;
    auto any = spec(VerifyType::ANY_OUTPUT);
    REQUIRE(evaluator.verify(any, "x"));
    REQUIRE_FALSE(evaluator.verify(any, ""));
    REQUIRE_FALSE(evaluator.verify(any, " \n\t "));
}

TEST_CASE("External checks follow the verification policy", "[verify][policy]") {
    auto file = spec(VerifyType::FILE_EXISTS, "build/app");
    auto manual = spec(VerifyType::MANUAL);

    SECTION("permissive by default") {
        VerificationEvaluator evaluator;
        REQUIRE(evaluator.verify(file, ""));
        REQUIRE(evaluator.verify(manual, "anything"));
    }

    SECTION("strict policy needs confirmation") {
        VerificationEvaluator evaluator(VerificationEvaluator::Policy{false});
        REQUIRE_FALSE(evaluator.verify(file, "wrote build/app"));
        REQUIRE_FALSE(evaluator.verify(manual, "looks fine"));
        REQUIRE(evaluator.verify(file, "", true));
        REQUIRE(evaluator.verify(manual, "", true));
    }
}

TEST_CASE("Verify description for the status block", "[verify]") {
    REQUIRE(VerificationEvaluator::describe(spec(VerifyType::OUTPUT_CONTAINS, "done")) == "output_contains: done");
    REQUIRE(VerificationEvaluator::describe(spec(VerifyType::ANY_OUTPUT)) == "any_output");
    REQUIRE(VerificationEvaluator::describe(spec(VerifyType::MANUAL)).empty());
}
