#include <catch2/catch_test_macros.hpp>
#include "engine/ErrorAnalyzer.hpp"

using namespace coderun::engine;

namespace {

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

} // namespace

TEST_CASE("Known kinds get their category", "[ErrorAnalyzer]") {
    REQUIRE(ErrorAnalyzer::category("ZeroDivisionError") == "arithmetic error");
    REQUIRE(ErrorAnalyzer::category("KeyError") == "missing key");
    REQUIRE(ErrorAnalyzer::category("TimeoutError") == "timeout");
    REQUIRE(ErrorAnalyzer::category("LaunchError") == "interpreter unavailable");
}

TEST_CASE("Dotted kinds match on their last component", "[ErrorAnalyzer]") {
    REQUIRE(ErrorAnalyzer::category("json.decoder.JSONDecodeError") == "runtime error");
    REQUIRE(ErrorAnalyzer::category("builtins.ValueError") == "invalid value");
    REQUIRE(ErrorAnalyzer::category("requests.exceptions.ConnectTimeout") == "timeout");
    REQUIRE(ErrorAnalyzer::category("urllib3.exceptions.NewConnectionError") == "network error");
}

TEST_CASE("analyze formats kind, category and hint", "[ErrorAnalyzer]") {
    auto text = ErrorAnalyzer::analyze({"ZeroDivisionError", "division by zero"}, "print(1/0)");

    REQUIRE(text.rfind("[ZeroDivisionError] arithmetic error: ", 0) == 0);
}

TEST_CASE("analyze falls back to a generic hint", "[ErrorAnalyzer]") {
    auto text = ErrorAnalyzer::analyze({"CustomProblem", "boom"}, "raise CustomProblem()");

    REQUIRE(text == "[CustomProblem] runtime error: read the error message and check the line it points at");
}

TEST_CASE("analyze names the undefined variable", "[ErrorAnalyzer]") {
    SECTION("never assigned") {
        auto text = ErrorAnalyzer::analyze({"NameError", "name 'totl' is not defined"}, "print(totl)");
        REQUIRE(contains(text, "(undefined: totl)"));
    }

    SECTION("assigned later in the snippet") {
        auto text = ErrorAnalyzer::analyze({"NameError", "name 'x' is not defined"}, "print(x)\nx = 1");
        REQUIRE(contains(text, "undefined: x, an assignment exists"));
    }
}

TEST_CASE("analyze names the missing module", "[ErrorAnalyzer]") {
    auto text = ErrorAnalyzer::analyze({"ModuleNotFoundError", "No module named 'pandas'"}, "import pandas");

    REQUIRE(contains(text, "[ModuleNotFoundError] missing module"));
    REQUIRE(contains(text, "(missing: pandas)"));
}

TEST_CASE("analyze handles an empty kind", "[ErrorAnalyzer]") {
    auto text = ErrorAnalyzer::analyze({"", "something failed"}, "");

    REQUIRE(text.rfind("[Error] runtime error", 0) == 0);
}
