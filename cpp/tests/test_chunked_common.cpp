#include <catch2/catch.hpp>
#include "chunked_common.hpp"

using namespace chunked;

TEST_CASE("message format replaces placeholders in order") {
    REQUIRE(Utils::format_message("{} of {} done", {"3", "10"}) == "3 of 10 done");
    REQUIRE(Utils::format_message("no placeholders", {}) == "no placeholders");
    REQUIRE(Utils::format_message("{{literal}} {}", {"x"}) == "{literal} x");
}

TEST_CASE("message format rejects mismatched arguments") {
    REQUIRE_THROWS_AS(Utils::format_message("{} and {}", {"one"}), ContractError);
    REQUIRE_THROWS_AS(Utils::format_message("{}", {"one", "two"}), ContractError);
    REQUIRE_THROWS_AS(Utils::format_message("open { brace", {}), ContractError);
    REQUIRE_THROWS_AS(Utils::format_message("close } brace", {}), ContractError);
}

TEST_CASE("severity names") {
    REQUIRE(Utils::severity_name(MessageSeverity::DEBUG) == "debug");
    REQUIRE(Utils::severity_name(MessageSeverity::WARN) == "warn");
    REQUIRE(Utils::severity_name(MessageSeverity::FATAL) == "fatal");

    REQUIRE(Utils::parse_severity("INFO") == MessageSeverity::INFO);
    REQUIRE(Utils::parse_severity("Warning") == MessageSeverity::WARN);
    REQUIRE(Utils::parse_severity("error") == MessageSeverity::ERROR);
    REQUIRE_THROWS_AS(Utils::parse_severity("verbose"), ContractError);
}

TEST_CASE("not configured is a contract error") {
    REQUIRE_THROWS_AS(throw NotConfiguredError("unset"), ContractError);

    MetadataParseError error("Unexpected end of input", 12);
    REQUIRE(error.offset() == 12);
    REQUIRE(std::string(error.what()) == "Unexpected end of input at offset 12");
}
