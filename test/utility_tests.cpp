//
// Created by the mu0 authors on 19.10.26.
//
#include <doctest/doctest.h>

#include <mu0/mu0meta.hpp>
#include <mu0/utility.hpp>

using namespace mu0;

TEST_CASE("toJsonKey - category transitions and camelCase format")
{
    SUBCASE("Empty string remains empty") {
        CHECK(toJsonKey("") == "");
    }

    SUBCASE("Upper case enum names") {
        CHECK(toJsonKey("HALTED") == "halted");
        CHECK(toJsonKey("INVALID_PROGRAM_COUNTER") == "invalidProgramCounter");
    }

    SUBCASE("Lower to upper: insert upper") {
        CHECK(toJsonKey("myVar") == "myVar");
        CHECK(toJsonKey("UserID") == "userId");
    }

    SUBCASE("Digit transitions: letter->digit and digit->letter") {
        CHECK(toJsonKey("size10") == "size10");
        CHECK(toJsonKey("10Size") == "10Size");
        CHECK(toJsonKey("size123other") == "size123Other");
    }

    SUBCASE("Trim leading/trailing special characters") {
        CHECK(toJsonKey("-leading-") == "leading");
        CHECK(toJsonKey("my--special**string") == "mySpecialString");
    }
}

TEST_CASE("string helpers")
{
    SUBCASE("trim") {
        CHECK(trim("  LOAD 0x1 \t") == "LOAD 0x1");
        CHECK(trim(" \t ").empty());
    }

    SUBCASE("splitWords") {
        auto words = splitWords(" INI\t0x1   0x2 ");
        REQUIRE(words.size() == 3);
        CHECK(words[0] == "INI");
        CHECK(words[1] == "0x1");
        CHECK(words[2] == "0x2");
        CHECK(splitWords("   ").empty());
    }

    SUBCASE("toUpper") {
        CHECK(toUpper("jge") == "JGE");
    }
}

TEST_CASE("opcode table")
{
    for(const auto& info : detail::opcodes) {
        CHECK(&opcodeInfo(info.opcode) == &info);
        CHECK(findMnemonic(info.mnemonic) == &info);
    }
    CHECK(findMnemonic("lda")->opcode == Opcode::LOAD);
    CHECK(findMnemonic("INI") == nullptr);
    CHECK(findMnemonic("") == nullptr);
    CHECK_FALSE(opcodeInfo(Opcode::STOP).hasOperand);
    CHECK(std::string(errorTypeName(eSYNTAX_ERROR)) == "SyntaxError");
    CHECK(std::string(errorTypeName(eINVALID_PROGRAM_COUNTER)) == "InvalidProgramCounter");
}
