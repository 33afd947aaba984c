//
// Created by the mu0 authors on 19.10.26.
//
#include <doctest/doctest.h>

#include <mu0/encoder.hpp>

using namespace mu0;

static ErrorType errorOf(void (*fn)())
{
    try {
        fn();
    }
    catch(Exception& ex) {
        return ex.errorType;
    }
    return eNO_ERROR;
}

TEST_SUITE("Encoder")
{
    TEST_CASE("every 12 bit address is accepted")
    {
        for(uint32_t addr = 0; addr <= MAX_ADDRESS; ++addr) {
            REQUIRE(toInt(parseAddress(addressToHex(addr))) == addr);
        }
        CHECK(toInt(parseAddress("0xFFF")) == 0xfff);
        CHECK(toInt(parseAddress("0xaB")) == 0xab);
        CHECK(toInt(parseAddress("0x0001")) == 1);
    }

    TEST_CASE("addresses needing a fourth hex digit are rejected")
    {
        CHECK(errorOf([]{ parseAddress("0x1000"); }) == eADDRESS_OUT_OF_RANGE);
        CHECK(errorOf([]{ parseAddress("0xffff"); }) == eADDRESS_OUT_OF_RANGE);
        CHECK(errorOf([]{ parseAddress("0x123456789abcdef0"); }) == eADDRESS_OUT_OF_RANGE);
        CHECK(errorOf([]{ addressToHex(4096); }) == eADDRESS_OUT_OF_RANGE);
        CHECK(errorOf([]{ addressToHex(-1); }) == eADDRESS_OUT_OF_RANGE);
    }

    TEST_CASE("malformed literals")
    {
        CHECK(errorOf([]{ parseHexLiteral("100"); }) == eMALFORMED_LITERAL);
        CHECK(errorOf([]{ parseHexLiteral("0X10"); }) == eMALFORMED_LITERAL);
        CHECK(errorOf([]{ parseHexLiteral("0x"); }) == eMALFORMED_LITERAL);
        CHECK(errorOf([]{ parseHexLiteral("0xg1"); }) == eMALFORMED_LITERAL);
        CHECK(errorOf([]{ parseHexLiteral("0x1g"); }) == eMALFORMED_LITERAL);
        CHECK(errorOf([]{ parseHexLiteral("0x-1"); }) == eMALFORMED_LITERAL);
        CHECK(errorOf([]{ parseHexLiteral("x10"); }) == eMALFORMED_LITERAL);
        CHECK(errorOf([]{ parseHexLiteral("0xffffffffffffz"); }) == eMALFORMED_LITERAL);
    }

    TEST_CASE("values are 12 bit two's complement")
    {
        CHECK(parseValue("0x0") == 0);
        CHECK(parseValue("0x7ff") == 2047);
        CHECK(parseValue("0x800") == -2048);
        CHECK(parseValue("0xfff") == -1);
        CHECK(parseValue("0xfa3") == -93);
        CHECK(parseValue("0x52") == 82);
        CHECK(errorOf([]{ parseValue("0x1000"); }) == eVALUE_OUT_OF_RANGE);
    }

    TEST_CASE("values survive the trip through their hex literal")
    {
        for(int value = VALUE_MIN; value <= VALUE_MAX; ++value) {
            REQUIRE(parseValue(valueToHex(value)) == value);
        }
        CHECK(valueToHex(-1) == "0xfff");
        CHECK(valueToHex(82) == "0x052");
        CHECK(errorOf([]{ valueToHex(2048); }) == eVALUE_OUT_OF_RANGE);
        CHECK(errorOf([]{ valueToHex(-2049); }) == eVALUE_OUT_OF_RANGE);
    }

    TEST_CASE("wrap12")
    {
        CHECK(wrap12(2048) == -2048);
        CHECK(wrap12(-2049) == 2047);
        CHECK(wrap12(4096) == 0);
        CHECK(wrap12(-4096) == 0);
        CHECK(wrap12(4003) == -93);
        CHECK(wrap12(-93) == -93);
        CHECK(toPattern(-93) == 0xfa3);
    }
}
