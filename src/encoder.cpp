//---------------------------------------------------------------------------------------
// src/encoder.cpp
//---------------------------------------------------------------------------------------
//
// Copyright (c) 2026, the mu0 authors
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
//---------------------------------------------------------------------------------------

#include <mu0/encoder.hpp>

#include <fmt/format.h>

#include <charconv>
#include <limits>

namespace mu0 {

uint32_t parseHexLiteral(std::string_view token)
{
    if(token.size() < 3 || token[0] != '0' || token[1] != 'x') {
        throw Exception(eMALFORMED_LITERAL, fmt::format("malformed literal '{}', expected '0x' followed by hex digits", token));
    }
    auto digits = token.substr(2);
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
    if(ec == std::errc::invalid_argument || ptr != digits.data() + digits.size()) {
        throw Exception(eMALFORMED_LITERAL, fmt::format("malformed literal '{}', invalid hex digits", token));
    }
    if(ec == std::errc::result_out_of_range) {
        return std::numeric_limits<uint32_t>::max();
    }
    return value;
}

Address parseAddress(std::string_view token)
{
    auto value = parseHexLiteral(token);
    if(value > MAX_ADDRESS) {
        throw Exception(eADDRESS_OUT_OF_RANGE, fmt::format("address '{}' out of range, only 0x000-0xfff are valid", token));
    }
    return static_cast<Address>(value);
}

Value parseValue(std::string_view token)
{
    auto value = parseHexLiteral(token);
    if(value > 0xFFF) {
        throw Exception(eVALUE_OUT_OF_RANGE, fmt::format("value '{}' does not fit into 12 bit", token));
    }
    return wrap12(value);
}

std::string addressToHex(int64_t address)
{
    if(address < 0 || address > MAX_ADDRESS) {
        throw Exception(eADDRESS_OUT_OF_RANGE, fmt::format("address {} out of range, only 0-{} are valid", address, MAX_ADDRESS));
    }
    return fmt::format("0x{:03x}", address);
}

std::string valueToHex(int64_t value)
{
    if(value < VALUE_MIN || value > VALUE_MAX) {
        throw Exception(eVALUE_OUT_OF_RANGE, fmt::format("value {} out of range, only {} to {} are valid", value, VALUE_MIN, VALUE_MAX));
    }
    return fmt::format("0x{:03x}", toPattern(static_cast<Value>(value)));
}

}
