//---------------------------------------------------------------------------------------
// include/mu0/encoder.hpp
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
#pragma once

#include <mu0/mu0meta.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace mu0 {

// Decodes a `0x` prefixed hex literal. Throws eMALFORMED_LITERAL on a bad
// prefix or bad digits, magnitudes beyond 32 bit saturate.
uint32_t parseHexLiteral(std::string_view token);

// Throws eADDRESS_OUT_OF_RANGE for anything needing more than 3 hex digits.
Address parseAddress(std::string_view token);

// Accepts any 12 bit pattern and reinterprets it as two's complement, throws
// eVALUE_OUT_OF_RANGE for wider patterns.
Value parseValue(std::string_view token);

// Both throw the matching range error instead of truncating.
std::string addressToHex(int64_t address);
std::string valueToHex(int64_t value);

}
