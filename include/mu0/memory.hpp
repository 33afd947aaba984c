//---------------------------------------------------------------------------------------
// include/mu0/memory.hpp
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

#include <array>
#include <cstdint>
#include <span>
#include <type_traits>
#include <vector>

#include <ghc/bitenum.hpp>

namespace mu0 {

class Memory
{
public:
    static constexpr uint32_t SIZE = MEMORY_SIZE;
    enum UsageType : uint8_t { eNONE = 0, eINITIALIZED = 1, eWRITTEN = 2, eREAD = 4 };

    Memory() = default;
    Value peek(Address address) const { return _cells[toInt(address)]; }
    Value load(Address address);
    void store(Address address, Value value);
    void initialize(Address address, Value value);
    UsageType usage(Address address) const { return _usage[toInt(address)]; }
    bool isDefined(Address address) const;
    std::vector<Address> definedCells() const;
    std::span<const Value> cells() const { return _cells; }
    bool operator==(const Memory& other) const = default;

private:
    std::array<Value, SIZE> _cells{};
    std::array<UsageType, SIZE> _usage{};
};

GHC_ENUM_ENABLE_BIT_OPERATIONS(Memory::UsageType);

}
