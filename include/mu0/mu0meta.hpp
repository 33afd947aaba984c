//---------------------------------------------------------------------------------------
// include/mu0/mu0meta.hpp
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

#include <array>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mu0 {

using Value = int16_t;

constexpr uint32_t ADDRESS_BITS = 12;
constexpr uint32_t MEMORY_SIZE = 1u << ADDRESS_BITS;
constexpr uint32_t MAX_ADDRESS = MEMORY_SIZE - 1;
constexpr int VALUE_MIN = -2048;
constexpr int VALUE_MAX = 2047;

// A memory cell address and a position in the instruction list are different
// things, even if both are written as 12 bit hex numbers in the source.
enum class Address : uint16_t {};
enum class InstructionIndex : uint32_t {};

constexpr uint16_t toInt(Address address) { return static_cast<uint16_t>(address); }
constexpr uint32_t toInt(InstructionIndex index) { return static_cast<uint32_t>(index); }

// reduce modulo 4096 and reinterpret as 12 bit two's complement
constexpr Value wrap12(int64_t value)
{
    auto pattern = static_cast<int32_t>(value & 0xFFF);
    return static_cast<Value>(pattern >= 0x800 ? pattern - 0x1000 : pattern);
}

// the 12 bit pattern of a value, as it would sit in a hardware register
constexpr uint16_t toPattern(Value value)
{
    return static_cast<uint16_t>(value) & 0xFFF;
}

enum class Opcode : uint8_t { LOAD = 0, STORE = 1, ADD = 2, SUB = 3, JUMP = 4, JGE = 5, JNE = 6, STOP = 7 };

struct OpcodeInfo {
    Opcode opcode;
    std::string mnemonic;
    std::vector<std::string> aliases;
    bool hasOperand;
    std::string description;
};

namespace detail {
// clang-format off
inline static const std::array<OpcodeInfo, 8> opcodes{{
    { Opcode::LOAD,  "LOAD",  {"LDA"}, true,  "load the value of memory cell X into the accumulator" },
    { Opcode::STORE, "STORE", {"STO"}, true,  "store the accumulator into memory cell X" },
    { Opcode::ADD,   "ADD",   {},      true,  "add the value of memory cell X to the accumulator, wrapping at 12 bit" },
    { Opcode::SUB,   "SUB",   {},      true,  "subtract the value of memory cell X from the accumulator, wrapping at 12 bit" },
    { Opcode::JUMP,  "JUMP",  {"JMP"}, true,  "continue with instruction X" },
    { Opcode::JGE,   "JGE",   {},      true,  "continue with instruction X if the accumulator is >= 0" },
    { Opcode::JNE,   "JNE",   {},      true,  "continue with instruction X if the accumulator is != 0" },
    { Opcode::STOP,  "STOP",  {},      false, "halt the machine" }
}};
// clang-format on
}

inline constexpr std::string_view DATA_DIRECTIVE = "INI";

const OpcodeInfo& opcodeInfo(Opcode opcode);
const OpcodeInfo* findMnemonic(std::string_view mnemonic);

enum ErrorType {
    eNO_ERROR,
    eSYNTAX_ERROR,
    eMALFORMED_LITERAL,
    eADDRESS_OUT_OF_RANGE,
    eVALUE_OUT_OF_RANGE,
    eINVALID_PROGRAM_COUNTER,
    eINVALID_MEMORY_ACCESS,
    eMACHINE_HALTED,
    eIO_ERROR
};

const char* errorTypeName(ErrorType type);

struct Exception : public std::exception {
    Exception(ErrorType type, std::string message)
        : errorType(type)
        , errorMessage(std::move(message))
    {
    }
    ~Exception() noexcept override = default;
    const char* what() const noexcept override { return errorMessage.c_str(); }
    ErrorType errorType;
    std::string errorMessage;
    int line{0};
    int column{0};
    std::string sourceText;
};

}
