//---------------------------------------------------------------------------------------
// include/mu0/program.hpp
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
#include <utility>
#include <vector>

namespace mu0 {

struct Instruction {
    Opcode opcode{Opcode::STOP};
    uint16_t operand{0};
    int line{0};
    std::string comment;
    Address address() const { return static_cast<Address>(operand & MAX_ADDRESS); }
    InstructionIndex target() const { return static_cast<InstructionIndex>(operand & MAX_ADDRESS); }
    uint16_t encode() const { return static_cast<uint16_t>((static_cast<unsigned>(opcode) << 12) | (operand & MAX_ADDRESS)); }
};

// Immutable, index addressed list of assembled instructions
class Program
{
public:
    using const_iterator = std::vector<Instruction>::const_iterator;
    Program() = default;
    explicit Program(std::vector<Instruction> instructions)
        : _instructions(std::move(instructions))
    {
    }
    size_t size() const { return _instructions.size(); }
    bool empty() const { return _instructions.empty(); }
    bool contains(InstructionIndex index) const { return toInt(index) < _instructions.size(); }
    const Instruction& operator[](InstructionIndex index) const { return _instructions[toInt(index)]; }
    const_iterator begin() const { return _instructions.begin(); }
    const_iterator end() const { return _instructions.end(); }

private:
    std::vector<Instruction> _instructions;
};

}
