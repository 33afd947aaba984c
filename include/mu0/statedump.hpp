//---------------------------------------------------------------------------------------
// include/mu0/statedump.hpp
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

#include <mu0/machine.hpp>
#include <mu0/memory.hpp>
#include <mu0/program.hpp>

#include <nlohmann/json_fwd.hpp>

#include <ostream>
#include <string>

namespace mu0 {

std::string formatValue(Value value);
std::string formatInstruction(const Instruction& instruction);
void dumpMemory(std::ostream& os, const Memory& memory, bool definedOnly = true);
void dumpStep(std::ostream& os, const Program& program, const MachineState& state);
void dumpListing(std::ostream& os, const Program& program);
// opcode, mnemonic with operand, aliases and description of every instruction
void dumpOpcodes(std::ostream& os);
std::string haltMessage(const Program& program, const MachineState& state);
nlohmann::json stateToJson(const MachineState& state, bool definedOnly = true);

}
