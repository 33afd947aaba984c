//---------------------------------------------------------------------------------------
// src/statedump.cpp
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

#include <mu0/statedump.hpp>
#include <mu0/utility.hpp>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace mu0 {

std::string formatValue(Value value)
{
    return fmt::format("0x{:03x} (dec: {})", toPattern(value), value);
}

std::string formatInstruction(const Instruction& instruction)
{
    const auto& info = opcodeInfo(instruction.opcode);
    if(!info.hasOperand)
        return info.mnemonic;
    return fmt::format("{} 0x{:03x}", info.mnemonic, instruction.operand);
}

void dumpMemory(std::ostream& os, const Memory& memory, bool definedOnly)
{
    for(uint32_t addr = 0; addr < Memory::SIZE; ++addr) {
        auto address = static_cast<Address>(addr);
        if(definedOnly && !memory.isDefined(address))
            continue;
        os << fmt::format("  @0x{:03x}: {}", addr, formatValue(memory.peek(address))) << std::endl;
    }
}

void dumpStep(std::ostream& os, const Program& program, const MachineState& state)
{
    if(!state.lastExecuted || !program.contains(*state.lastExecuted)) {
        os << "No instruction executed yet." << std::endl;
        return;
    }
    const auto& instruction = program[*state.lastExecuted];
    os << fmt::format("Executed line {}, instr. 0x{:03x}: {}", instruction.line, toInt(*state.lastExecuted), formatInstruction(instruction)) << std::endl;
    if(!instruction.comment.empty())
        os << "Comment: " << instruction.comment << std::endl;
    os << fmt::format("  Current PC value:  0x{:03x}", toInt(state.pc)) << std::endl;
    os << "  Current ACC value: " << formatValue(state.acc) << std::endl;
    os << "Memory dump after instruction execution:" << std::endl;
    dumpMemory(os, state.memory);
}

void dumpListing(std::ostream& os, const Program& program)
{
    uint32_t index = 0;
    for(const auto& instruction : program) {
        os << fmt::format("0x{:03x}  {:04x}  line {:<4}  {}", index++, instruction.encode(), instruction.line, formatInstruction(instruction));
        if(!instruction.comment.empty())
            os << " ; " << instruction.comment;
        os << std::endl;
    }
}

void dumpOpcodes(std::ostream& os)
{
    for(const auto& info : detail::opcodes) {
        std::string aliases;
        for(const auto& alias : info.aliases)
            aliases += (aliases.empty() ? "" : ", ") + alias;
        os << fmt::format("{:x}  {:<7}  {:<4}  {}", static_cast<int>(info.opcode), info.mnemonic + (info.hasOperand ? " X" : ""), aliases, info.description) << std::endl;
    }
}

std::string haltMessage(const Program& program, const MachineState& state)
{
    switch(state.haltReason) {
        case MachineState::eNOT_HALTED:
            return fmt::format("Machine not halted after {} steps.", state.steps);
        case MachineState::eSTOP:
            return fmt::format("Reached STOP instruction at line {}.", program[state.pc].line);
        case MachineState::eINVALID_PROGRAM_COUNTER:
            if(toInt(state.pc) == program.size())
                return "Reached end of instructions.";
            return fmt::format("Invalid program counter 0x{:03x}, the program has only {} instructions.", toInt(state.pc), program.size());
        case MachineState::eINVALID_MEMORY_ACCESS: {
            const auto& instruction = program[state.pc];
            return fmt::format("Error at line {}: invalid memory access at 0x{:03x}.", instruction.line, toInt(instruction.address()));
        }
    }
    return "Unknown machine state.";
}

nlohmann::json stateToJson(const MachineState& state, bool definedOnly)
{
    nlohmann::json result;
    result["status"] = toJsonKey(statusName(state.status));
    result["haltReason"] = toJsonKey(haltReasonName(state.haltReason));
    result["pc"] = toInt(state.pc);
    result["acc"] = state.acc;
    result["steps"] = state.steps;
    if(auto error = haltErrorType(state.haltReason); error != eNO_ERROR)
        result["error"] = errorTypeName(error);
    else
        result["error"] = nullptr;
    if(state.lastExecuted)
        result["lastExecuted"] = toInt(*state.lastExecuted);
    else
        result["lastExecuted"] = nullptr;
    auto memory = nlohmann::json::array();
    for(uint32_t addr = 0; addr < Memory::SIZE; ++addr) {
        auto address = static_cast<Address>(addr);
        if(definedOnly && !state.memory.isDefined(address))
            continue;
        nlohmann::json cell;
        cell["address"] = addr;
        cell["value"] = state.memory.peek(address);
        memory.push_back(cell);
    }
    result["memory"] = memory;
    return result;
}

}
