//---------------------------------------------------------------------------------------
// include/mu0/machine.hpp
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

#include <mu0/memory.hpp>
#include <mu0/mu0meta.hpp>
#include <mu0/program.hpp>

#include <cstdint>
#include <optional>

namespace mu0 {

struct MachineState {
    enum Status { eREADY, eRUNNING, eHALTED };
    enum HaltReason { eNOT_HALTED, eSTOP, eINVALID_PROGRAM_COUNTER, eINVALID_MEMORY_ACCESS };
    InstructionIndex pc{};
    Value acc{};
    Status status{eREADY};
    HaltReason haltReason{eNOT_HALTED};
    std::optional<InstructionIndex> lastExecuted;
    uint64_t steps{0};
    Memory memory;
    bool halted() const { return status == eHALTED; }
};

const char* statusName(MachineState::Status status);
const char* haltReasonName(MachineState::HaltReason reason);
// the runtime fault behind a halt reason, eNO_ERROR for a regular halt or a running machine
ErrorType haltErrorType(MachineState::HaltReason reason);

struct MachineOptions {
    // halt with eINVALID_MEMORY_ACCESS when reading a cell that was never written
    bool strictMemory{false};
};

class Machine
{
public:
    using Options = MachineOptions;
    Machine(Program program, Memory memory, Options options = {});

    // Executes exactly one instruction, throws eMACHINE_HALTED when already halted.
    MachineState step();
    // Steps until halted, never returns for a program that neither stops nor leaves the program.
    MachineState run();
    MachineState state() const { return _state; }
    void reset();

    bool halted() const { return _state.halted(); }
    uint64_t steps() const { return _state.steps; }
    const Program& program() const { return _program; }

private:
    void execute();
    bool fetchOperand(const Instruction& instruction, Value& value);
    void halt(MachineState::HaltReason reason);
    Program _program;
    Memory _initialMemory;
    Options _options;
    MachineState _state;
};

}
