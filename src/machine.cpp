//---------------------------------------------------------------------------------------
// src/machine.cpp
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

#include <mu0/machine.hpp>

namespace mu0 {

const char* statusName(MachineState::Status status)
{
    switch(status) {
        case MachineState::eREADY: return "READY";
        case MachineState::eRUNNING: return "RUNNING";
        case MachineState::eHALTED: return "HALTED";
    }
    return "UNKNOWN";
}

const char* haltReasonName(MachineState::HaltReason reason)
{
    switch(reason) {
        case MachineState::eNOT_HALTED: return "NOT_HALTED";
        case MachineState::eSTOP: return "STOP";
        case MachineState::eINVALID_PROGRAM_COUNTER: return "INVALID_PROGRAM_COUNTER";
        case MachineState::eINVALID_MEMORY_ACCESS: return "INVALID_MEMORY_ACCESS";
    }
    return "UNKNOWN";
}

ErrorType haltErrorType(MachineState::HaltReason reason)
{
    switch(reason) {
        case MachineState::eNOT_HALTED:
        case MachineState::eSTOP:
            return eNO_ERROR;
        case MachineState::eINVALID_PROGRAM_COUNTER:
            return eINVALID_PROGRAM_COUNTER;
        case MachineState::eINVALID_MEMORY_ACCESS:
            return eINVALID_MEMORY_ACCESS;
    }
    return eNO_ERROR;
}

Machine::Machine(Program program, Memory memory, Options options)
    : _program(std::move(program))
    , _initialMemory(std::move(memory))
    , _options(options)
{
    reset();
}

void Machine::reset()
{
    _state = MachineState{};
    _state.memory = _initialMemory;
}

MachineState Machine::step()
{
    if(_state.halted()) {
        throw Exception(eMACHINE_HALTED, "machine is halted, reset it to run again");
    }
    execute();
    return _state;
}

MachineState Machine::run()
{
    while(!_state.halted()) {
        execute();
    }
    return _state;
}

void Machine::halt(MachineState::HaltReason reason)
{
    _state.status = MachineState::eHALTED;
    _state.haltReason = reason;
}

bool Machine::fetchOperand(const Instruction& instruction, Value& value)
{
    auto address = instruction.address();
    if(_options.strictMemory && !_state.memory.isDefined(address)) {
        halt(MachineState::eINVALID_MEMORY_ACCESS);
        return false;
    }
    value = _state.memory.load(address);
    return true;
}

void Machine::execute()
{
    if(!_program.contains(_state.pc)) {
        halt(MachineState::eINVALID_PROGRAM_COUNTER);
        return;
    }
    const auto& instruction = _program[_state.pc];
    auto next = InstructionIndex{toInt(_state.pc) + 1};
    Value operand{};
    _state.status = MachineState::eRUNNING;
    _state.lastExecuted = _state.pc;
    ++_state.steps;
    switch(instruction.opcode) {
        case Opcode::LOAD:
            if(!fetchOperand(instruction, operand))
                return;
            _state.acc = operand;
            break;
        case Opcode::STORE:
            _state.memory.store(instruction.address(), _state.acc);
            break;
        case Opcode::ADD:
            if(!fetchOperand(instruction, operand))
                return;
            _state.acc = wrap12(int64_t(_state.acc) + operand);
            break;
        case Opcode::SUB:
            if(!fetchOperand(instruction, operand))
                return;
            _state.acc = wrap12(int64_t(_state.acc) - operand);
            break;
        case Opcode::JUMP:
            next = instruction.target();
            break;
        case Opcode::JGE:
            if(_state.acc >= 0)
                next = instruction.target();
            break;
        case Opcode::JNE:
            if(_state.acc != 0)
                next = instruction.target();
            break;
        case Opcode::STOP:
            halt(MachineState::eSTOP);
            return;
    }
    _state.pc = next;
}

}
