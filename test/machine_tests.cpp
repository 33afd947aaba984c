//
// Created by the mu0 authors on 19.10.26.
//
#include <doctest/doctest.h>

#include <mu0/assembler.hpp>
#include <mu0/machine.hpp>

#include <string>

using namespace mu0;

static Machine makeMachine(const std::string& source, Machine::Options options = {})
{
    Assembler assembler;
    const auto& result = assembler.assemble(source);
    REQUIRE_MESSAGE(result.resultType == AssembleResult::eOK, result.errorMessage);
    return Machine(assembler.program(), assembler.memory(), options);
}

static std::string divisionProgram(const std::string& dividend)
{
    return R"(; quotient and remainder by repeated subtraction
INI 0x100 )" + dividend + R"( ; dividend
INI 0x101 0x52  ; divisor
INI 0x102 0x1   ; one
INI 0x103 0x0   ; remainder
INI 0x104 0x0   ; quotient

LOAD  0x100
STORE 0x103
LOAD  0x103     ; loop
SUB   0x101
JGE   0x6
STOP
STORE 0x103
LOAD  0x104
ADD   0x102
STORE 0x104
JUMP  0x2
)";
}

TEST_SUITE("Machine")
{
    TEST_CASE("fresh machine is ready")
    {
        auto machine = makeMachine("INI 0x5 0x7\nSTOP\n");
        auto state = machine.state();
        CHECK(state.status == MachineState::eREADY);
        CHECK(state.haltReason == MachineState::eNOT_HALTED);
        CHECK(toInt(state.pc) == 0);
        CHECK(state.acc == 0);
        CHECK(state.steps == 0);
        CHECK_FALSE(state.lastExecuted.has_value());
        CHECK(state.memory.peek(Address{5}) == 7);
    }

    TEST_CASE("load, store and step snapshots")
    {
        auto machine = makeMachine("INI 0x10 0x123\nLOAD 0x10\nSTORE 0x11\nSTOP\n");
        auto before = machine.state();
        auto state = machine.step();
        CHECK(state.status == MachineState::eRUNNING);
        CHECK(state.acc == 0x123);
        CHECK(toInt(state.pc) == 1);
        CHECK(toInt(*state.lastExecuted) == 0);
        state = machine.step();
        CHECK(state.memory.peek(Address{0x11}) == 0x123);
        CHECK(before.memory.peek(Address{0x11}) == 0);
        CHECK(toInt(state.pc) == 2);
        state = machine.step();
        CHECK(state.halted());
        CHECK(state.haltReason == MachineState::eSTOP);
        CHECK(toInt(state.pc) == 2);
        CHECK(state.steps == 3);
    }

    TEST_CASE("stepping a halted machine fails")
    {
        auto machine = makeMachine("STOP");
        machine.run();
        REQUIRE(machine.halted());
        CHECK_THROWS_AS(machine.step(), Exception);
        try {
            machine.step();
        }
        catch(Exception& ex) {
            CHECK(ex.errorType == eMACHINE_HALTED);
        }
    }

    TEST_CASE("accumulator arithmetic wraps at 12 bit")
    {
        auto add = makeMachine("INI 0x0 0x7ff\nINI 0x1 0x1\nLOAD 0x0\nADD 0x1\nSTOP\n");
        CHECK(add.run().acc == -2048);
        auto sub = makeMachine("INI 0x0 0x800\nINI 0x1 0x1\nLOAD 0x0\nSUB 0x1\nSTOP\n");
        CHECK(sub.run().acc == 2047);
        auto neg = makeMachine("INI 0x0 0x5\nINI 0x1 0x7\nLOAD 0x0\nSUB 0x1\nSTOP\n");
        CHECK(neg.run().acc == -2);
    }

    TEST_CASE("conditional jumps at zero")
    {
        auto machine = makeMachine(R"(INI 0x0 0x0
LOAD 0x0
JGE 0x3
STOP
JNE 0x5
JUMP 0x6
STOP
STOP
)");
        CHECK(toInt(machine.step().pc) == 1);
        CHECK(toInt(machine.step().pc) == 3);
        CHECK(toInt(machine.step().pc) == 4);
        CHECK(toInt(machine.step().pc) == 6);
        auto state = machine.step();
        CHECK(state.haltReason == MachineState::eSTOP);
        CHECK(toInt(state.pc) == 6);
    }

    TEST_CASE("conditional jumps for negative and positive accumulator")
    {
        SUBCASE("negative takes JNE but not JGE") {
            auto machine = makeMachine("INI 0x0 0xfff\nLOAD 0x0\nJGE 0x0\nJNE 0x0\n");
            machine.step();
            CHECK(toInt(machine.step().pc) == 2);
            CHECK(toInt(machine.step().pc) == 0);
        }
        SUBCASE("positive takes both") {
            auto machine = makeMachine("INI 0x0 0x1\nLOAD 0x0\nJGE 0x3\nSTOP\nJNE 0x0\n");
            machine.step();
            CHECK(toInt(machine.step().pc) == 3);
            CHECK(toInt(machine.step().pc) == 0);
        }
    }

    TEST_CASE("division sample with the 12 bit dividend 0xfa3")
    {
        auto machine = makeMachine(divisionProgram("0xfa3"));
        auto state = machine.run();
        CHECK(state.halted());
        CHECK(state.haltReason == MachineState::eSTOP);
        CHECK(toInt(state.pc) == 5);
        CHECK(state.memory.peek(Address{0x103}) == -93);
        CHECK(toPattern(state.memory.peek(Address{0x103})) == 0xfa3);
        CHECK(state.memory.peek(Address{0x104}) == 0);
        CHECK(state.steps == 6);
    }

    TEST_CASE("division sample with a positive dividend")
    {
        auto machine = makeMachine(divisionProgram("0x7d3"));
        auto state = machine.run();
        CHECK(state.haltReason == MachineState::eSTOP);
        CHECK(state.memory.peek(Address{0x104}) == 24);
        CHECK(state.memory.peek(Address{0x103}) == 35);
        CHECK(state.steps == 198);
    }

    TEST_CASE("jumping to the end of the program halts with an invalid program counter")
    {
        auto machine = makeMachine("LOAD 0x0\nJUMP 0x2\n");
        auto state = machine.step();
        state = machine.step();
        CHECK_FALSE(state.halted());
        CHECK(toInt(state.pc) == 2);
        state = machine.step();
        CHECK(state.halted());
        CHECK(state.haltReason == MachineState::eINVALID_PROGRAM_COUNTER);
        CHECK(state.steps == 2);
    }

    TEST_CASE("jumping far beyond the program")
    {
        auto machine = makeMachine("JUMP 0xfff\n");
        auto state = machine.run();
        CHECK(state.haltReason == MachineState::eINVALID_PROGRAM_COUNTER);
        CHECK(toInt(state.pc) == 0xfff);
    }

    TEST_CASE("falling off the end")
    {
        auto machine = makeMachine("INI 0x0 0x3\nLOAD 0x0\n");
        auto state = machine.run();
        CHECK(state.haltReason == MachineState::eINVALID_PROGRAM_COUNTER);
        CHECK(toInt(state.pc) == 1);
        CHECK(state.acc == 3);
    }

    TEST_CASE("halt reasons map onto runtime error types")
    {
        CHECK(haltErrorType(MachineState::eNOT_HALTED) == eNO_ERROR);
        CHECK(haltErrorType(MachineState::eSTOP) == eNO_ERROR);
        CHECK(haltErrorType(MachineState::eINVALID_PROGRAM_COUNTER) == eINVALID_PROGRAM_COUNTER);
        CHECK(haltErrorType(MachineState::eINVALID_MEMORY_ACCESS) == eINVALID_MEMORY_ACCESS);
        auto machine = makeMachine("JUMP 0x7\n");
        CHECK(haltErrorType(machine.run().haltReason) == eINVALID_PROGRAM_COUNTER);
    }

    TEST_CASE("empty program halts on the first fetch")
    {
        Machine machine(Program{}, Memory{});
        auto state = machine.step();
        CHECK(state.haltReason == MachineState::eINVALID_PROGRAM_COUNTER);
        CHECK(state.steps == 0);
        CHECK_FALSE(state.lastExecuted.has_value());
    }

    TEST_CASE("endless program keeps advancing under an external step cap")
    {
        auto machine = makeMachine(R"(INI 0x1 0x1
LOAD 0x0
ADD 0x1
STORE 0x0
JUMP 0x0
)");
        const uint64_t cap = 400;
        while(!machine.halted() && machine.steps() < cap) {
            machine.step();
        }
        auto state = machine.state();
        CHECK_FALSE(state.halted());
        CHECK(state.steps == cap);
        CHECK(state.memory.peek(Address{0}) == 100);
        for(int i = 0; i < 4; ++i)
            machine.step();
        CHECK(machine.state().memory.peek(Address{0}) == 101);
    }

    TEST_CASE("reset restores the loaded image")
    {
        auto machine = makeMachine("INI 0x0 0x2\nLOAD 0x0\nADD 0x0\nSTORE 0x0\nSTOP\n");
        CHECK(machine.run().memory.peek(Address{0}) == 4);
        machine.reset();
        auto state = machine.state();
        CHECK(state.status == MachineState::eREADY);
        CHECK(state.memory.peek(Address{0}) == 2);
        CHECK(state.acc == 0);
        CHECK(machine.run().memory.peek(Address{0}) == 4);
    }

    TEST_CASE("strict memory mode faults on undefined reads")
    {
        SUBCASE("default mode reads zero") {
            auto machine = makeMachine("LOAD 0x5\nSTOP\n");
            auto state = machine.run();
            CHECK(state.haltReason == MachineState::eSTOP);
            CHECK(state.acc == 0);
        }
        SUBCASE("strict mode halts") {
            auto machine = makeMachine("LOAD 0x5\nSTOP\n", {true});
            auto state = machine.run();
            CHECK(state.haltReason == MachineState::eINVALID_MEMORY_ACCESS);
            CHECK(toInt(state.pc) == 0);
        }
        SUBCASE("stored cells are defined") {
            auto machine = makeMachine("INI 0x1 0x3\nLOAD 0x1\nSTORE 0x2\nADD 0x2\nSTOP\n", {true});
            auto state = machine.run();
            CHECK(state.haltReason == MachineState::eSTOP);
            CHECK(state.acc == 6);
        }
    }
}
