//---------------------------------------------------------------------------------------
// src/mu0.cpp
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

#include <mu0/assembler.hpp>
#include <mu0/machine.hpp>
#include <mu0/statedump.hpp>

#include <ghc/cli.hpp>
#include <ghc/filesystem.hpp>
#include <nlohmann/json.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace fs = ghc::filesystem;

static void printAssembleError(const mu0::AssembleResult& result)
{
    const auto& location = result.location;
    if(location.line) {
        std::cerr << location.file << ":" << location.line << ":";
        if(location.column)
            std::cerr << location.column << ":";
        std::cerr << " " << mu0::errorTypeName(result.errorType) << ": " << result.errorMessage << std::endl;
        std::cerr << "    " << location.text << std::endl;
    }
    else {
        std::cerr << "ERROR: " << result.errorMessage << std::endl;
    }
}

int main(int argc, char* argv[])
{
    using namespace std::chrono;
    ghc::CLI cli(argc, argv);
    bool listing = false;
    bool stepMode = false;
    bool trace = false;
    bool strictMemory = false;
    bool dumpAll = false;
    bool quiet = false;
    bool verbose = false;
    bool version = false;
    bool opcodes = false;
    int64_t maxSteps = 0;
    int verbosity = 1;
    int rc = 0;
    std::string jsonFile;
    std::vector<std::string> inputList;

    cli.category("Assembler");
    cli.option({"-l", "--listing"}, listing, "print a listing of the assembled program with instruction indices and machine words");

    cli.category("Execution");
    cli.option({"-s", "--step"}, stepMode, "execute step by step, showing the machine state and waiting for ENTER after each instruction");
    cli.option({"-t", "--trace"}, trace, "show the machine state after each instruction without waiting");
    cli.option({"--max-steps"}, maxSteps, "stop execution after the given number of instructions, default 0 is unlimited");
    cli.option({"--strict-memory"}, strictMemory, "halt on reading memory cells that were never initialized or stored to");
    cli.option({"--dump-all"}, dumpAll, "dump all 4096 memory cells instead of only the used ones");
    cli.option({"-j", "--json"}, jsonFile, "write the final machine state as JSON to the given file");

    cli.category("General");
    cli.option({"-q", "--quiet"}, quiet, "suppress all output but errors and the final memory dump");
    cli.option({"-v", "--verbose"}, verbose, "more verbose progress output");
    cli.option({"--opcodes"}, opcodes, "lists the MU0 instruction set and exits");
    cli.option({"--version"}, version, "just shows version info and exits");

    cli.positional(inputList, "MU0 source file to assemble and run");
    cli.parse();

    if(quiet)
        verbosity = 0;
    else if(verbose)
        verbosity = 100;

    if(!quiet || version) {
        std::clog << "mu0 v" MU0_VERSION ", emulator for the MU0 accumulator machine\n" << std::endl;
        if(version)
            return 0;
    }

    if(opcodes) {
        mu0::dumpOpcodes(std::cout);
        return 0;
    }

    if(inputList.size() != 1) {
        std::cerr << "ERROR: " << (inputList.empty() ? "No source file given" : "Only one source file supported") << std::endl;
        return 1;
    }
    if(maxSteps < 0) {
        std::cerr << "ERROR: --max-steps needs a positive value or 0" << std::endl;
        return 1;
    }
    if(!fs::exists(inputList.front()) || fs::is_directory(inputList.front())) {
        std::cerr << "ERROR: Source file '" << inputList.front() << "' not found." << std::endl;
        return 1;
    }

    mu0::Assembler assembler;
    if(!quiet) {
        assembler.setProgressHandler([&](int verbLvl, std::string msg) {
            if (verbLvl <= verbosity) {
                std::clog << std::string(verbLvl * 2 - 2, ' ') << msg << std::endl;
            }
        });
    }

    auto start = steady_clock::now();
    try {
        const auto& result = assembler.assembleFile(inputList.front());
        if(result.resultType != mu0::AssembleResult::eOK) {
            printAssembleError(result);
            return 1;
        }
        const auto& program = assembler.program();
        if(listing) {
            std::cout << "\n### Program listing:" << std::endl;
            mu0::dumpListing(std::cout, program);
        }
        if(!quiet) {
            std::cout << "\n### Memory dump before program execution:" << std::endl;
            mu0::dumpMemory(std::cout, assembler.memory(), !dumpAll);
            std::cout << "\n### Running the program ..." << std::endl;
        }

        mu0::Machine machine(program, assembler.memory(), {strictMemory});
        auto limit = static_cast<uint64_t>(maxSteps);
        mu0::MachineState state;
        if(!stepMode && !trace && !limit) {
            state = machine.run();
        }
        else {
            state = machine.state();
            while(!machine.halted() && (!limit || machine.steps() < limit)) {
                state = machine.step();
                if((stepMode || trace) && !state.halted()) {
                    std::cout << std::endl;
                    mu0::dumpStep(std::cout, program, state);
                    if(stepMode) {
                        std::cout << "Press ENTER for next instruction" << std::flush;
                        std::string dummy;
                        std::getline(std::cin, dummy);
                    }
                }
            }
        }

        if(state.halted()) {
            std::cout << "\n### " << mu0::haltMessage(program, state) << std::endl;
            if(mu0::haltErrorType(state.haltReason) == mu0::eINVALID_MEMORY_ACCESS)
                rc = 1;
        }
        else {
            std::cerr << "ERROR: Step limit of " << limit << " instructions reached without halting." << std::endl;
            rc = 2;
        }
        std::cout << "\n### Memory dump after program end:" << std::endl;
        mu0::dumpMemory(std::cout, state.memory, !dumpAll);

        if(!jsonFile.empty()) {
            std::ofstream out(jsonFile);
            if(!out) {
                std::cerr << "ERROR: Couldn't write JSON state to '" << jsonFile << "'." << std::endl;
                rc = 1;
            }
            else {
                out << mu0::stateToJson(state, !dumpAll).dump(4) << std::endl;
            }
        }
    }
    catch (std::exception& ex) {
        std::cerr << "Internal error: " << ex.what() << std::endl;
        rc = -1;
    }
    auto duration = duration_cast<milliseconds>(steady_clock::now() - start).count();
    if (!quiet)
        std::clog << "Duration: " << duration << "ms\n" << std::endl;
    return rc;
}
