//---------------------------------------------------------------------------------------
// src/mu0meta.cpp
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

#include <mu0/mu0meta.hpp>
#include <mu0/utility.hpp>

namespace mu0 {

const OpcodeInfo& opcodeInfo(Opcode opcode)
{
    return detail::opcodes[static_cast<size_t>(opcode)];
}

const OpcodeInfo* findMnemonic(std::string_view mnemonic)
{
    auto name = toUpper(mnemonic);
    for(const auto& info : detail::opcodes) {
        if(info.mnemonic == name)
            return &info;
        if(std::find(info.aliases.begin(), info.aliases.end(), name) != info.aliases.end())
            return &info;
    }
    return nullptr;
}

const char* errorTypeName(ErrorType type)
{
    switch(type) {
        case eNO_ERROR: return "NoError";
        case eSYNTAX_ERROR: return "SyntaxError";
        case eMALFORMED_LITERAL: return "MalformedLiteral";
        case eADDRESS_OUT_OF_RANGE: return "AddressOutOfRange";
        case eVALUE_OUT_OF_RANGE: return "ValueOutOfRange";
        case eINVALID_PROGRAM_COUNTER: return "InvalidProgramCounter";
        case eINVALID_MEMORY_ACCESS: return "InvalidMemoryAccess";
        case eMACHINE_HALTED: return "MachineHalted";
        case eIO_ERROR: return "IOError";
    }
    return "UnknownError";
}

}
