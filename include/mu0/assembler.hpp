//---------------------------------------------------------------------------------------
// include/mu0/assembler.hpp
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

#include <functional>
#include <string>
#include <string_view>

namespace mu0 {

struct AssembleResult {
    enum ResultType { eOK, eERROR };
    struct Location {
        std::string file;
        int line{};
        int column{};
        std::string text;
    };
    ResultType resultType{eOK};
    ErrorType errorType{eNO_ERROR};
    std::string errorMessage;
    Location location;
    void reset()
    {
        resultType = eOK;
        errorType = eNO_ERROR;
        errorMessage.clear();
        location = {};
    }
};

class Assembler
{
public:
    using ProgressHandler = std::function<void(int verbosity, std::string msg)>;
    Assembler() = default;
    const AssembleResult& assemble(std::string_view source, const std::string& filename = "<source>");
    const AssembleResult& assembleFile(const std::string& filename);
    bool isError() const { return _result.resultType != AssembleResult::eOK; }
    const Program& program() const { return _program; }
    const Memory& memory() const { return _memory; }
    size_t numSourceLines() const { return _numSourceLines; }
    void setProgressHandler(ProgressHandler handler) { _progress = std::move(handler); }

private:
    void reset();
    const AssembleResult& fail(const std::string& filename, const Exception& ex);
    Program _program;
    Memory _memory;
    size_t _numSourceLines{0};
    ProgressHandler _progress;
    AssembleResult _result;
};

}
