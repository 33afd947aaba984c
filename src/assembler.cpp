//---------------------------------------------------------------------------------------
// src/assembler.cpp
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
#include <mu0/lexer.hpp>
#include <mu0/utility.hpp>

#include <ghc/filesystem.hpp>
#include <fmt/format.h>

#include <variant>
#include <vector>

namespace fs = ghc::filesystem;

namespace mu0 {

template<class... Ts> struct visitor : Ts... { using Ts::operator()...;  };
template<class... Ts> visitor(Ts...) -> visitor<Ts...>;

void Assembler::reset()
{
    _program = Program{};
    _memory = Memory{};
    _numSourceLines = 0;
    _result.reset();
}

const AssembleResult& Assembler::assembleFile(const std::string& filename)
{
    reset();
    std::error_code ec;
    if(!fs::exists(filename, ec) || !fs::is_regular_file(filename, ec)) {
        return fail(filename, Exception(eIO_ERROR, fmt::format("source file '{}' not found", filename)));
    }
    auto content = loadTextFile(filename);
    if(!content) {
        return fail(filename, Exception(eIO_ERROR, fmt::format("could not read source file '{}'", filename)));
    }
    return assemble(*content, filename);
}

const AssembleResult& Assembler::assemble(std::string_view source, const std::string& filename)
{
    reset();
    if(source.length() >= 3 && source[0] == (char)0xef && source[1] == (char)0xbb && source[2] == (char)0xbf)
        source.remove_prefix(3); // skip BOM

    if(_progress) _progress(1, "parsing source ...");
    auto lines = splitLines(source);
    std::vector<Instruction> instructions;
    Memory memory;
    for(const auto& sourceLine : lines) {
        try {
            auto classified = classifyLine(sourceLine);
            std::visit(visitor{
                [](const BlankLine&) {},
                [](const CommentLine&) {},
                [&](const DataLine& data) {
                    memory.initialize(data.address, data.value);
                    if(_progress) _progress(2, fmt::format("recognized: {}", sourceLine.text));
                },
                [&](const InstructionLine& code) {
                    instructions.push_back({code.opcode, code.operand, sourceLine.line, code.comment});
                    if(_progress) _progress(2, fmt::format("recognized: {}", sourceLine.text));
                }
            }, classified);
        }
        catch(Exception& ex) {
            return fail(filename, ex);
        }
    }
    _numSourceLines = lines.size();
    _program = Program(std::move(instructions));
    _memory = memory;
    if(_progress) _progress(1, fmt::format("assembled {} instructions, {} initialized memory cells", _program.size(), _memory.definedCells().size()));
    return _result;
}

const AssembleResult& Assembler::fail(const std::string& filename, const Exception& ex)
{
    _program = Program{};
    _memory = Memory{};
    _result.resultType = AssembleResult::eERROR;
    _result.errorType = ex.errorType;
    _result.errorMessage = ex.errorMessage;
    _result.location = {filename, ex.line, ex.column, ex.sourceText};
    if(_progress) _progress(1, fmt::format("assembly failed: {}", ex.errorMessage));
    return _result;
}

}
