//---------------------------------------------------------------------------------------
// include/mu0/lexer.hpp
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

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mu0 {

struct SourceLine {
    std::string_view text;
    int line{0};
};

struct BlankLine {};

struct CommentLine {
    std::string comment;
};

struct DataLine {
    Address address{};
    Value value{};
    std::string comment;
};

struct InstructionLine {
    Opcode opcode{Opcode::STOP};
    uint16_t operand{0};
    std::string comment;
};

using ClassifiedLine = std::variant<BlankLine, CommentLine, DataLine, InstructionLine>;

// Splits text into numbered lines (1-based), accepting LF and CRLF endings.
std::vector<SourceLine> splitLines(std::string_view text);

// Classifies a single line, throws mu0::Exception with line, column and text
// of the offending statement filled in.
ClassifiedLine classifyLine(const SourceLine& source);

}
