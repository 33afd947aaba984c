//---------------------------------------------------------------------------------------
// src/lexer.cpp
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

#include <mu0/lexer.hpp>
#include <mu0/encoder.hpp>
#include <mu0/utility.hpp>

#include <fmt/format.h>

namespace mu0 {

namespace {

std::string extractComment(std::string_view text)
{
    while(!text.empty() && text.front() == ';')
        text.remove_prefix(1);
    return std::string(trim(text));
}

int columnOf(std::string_view line, std::string_view token)
{
    return static_cast<int>(token.data() - line.data()) + 1;
}

template<typename Decoder>
auto decodeOperand(Decoder decoder, std::string_view line, std::string_view token)
{
    try {
        return decoder(token);
    }
    catch(Exception& ex) {
        ex.column = columnOf(line, token);
        throw;
    }
}

}

std::vector<SourceLine> splitLines(std::string_view text)
{
    std::vector<SourceLine> result;
    int line = 1;
    while(!text.empty()) {
        auto eol = text.find('\n');
        auto content = text.substr(0, eol);
        if(!content.empty() && content.back() == '\r')
            content.remove_suffix(1);
        result.push_back({content, line++});
        if(eol == std::string_view::npos)
            break;
        text.remove_prefix(eol + 1);
    }
    return result;
}

ClassifiedLine classifyLine(const SourceLine& source)
{
    try {
        auto statement = source.text;
        std::string comment;
        bool hasComment = false;
        if(auto pos = statement.find(';'); pos != std::string_view::npos) {
            comment = extractComment(statement.substr(pos));
            hasComment = true;
            statement = statement.substr(0, pos);
        }
        auto tokens = splitWords(statement);
        if(tokens.empty()) {
            if(hasComment)
                return CommentLine{comment};
            return BlankLine{};
        }
        auto syntaxError = [&](std::string message) {
            Exception ex(eSYNTAX_ERROR, std::move(message));
            ex.column = columnOf(source.text, tokens.front());
            return ex;
        };
        if(toUpper(tokens[0]) == DATA_DIRECTIVE) {
            if(tokens.size() != 3)
                throw syntaxError(fmt::format("'{}' expects an address and a value", tokens[0]));
            auto address = decodeOperand(parseAddress, source.text, tokens[1]);
            auto value = decodeOperand(parseValue, source.text, tokens[2]);
            return DataLine{address, value, comment};
        }
        const auto* info = findMnemonic(tokens[0]);
        if(!info)
            throw syntaxError(fmt::format("unrecognized statement '{}'", trim(statement)));
        if(!info->hasOperand) {
            if(tokens.size() != 1)
                throw syntaxError(fmt::format("'{}' takes no operand", tokens[0]));
            return InstructionLine{info->opcode, 0, comment};
        }
        if(tokens.size() != 2)
            throw syntaxError(fmt::format("'{}' expects exactly one address operand", tokens[0]));
        auto operand = decodeOperand(parseAddress, source.text, tokens[1]);
        return InstructionLine{info->opcode, toInt(operand), comment};
    }
    catch(Exception& ex) {
        ex.line = source.line;
        ex.sourceText = std::string(source.text);
        throw;
    }
}

}
