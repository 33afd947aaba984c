//---------------------------------------------------------------------------------------
// include/mu0/utility.hpp
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

#include <algorithm>
#include <cctype>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mu0 {

inline bool isBlank(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

inline std::string_view trim(std::string_view text)
{
    while(!text.empty() && isBlank(text.front()))
        text.remove_prefix(1);
    while(!text.empty() && isBlank(text.back()))
        text.remove_suffix(1);
    return text;
}

inline std::string toUpper(std::string_view text)
{
    std::string result(text);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c){ return std::toupper(c); });
    return result;
}

inline std::vector<std::string_view> splitWords(std::string_view text)
{
    std::vector<std::string_view> result;
    size_t pos = 0;
    while(pos < text.size()) {
        while(pos < text.size() && isBlank(text[pos]))
            ++pos;
        auto start = pos;
        while(pos < text.size() && !isBlank(text[pos]))
            ++pos;
        if(pos > start)
            result.push_back(text.substr(start, pos - start));
    }
    return result;
}

// empty optional if the file could not be opened or read
inline std::optional<std::string> loadTextFile(const std::string& file)
{
    std::ifstream is(file, std::ios::binary | std::ios::ate);
    if(!is)
        return {};
    std::streamsize size = is.tellg();
    if(size < 0)
        return {};
    is.seekg(0, std::ios::beg);

    std::string result(size, '\0');
    if (is.read(result.data(), size)) {
        return result;
    }

    return {};
}

std::string toJsonKey(std::string_view text);

}
