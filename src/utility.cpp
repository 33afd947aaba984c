//---------------------------------------------------------------------------------------
// src/utility.cpp
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

#include <mu0/utility.hpp>

namespace mu0 {

std::string toJsonKey(std::string_view text)
{
    enum Category { eSEPARATOR, eLOWER, eUPPER, eDIGIT };
    auto categoryOf = [](unsigned char c) {
        if(std::isdigit(c))
            return eDIGIT;
        if(std::isupper(c))
            return eUPPER;
        if(std::islower(c))
            return eLOWER;
        return eSEPARATOR;
    };
    std::vector<std::string> words;
    std::string current;
    Category previous = eSEPARATOR;
    for(unsigned char c : text) {
        auto category = categoryOf(c);
        if(category == eSEPARATOR) {
            if(!current.empty())
                words.push_back(std::move(current));
            current.clear();
            previous = eSEPARATOR;
            continue;
        }
        if(!current.empty() && ((previous == eLOWER && category == eUPPER) || (previous == eDIGIT) != (category == eDIGIT))) {
            words.push_back(std::move(current));
            current.clear();
        }
        current += static_cast<char>(c);
        previous = category;
    }
    if(!current.empty())
        words.push_back(std::move(current));

    std::string result;
    for(size_t i = 0; i < words.size(); ++i) {
        auto& word = words[i];
        std::transform(word.begin(), word.end(), word.begin(), [](unsigned char c){ return std::tolower(c); });
        if(i)
            word[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(word[0])));
        result += word;
    }
    return result;
}

}
