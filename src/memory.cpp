//---------------------------------------------------------------------------------------
// src/memory.cpp
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

#include <mu0/memory.hpp>

namespace mu0 {

Value Memory::load(Address address)
{
    _usage[toInt(address)] |= eREAD;
    return _cells[toInt(address)];
}

void Memory::store(Address address, Value value)
{
    _cells[toInt(address)] = wrap12(value);
    _usage[toInt(address)] |= eWRITTEN;
}

void Memory::initialize(Address address, Value value)
{
    _cells[toInt(address)] = wrap12(value);
    _usage[toInt(address)] |= eINITIALIZED;
}

bool Memory::isDefined(Address address) const
{
    return (_usage[toInt(address)] & (eINITIALIZED | eWRITTEN)) != eNONE;
}

std::vector<Address> Memory::definedCells() const
{
    std::vector<Address> result;
    for(uint32_t addr = 0; addr < SIZE; ++addr) {
        if(isDefined(static_cast<Address>(addr)))
            result.push_back(static_cast<Address>(addr));
    }
    return result;
}

}
