/* Keyval: Structured Value Conversion
 * Copyright (c) 2023 Akamai Technologies, Inc.; and other contributors.
 * Each commit is copyright by its respective author or author's employer.
 *
 * Licensed under the MIT License:
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE. */

/// @file
#include "keyval/memcopy.hpp"
#include <cstring>

namespace keyval
{

// Implementations.

namespace
{

/// Fixed-size copy: a constant `N` lets the compiler emit straight-line moves instead of a `memcpy()` call.
template<size_t N>
void memcopy_fixed(void* dst, const void* src)
{
  std::memcpy(dst, src, N);
}

} // namespace (anon)

void memcopy(void* dst, const void* src, size_t size)
{
  switch (size)
  {
  case 8:
    memcopy_fixed<8>(dst, src);
    break;
  case 16:
    memcopy_fixed<16>(dst, src);
    break;
  case 24:
    memcopy_fixed<24>(dst, src);
    break;
  default:
    std::memcpy(dst, src, size);
  }
} // memcopy()

} // namespace keyval
