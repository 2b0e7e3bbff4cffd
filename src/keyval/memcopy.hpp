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
#pragma once

#include <cstddef>

namespace keyval
{

// Free functions.

/**
 * Copies `size` bytes from `src` to `dst`, which must not overlap.  This is the primitive behind the
 * "identical shapes" conversion of trivially-copyable values; sizes of 8, 16 and 24 bytes (the overwhelmingly
 * common sizes of scalars, pairs and small aggregates) take fixed-size paths that compile to a few moves,
 * anything else goes through `memcpy()`.
 *
 * It is the caller's responsibility that both areas are at least `size` bytes and that bytewise copying is
 * a valid way to copy the object (trivially-copyable shapes only).
 *
 * @param dst
 *        Target area.
 * @param src
 *        Source area.
 * @param size
 *        Byte count.
 */
void memcopy(void* dst, const void* src, size_t size);

} // namespace keyval
