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

#include "keyval/shape.hpp"
#include <ostream>

namespace keyval
{

// Types.

/**
 * (Destination shape, source shape) identity pair: the key of compiled-copier and registered-conversion tables.
 * Pure value; refers to, but does not own, the shapes.
 */
struct Type_pair
{
  // Data.

  /// Destination shape.
  const Shape* m_dst;

  /// Source shape.
  const Shape* m_src;
};

// Free functions.

/**
 * Equality: both identities equal.
 *
 * @relatesalso Type_pair
 *
 * @param val1
 *        Object to compare.
 * @param val2
 *        Object to compare.
 * @return See above.
 */
bool operator==(const Type_pair& val1, const Type_pair& val2);

/**
 * Hash, for boost.unordered.
 *
 * @relatesalso Type_pair
 *
 * @param val
 *        Object to hash.
 * @return See above.
 */
size_t hash_value(const Type_pair& val);

/**
 * Prints `<dst>` `<-` `<src>` shape names.
 *
 * @relatesalso Type_pair
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Type_pair& val);

} // namespace keyval
