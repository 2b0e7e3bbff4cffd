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
#include "keyval/conversion_registry.hpp"

namespace keyval
{

void Conversion_registry::register_erased(const Type_pair& key, Erased_func&& func)
{
  util::Lock_guard_exclusive lock(m_mutex);
  m_funcs[key] = std::move(func);
}

Conversion_registry::Erased_func Conversion_registry::find(const Type_pair& key) const
{
  util::Lock_guard_shared lock(m_mutex);
  const auto it = m_funcs.find(key);
  return (it == m_funcs.end()) ? Erased_func() : it->second;
}

size_t Conversion_registry::size() const
{
  util::Lock_guard_shared lock(m_mutex);
  return m_funcs.size();
}

} // namespace keyval
