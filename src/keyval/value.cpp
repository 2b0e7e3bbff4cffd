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
#include "keyval/value.hpp"
#include <new>

namespace keyval
{

Value::Value() :
  m_shape(nullptr)
{
  // Done.
}

Value::Value(const Shape* shape, boost::shared_ptr<void> data) :
  m_shape(shape),
  m_data(std::move(data))
{
  // Done.
}

Value Value::make(const Shape& shape) // Static.
{
  const std::align_val_t alignment(shape.alignment());
  void* const storage = ::operator new(shape.size(), alignment);
  try
  {
    shape.construct(storage);
  }
  catch (...)
  {
    ::operator delete(storage, alignment);
    throw;
  }

  return Value(&shape, boost::shared_ptr<void>(storage, [&shape, alignment](void* addr)
  {
    shape.destroy(addr);
    ::operator delete(addr, alignment);
  }));
}

Value Value::view(const Shape& shape, void* addr) // Static.
{
  // Aliasing ctor with an empty owner: non-owning.
  return Value(&shape, boost::shared_ptr<void>(boost::shared_ptr<void>(), addr));
}

Value Value::with_shape(const Shape& shape) const
{
  return Value(&shape, m_data);
}

bool Value::empty() const
{
  return !m_shape;
}

const Shape* Value::shape() const
{
  return m_shape;
}

void* Value::data() const
{
  return m_data.get();
}

} // namespace keyval
