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
#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>
#include <map>
#include <string>

namespace keyval
{

// Types.

template<typename T>
const Shape& shape_of();

/**
 * A generic value: the pair (shape descriptor, data address), the latter either owned (shared among copies of
 * the Value) or borrowed.  Generic code (the dynamic map, the serializer, reinterpretation) works on these.
 *
 * Copying a Value copies the pair, not the data: copies share the data.
 */
class Value
{
public:
  // Constructors/destructor.

  /// Empty value: no shape, no data.
  Value();

  // Methods.

  /**
   * Owning value holding a copy of `val`.
   *
   * @tparam T
   *         Type with a Shape.
   * @param val
   *        Value.
   * @return See above.
   */
  template<typename T>
  static Value of(T val);

  /**
   * Non-owning value referring to `*obj`, which must outlive the result (and its copies).
   *
   * @tparam T
   *         Type with a Shape.
   * @param obj
   *        Object.
   * @return See above.
   */
  template<typename T>
  static Value view(T* obj);

  /**
   * Untyped view(): non-owning value of the given shape at the given address.
   *
   * @param shape
   *        Shape of the object at `addr` (or one layout-identical to it); must outlive the result.
   * @param addr
   *        Object address.
   * @return See above.
   */
  static Value view(const Shape& shape, void* addr);

  /**
   * Owning value holding a default-constructed object of the given shape.
   *
   * @param shape
   *        Shape; must outlive the result.
   * @return See above.
   */
  static Value make(const Shape& shape);

  /**
   * Value with the same data as `*this` (shared) but described by `shape`.  No data is touched; it is the caller's
   * responsibility that `shape` describes the data correctly (same layout).
   *
   * @param shape
   *        Shape.
   * @return See above.
   */
  Value with_shape(const Shape& shape) const;

  /**
   * Whether this is the empty value.
   * @return See above.
   */
  bool empty() const;

  /**
   * Shape; null if empty().
   * @return See above.
   */
  const Shape* shape() const;

  /**
   * Data address; null if empty().
   * @return See above.
   */
  void* data() const;

  /**
   * Typed access: the data as `T` if the shape is exactly `shape_of<T>()`; else null.
   *
   * @tparam T
   *         Type with a Shape.
   * @return See above.
   */
  template<typename T>
  T* get() const;

private:
  // Constructors.

  /**
   * Constructs from components.
   *
   * @param shape
   *        Shape.
   * @param data
   *        Data.
   */
  explicit Value(const Shape* shape, boost::shared_ptr<void> data);

  // Data.

  /// See shape().
  const Shape* m_shape;

  /// See data().
  boost::shared_ptr<void> m_data;
}; // class Value

/// The dynamic key-value map: string keys, values of any shape.
using Dyn_map = std::map<std::string, Value>;

// Template implementations.

template<typename T>
Value Value::of(T val) // Static.
{
  return Value(&shape_of<T>(), boost::make_shared<T>(std::move(val)));
}

template<typename T>
Value Value::view(T* obj) // Static.
{
  return view(shape_of<T>(), obj);
}

template<typename T>
T* Value::get() const
{
  return (m_shape == &shape_of<T>()) ? static_cast<T*>(m_data.get()) : nullptr;
}

} // namespace keyval
