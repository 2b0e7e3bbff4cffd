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

#include "keyval/shape_of.hpp"
#include "keyval/type_pair.hpp"
#include <flow/common.hpp>
#include <boost/unordered_map.hpp>

namespace keyval
{

// Types.

/**
 * Ad hoc whole-value conversions registered by the application for exact (destination, source) type pairs.
 * Copier::copy() consults this before compiling anything, and a registered conversion wins over every rule.
 * Other value-walking layers of an application may consult find() as well, so that one program agrees on the
 * representation of shared domain types.
 *
 * Thread-safe.
 */
class Conversion_registry
{
public:
  // Types.

  /// Type-erased conversion: `(dst, src, err_code)`; `err_code` is never null; returns success.
  using Erased_func = flow::Function<bool (void* dst, const void* src, Error_code* err_code)>;

  /**
   * Typed conversion.
   *
   * @tparam D
   *         Destination type.
   * @tparam S
   *         Source type.
   */
  template<typename D, typename S>
  using Func = flow::Function<bool (D* dst, const S& src, Error_code* err_code)>;

  // Methods.

  /**
   * Registers (or replaces) the conversion for `(D, S)`.
   *
   * @tparam D
   *         Destination type.
   * @tparam S
   *         Source type.
   * @param func
   *        The conversion; on failure must set `*err_code` and return `false`.
   */
  template<typename D, typename S>
  void register_conversion(Func<D, S>&& func);

  /**
   * The conversion registered for the pair, or an empty function.
   *
   * @param key
   *        The pair.
   * @return See above.
   */
  Erased_func find(const Type_pair& key) const;

  /**
   * Number of registered conversions.
   * @return See above.
   */
  size_t size() const;

private:
  // Methods.

  /**
   * Registers (or replaces) the conversion for the pair.
   *
   * @param key
   *        The pair.
   * @param func
   *        The conversion.
   */
  void register_erased(const Type_pair& key, Erased_func&& func);

  // Data.

  /// Protects #m_funcs.
  mutable util::Mutex_shared m_mutex;

  /// The conversions.
  boost::unordered_map<Type_pair, Erased_func> m_funcs;
}; // class Conversion_registry

// Template implementations.

template<typename D, typename S>
void Conversion_registry::register_conversion(Func<D, S>&& func)
{
  register_erased(Type_pair{ &shape_of<D>(), &shape_of<S>() },
                  [func = std::move(func)](void* dst, const void* src, Error_code* err_code) -> bool
  {
    return func(static_cast<D*>(dst), *static_cast<const S*>(src), err_code);
  });
}

} // namespace keyval
