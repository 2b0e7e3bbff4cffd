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

#include "keyval/struct_copier.hpp"
#include "keyval/type_pair.hpp"
#include <flow/common.hpp>
#include <boost/unordered_map.hpp>

namespace keyval
{

// Types.

/**
 * Registry of compiled struct copiers keyed by Type_pair: empty at construction, grows monotonically, never
 * evicts or invalidates.  Thread-safe: lookups share a reader lock; compilation happens outside any lock; only
 * the insertion is exclusive.
 *
 * Concurrent misses for the same pair may compile it twice; compilation being a deterministic function of the
 * two shapes, the first insertion wins and every caller gets that one copier.  A failed compilation is not cached.
 */
class Copier_cache :
  public flow::log::Log_context
{
public:
  // Types.

  /// Compiles a copier for a (missing) pair; the Error_code* semantics are those of get_or_compile().
  using Compile_func = flow::Function<Struct_copier::Ptr (Error_code* err_code)>;

  // Constructors/destructor.

  /**
   * Constructs empty cache.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  May be null.
   */
  explicit Copier_cache(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Returns the cached copier for `key`; if none, invokes `compile_func` (no lock held) and caches its result if
   * it succeeded.
   *
   * @param key
   *        The pair.
   * @param compile_func
   *        Compiler for the pair; invoked only on miss.  Must set `*err_code` (non-null) on failure and return null.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        whatever `compile_func` emits.
   * @return The copier; null if and only if `*err_code` is set to truthy.
   */
  Struct_copier::Ptr get_or_compile(const Type_pair& key, const Compile_func& compile_func,
                                    Error_code* err_code = 0);

  /**
   * Returns the cached copier for `key` or null.
   *
   * @param key
   *        The pair.
   * @return See above.
   */
  Struct_copier::Ptr find(const Type_pair& key) const;

  /**
   * Number of cached copiers.
   * @return See above.
   */
  size_t size() const;

private:
  // Data.

  /// Protects #m_copiers.
  mutable util::Mutex_shared m_mutex;

  /// The cache.
  boost::unordered_map<Type_pair, Struct_copier::Ptr> m_copiers;
}; // class Copier_cache

} // namespace keyval
