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

#include "keyval/converter.hpp"
#include "keyval/struct_copier.hpp"
#include "keyval/type_pair.hpp"
#include <vector>

namespace keyval
{

// Types.

class Copier_cache;

/**
 * Compiles conversions: given a (destination, source) Shape pair, picks exactly one applicable rule and produces
 * a Converter; given a pair of struct shapes, produces a Struct_copier.
 *
 * ### Rules ###
 * Evaluated in this priority order; the first that applies wins (no backtracking):
 *   -# identical shapes: raw byte copy (trivially-copyable shapes) or copy-assignment (others);
 *   -# string-kind into string-kind closed enumeration: membership check, then copy;
 *   -# distinct shapes with the same scalar representation (named strings, enumerations): copy as-is;
 *   -# value conversion: between numeric kinds; string-kind to/from `std::vector<uint8_t>`;
 *   -# domain pairs (Converter::Domain_pair): time/date to/from protocol timestamp pointer; UUID, ULID, decimal,
 *      language tag to/from `std::string`;
 *   -# source with copy-to capability: if it refuses the destination shape, compilation fails;
 *   -# pointer to pointer: identical pointees share the pointee, else deep conversion;
 *   -# slice to slice: element-wise;
 *   -# optional to pointer;
 *   -# pointer to optional;
 *   -# non-pointer value to optional (zero value means absent);
 *   -# required source: unwrap (absence is a conversion-time error);
 *   -# non-pointer to pointer: allocate and convert;
 *   -# pointer to non-pointer: dereference (null means the destination keeps its value);
 *   -# struct to struct: nested struct copier, via the Copier_cache if one was given;
 *   -# struct to dynamic map: every exported field not tagged `kv:"-"`, keyed by its `key` tag or else its name;
 *   -# dynamic map to struct: the same fields; each key must be present and hold a value of the field's shape.
 *
 * Otherwise compilation fails with error::Code::S_UNSUPPORTED_TYPE_PAIR.
 *
 * Resolution recurses through element, pointee and field shapes; struct pairs being compiled are tracked, so a
 * pair that would (directly or through nesting) require its own copier fails with
 * error::Code::S_CIRCULAR_TYPE_REFERENCE instead of recursing forever.
 *
 * ### Thread safety ###
 * All methods are `const`; the resolver has no mutable state of its own.  Concurrent use is safe (the
 * Copier_cache is itself thread-safe).
 */
class Conversion_resolver :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs resolver.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  May be null.
   * @param cache_or_null
   *        Cache through which nested struct copiers are obtained; null means nested struct copiers are compiled
   *        each time.  Must outlive `*this`.
   */
  explicit Conversion_resolver(flow::log::Logger* logger_ptr, Copier_cache* cache_or_null);

  // Methods.

  /**
   * Resolves the converter for a pair.
   *
   * @param dst_shape
   *        Destination shape.
   * @param src_shape
   *        Source shape.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        the compilation-time codes (see error::Code).
   * @return The converter; null if and only if `*err_code` is set to truthy.
   */
  Converter::Ptr resolve(const Shape& dst_shape, const Shape& src_shape, Error_code* err_code = 0) const;

  /**
   * Compiles the struct copier for a pair of struct shapes.  Iterates the source fields in declaration order,
   * skipping unexported ones, ones tagged `kv:"-"`, and ones excluded by `options`; each remaining field is
   * matched by name to an exported destination field and converted per resolve().  The result is *not* cached
   * here (see Copier).
   *
   * @param dst_shape
   *        Destination shape.
   * @param src_shape
   *        Source shape.
   * @param options
   *        Options.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_TYPE_NOT_STRUCT, error::Code::S_FIELD_NOT_FOUND, and whatever resolve() emits.
   * @return The copier; null if and only if `*err_code` is set to truthy.
   */
  Struct_copier::Ptr compile_struct(const Shape& dst_shape, const Shape& src_shape, const Copier_options& options,
                                    Error_code* err_code = 0) const;

private:
  // Types.

  /// Struct pairs whose compilation is in progress in the current (recursive) resolution.
  using Pair_stack = std::vector<Type_pair>;

  // Methods.

  /**
   * resolve() implementation.
   *
   * @param dst_shape
   *        See resolve().
   * @param src_shape
   *        See resolve().
   * @param in_progress
   *        See #Pair_stack.
   * @param err_code
   *        See resolve(); not null.
   * @return See resolve().
   */
  Converter::Ptr resolve_impl(const Shape& dst_shape, const Shape& src_shape, Pair_stack* in_progress,
                              Error_code* err_code) const;

  /**
   * compile_struct() implementation.
   *
   * @param dst_shape
   *        See compile_struct().
   * @param src_shape
   *        See compile_struct().
   * @param options
   *        See compile_struct().
   * @param in_progress
   *        See #Pair_stack.
   * @param err_code
   *        See compile_struct(); not null.
   * @return See compile_struct().
   */
  Struct_copier::Ptr compile_struct_impl(const Shape& dst_shape, const Shape& src_shape,
                                         const Copier_options& options, Pair_stack* in_progress,
                                         Error_code* err_code) const;

  /**
   * Rule 15: obtains the nested struct copier (default options), failing on a circular reference.
   *
   * @param dst_shape
   *        See compile_struct().
   * @param src_shape
   *        See compile_struct().
   * @param in_progress
   *        See #Pair_stack.
   * @param err_code
   *        See compile_struct(); not null.
   * @return See compile_struct().
   */
  Struct_copier::Ptr nested_struct_copier(const Shape& dst_shape, const Shape& src_shape, Pair_stack* in_progress,
                                          Error_code* err_code) const;

  /**
   * Creates a converter with no nested converter.
   *
   * @param op
   *        Operation.
   * @param dst_shape
   *        Destination shape.
   * @param src_shape
   *        Source shape.
   * @param operands
   *        Operands.
   * @return See above.
   */
  Converter::Ptr make_converter(Converter::Op op, const Shape& dst_shape, const Shape& src_shape,
                                Converter::Operands&& operands = Converter::Operands()) const;

  /**
   * Resolves the converter `dst_elem_shape` <- `src_elem_shape`, then creates a converter using it as nested
   * converter.
   *
   * @param op
   *        Operation.
   * @param dst_shape
   *        Destination shape.
   * @param src_shape
   *        Source shape.
   * @param dst_elem_shape
   *        Destination shape of the nested conversion.
   * @param src_elem_shape
   *        Source shape of the nested conversion.
   * @param in_progress
   *        See #Pair_stack.
   * @param err_code
   *        See resolve(); not null.
   * @return See resolve().
   */
  Converter::Ptr make_nesting_converter(Converter::Op op, const Shape& dst_shape, const Shape& src_shape,
                                        const Shape& dst_elem_shape, const Shape& src_elem_shape,
                                        Pair_stack* in_progress, Error_code* err_code) const;

  /**
   * Rules 16 and 17: the map key table of a struct shape.
   *
   * @param struct_shape
   *        The struct shape.
   * @return See above.
   */
  static std::vector<Converter::Map_key> map_keys(const Shape& struct_shape);

  // Data.

  /// See ctor.
  Copier_cache* const m_cache_or_null;
}; // class Conversion_resolver

} // namespace keyval
