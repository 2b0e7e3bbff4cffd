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
#include <boost/optional.hpp>
#include <string>
#include <vector>

namespace keyval
{

// Types.

/**
 * Options controlling which fields a struct copier copies.  The default-constructed value means: copy every
 * exported, not-excluded source field, and fail compilation if any of them has no same-named destination field.
 */
struct Copier_options
{
  // Data.

  /// If `true`, a source field without a same-named destination field is skipped instead of failing compilation.
  bool m_omit_unmatched_fields = false;

  /// If set, only source fields named here are copied.
  boost::optional<std::vector<std::string>> m_fields_to_include;

  /// Source fields named here are not copied.
  std::vector<std::string> m_fields_to_exclude;

  // Methods.

  /**
   * Whether `*this` equals the default-constructed value.
   * @return See above.
   */
  bool is_default() const;
}; // struct Copier_options

/**
 * The compiled copier of one (destination struct shape, source struct shape) pair: an ordered sequence of field
 * converters, each a Converter plus the destination and source field byte offsets.  Order is the source
 * shape's field declaration order.  Built by Conversion_resolver::compile_struct(); immutable afterwards;
 * copy() may be invoked concurrently.
 */
class Struct_copier :
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to immutable `*this`.
  using Ptr = boost::shared_ptr<const Struct_copier>;

  /// One compiled field conversion.
  struct Field_converter
  {
    // Data.

    /// Converter from source field shape into destination field shape.
    Converter::Ptr m_converter;
    /// Byte offset of the destination field.
    size_t m_dst_offset;
    /// Byte offset of the source field.
    size_t m_src_offset;
    /// Source field name (for logging).
    std::string m_field_name;
  };

  // Constructors/destructor.

  /**
   * Constructs the copier.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  May be null.
   * @param dst_shape
   *        Destination struct shape.
   * @param src_shape
   *        Source struct shape.
   * @param field_converters
   *        Field converters in order.
   */
  explicit Struct_copier(flow::log::Logger* logger_ptr, const Shape& dst_shape, const Shape& src_shape,
                         std::vector<Field_converter>&& field_converters);

  // Methods.

  /**
   * Applies every field converter in order to the two base addresses.  The first failure stops the copy (fields
   * before it have been written) and is logged naming the field.
   *
   * @param dst
   *        Destination struct object.
   * @param src
   *        Source struct object.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        see Converter::convert().
   * @return `true` on success; `false` if and only if `*err_code` is set to truthy.
   */
  bool copy(void* dst, const void* src, Error_code* err_code = 0) const;

  /**
   * Destination shape.
   * @return See above.
   */
  const Shape& dst_shape() const;

  /**
   * Source shape.
   * @return See above.
   */
  const Shape& src_shape() const;

  /**
   * The field converters in order.
   * @return See above.
   */
  const std::vector<Field_converter>& field_converters() const;

private:
  // Data.

  /// See dst_shape().
  const Shape& m_dst_shape;

  /// See src_shape().
  const Shape& m_src_shape;

  /// See field_converters().
  const std::vector<Field_converter> m_field_converters;
}; // class Struct_copier

} // namespace keyval
