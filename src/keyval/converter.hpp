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
#include "keyval/error.hpp"
#include <flow/log/log.hpp>
#include <boost/shared_ptr.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace keyval
{

// Types.

class Struct_copier;

/**
 * A compiled conversion from values of one Shape (the source) into values of another (the destination), as
 * chosen once by Conversion_resolver: an operation tag (Op) plus the operands fixed at compile time (nested
 * converters, domain pair, nested struct copier, map key table).  convert() dispatches on the tag; it never
 * re-inspects shapes beyond what the operands already record.
 *
 * A Converter is immutable once built; convert() may be invoked concurrently from any number of threads.
 *
 * ### Failure ###
 * convert() fails only for data-dependent reasons (see error::Code conversion-time codes); it logs the offending
 * value at WARNING level.  A failed conversion may have partially written the destination.
 */
class Converter :
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to immutable `*this`; the way converters are shared and nested.
  using Ptr = boost::shared_ptr<const Converter>;

  /// The operation; one or more per conversion rule.
  enum class Op
  {
    /// Identical trivially-copyable shapes: memcopy() of size bytes.
    S_RAW_COPY,
    /// Identical shapes otherwise: copy-assignment.
    S_COPY_ASSIGN,
    /// String into closed enumeration: validate membership, then copy.
    S_CLOSED_ENUM,
    /// Distinct shapes of the same scalar representation (named strings, enumerations and their underlying type).
    S_ALIAS_COPY,
    /// Between numeric kinds: value conversion (widening, narrowing, integer/floating point).
    S_NUMERIC_CONVERT,
    /// String kind into byte vector.
    S_STRING_TO_BYTES,
    /// Byte vector into string kind.
    S_BYTES_TO_STRING,
    /// Domain_pair-specific parse/format.
    S_DOMAIN,
    /// Copy-to capability of the source.
    S_COPY_TO,
    /// Pointers with identical pointees: share the pointee.
    S_POINTER_SHARE,
    /// Pointers with different pointees: allocate and convert.
    S_POINTER_DEEP,
    /// Slices: element-wise.
    S_SLICE,
    /// Optional into pointer.
    S_OPTIONAL_TO_POINTER,
    /// Pointer into optional.
    S_POINTER_TO_OPTIONAL,
    /// Non-pointer value into optional.
    S_VALUE_TO_OPTIONAL,
    /// Required: unwrap, then convert.
    S_REQUIRED_UNWRAP,
    /// Non-pointer value into pointer: allocate, then convert.
    S_BOX_INTO_POINTER,
    /// Pointer into non-pointer value: dereference (if not null), then convert.
    S_DEREF_POINTER,
    /// Structs: nested struct copier.
    S_STRUCT,
    /// Struct into dynamic map.
    S_STRUCT_TO_MAP,
    /// Dynamic map into struct.
    S_MAP_TO_STRUCT
  }; // enum class Op

  /// Domain-specific (destination, source) pairs handled by Op::S_DOMAIN.
  enum class Domain_pair
  {
    /// Time value into protocol timestamp pointer.
    S_TIME_TO_TIMESTAMP,
    /// Time value pointer into protocol timestamp pointer.
    S_TIME_PTR_TO_TIMESTAMP,
    /// Protocol timestamp pointer into time value (invalid timestamps are skipped).
    S_TIMESTAMP_TO_TIME,
    /// Protocol timestamp pointer into time value pointer (invalid timestamps are skipped).
    S_TIMESTAMP_TO_TIME_PTR,
    /// Optional time value into protocol timestamp pointer.
    S_OPTIONAL_TIME_TO_TIMESTAMP,
    /// Protocol timestamp pointer into optional time value (invalid timestamps are skipped).
    S_TIMESTAMP_TO_OPTIONAL_TIME,
    /// Protocol timestamp pointer into date (invalid timestamps are skipped).
    S_TIMESTAMP_TO_DATE,
    /// Date into protocol timestamp pointer at UTC midnight.
    S_DATE_TO_TIMESTAMP,
    /// UUID into string.
    S_UUID_TO_STRING,
    /// String into UUID.
    S_STRING_TO_UUID,
    /// ULID into string.
    S_ULID_TO_STRING,
    /// String into ULID.
    S_STRING_TO_ULID,
    /// Decimal into string.
    S_DECIMAL_TO_STRING,
    /// String into decimal (empty string yields the zero decimal).
    S_STRING_TO_DECIMAL,
    /// Language tag into string.
    S_LANGUAGE_TAG_TO_STRING,
    /// String into language tag.
    S_STRING_TO_LANGUAGE_TAG
  }; // enum class Domain_pair

  /// A struct field paired with its dynamic-map key (Op::S_STRUCT_TO_MAP, Op::S_MAP_TO_STRUCT).
  struct Map_key
  {
    // Data.

    /// Key in the map.
    std::string m_key;

    /// The field; belongs to the struct shape of the conversion.
    const Field* m_field;
  };

  /// Compile-time operands; which ones are meaningful depends on Op.
  struct Operands
  {
    // Data.

    /// Element/pointee/wrapped-value converter.
    Ptr m_elem;
    /// Op::S_DOMAIN only.
    Domain_pair m_domain = Domain_pair::S_TIME_TO_TIMESTAMP;
    /// Op::S_STRUCT only.
    boost::shared_ptr<const Struct_copier> m_struct_copier;
    /// Op::S_STRUCT_TO_MAP, Op::S_MAP_TO_STRUCT only.
    std::vector<Map_key> m_map_keys;
  };

  // Constructors/destructor.

  /**
   * Constructs the converter.  Normally only Conversion_resolver does this.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  May be null.
   * @param op
   *        Operation.
   * @param dst_shape
   *        Destination shape.
   * @param src_shape
   *        Source shape.
   * @param operands
   *        Operands required by `op`.
   */
  explicit Converter(flow::log::Logger* logger_ptr, Op op, const Shape& dst_shape, const Shape& src_shape,
                     Operands&& operands = Operands());

  // Methods.

  /**
   * Converts the value at `src` (of src_shape()) into the live object at `dst` (of dst_shape()).
   *
   * @param dst
   *        Destination object.
   * @param src
   *        Source object.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        the conversion-time codes (see error::Code); and any error emitted by a nested struct copier.
   * @return `true` on success; `false` if and only if `*err_code` is set to truthy.
   */
  bool convert(void* dst, const void* src, Error_code* err_code = 0) const;

  /**
   * Operation.
   * @return See above.
   */
  Op op() const;

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

private:
  // Methods.

  /**
   * Op::S_DOMAIN implementation.
   *
   * @param dst
   *        See convert().
   * @param src
   *        See convert().
   * @param err_code
   *        See convert(); not null.
   * @return See convert().
   */
  bool convert_domain(void* dst, const void* src, Error_code* err_code) const;

  /**
   * Op::S_SLICE implementation.
   *
   * @param dst
   *        See convert().
   * @param src
   *        See convert().
   * @param err_code
   *        See convert(); not null.
   * @return See convert().
   */
  bool convert_slice(void* dst, const void* src, Error_code* err_code) const;

  /**
   * Op::S_NUMERIC_CONVERT implementation.  A floating-point source outside the destination's range fails with
   * error::Code::S_NUMERIC_OUT_OF_RANGE and leaves `*dst` untouched.
   *
   * @param dst
   *        See convert().
   * @param src
   *        See convert().
   * @param err_code
   *        See convert(); not null.
   * @return See convert().
   */
  bool convert_numeric(void* dst, const void* src, Error_code* err_code) const;

  /**
   * Op::S_STRUCT_TO_MAP implementation.
   *
   * @param dst
   *        See convert().
   * @param src
   *        See convert().
   */
  void struct_to_map(void* dst, const void* src) const;

  /**
   * Op::S_MAP_TO_STRUCT implementation.
   *
   * @param dst
   *        See convert().
   * @param src
   *        See convert().
   * @param err_code
   *        See convert(); not null.
   * @return See convert().
   */
  bool map_to_struct(void* dst, const void* src, Error_code* err_code) const;

  // Data.

  /// See op().
  const Op m_op;

  /// See dst_shape().
  const Shape& m_dst_shape;

  /// See src_shape().
  const Shape& m_src_shape;

  /// See Operands.
  const Operands m_operands;
}; // class Converter

// Free functions.

/**
 * Prints the symbolic name of the operation sans `S_`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Converter::Op val);

/**
 * Prints the symbolic name of the domain pair sans `S_`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Converter::Domain_pair val);

} // namespace keyval
