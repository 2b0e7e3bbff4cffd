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

#include "keyval/common.hpp"
#include <boost/system/error_code.hpp>
#include <istream>
#include <ostream>

/**
 * Namespace containing the keyval module's extension of boost.system error conventions, so that keyval APIs
 * can return codes/messages from within its own new set of error codes.  Note that many errors keyval might
 * report are those from boost.system-compatible libraries, but the ones listed here are specific to keyval.
 *
 * There are two tiers of these.  Compilation-time errors are detected once per shape pair (or shape), when
 * something asks for a compiled copier or a transmuted shape; they are never cached, so a retry re-attempts
 * compilation.  Conversion-time errors are detected per invocation against real data; they abort the copy in
 * progress (whose destination is then partially populated) and propagate to the immediate caller.
 *
 * Since an #Error_code cannot carry dynamic context (offending value, field name), keyval logs such context
 * at WARNING level at the point of failure.
 */
namespace keyval::error
{

// Types.

/// Numeric value of the lowest Code.
constexpr int S_CODE_LOWEST_INT_VALUE = 1;

/**
 * All possible errors returned (via `Error_code` arguments) by keyval functions/methods *outside of*
 * boost.system-compatible errors from libraries we use.
 */
enum class Code
{
  /// Copier compilation: the destination or source shape of a struct copier is not a struct shape.
  S_TYPE_NOT_STRUCT = S_CODE_LOWEST_INT_VALUE,

  /// Copier compilation: a source field has no same-named destination field (and omission was not requested).
  S_FIELD_NOT_FOUND,

  /// Copier compilation: no conversion rule applies to a (destination, source) shape pair.
  S_UNSUPPORTED_TYPE_PAIR,

  /// Copier compilation: a copy-to-capable source shape refuses the requested destination shape.
  S_COPY_TO_TARGET_UNSUPPORTED,

  /// Copier compilation or shape transmutation: shape refers to itself (directly or via nesting).
  S_CIRCULAR_TYPE_REFERENCE,

  /// Shape transmutation: struct shape contains an unexported field; it cannot cross the reinterpretation boundary.
  S_UNEXPORTED_FIELD_IN_TRANSMUTABLE_STRUCT,

  /// Shape transmutation: struct shape has its own marshaling logic which restructuring would bypass.
  S_TRANSMUTING_MARSHALABLE_TYPE,

  /// Reinterpretation: the target shape was not produced by a Shape_transmuter.
  S_SHAPE_NOT_TRANSMUTED,

  /// Conversion: source string is not a declared member of the destination closed enumeration.
  S_CLOSED_ENUM_BAD_VALUE,

  /// Conversion: floating-point source value is not representable in the numeric destination.
  S_NUMERIC_OUT_OF_RANGE,

  /// Conversion: source string is not a valid UUID.
  S_UUID_PARSE_FAILED,

  /// Conversion: source string is not a valid ULID.
  S_ULID_PARSE_FAILED,

  /// Conversion: source string is not a valid decimal number.
  S_DECIMAL_PARSE_FAILED,

  /// Conversion: source string is not a well-formed BCP 47 language tag.
  S_LANGUAGE_TAG_PARSE_FAILED,

  /// Conversion: required-wrapper source holds no value.
  S_REQUIRED_VALUE_MISSING,

  /// Conversion: dynamic map source lacks the key for a destination field.
  S_MAP_KEY_MISSING,

  /// Conversion: dynamic map source holds a value whose shape cannot be assigned to the destination field.
  S_MAP_VALUE_TYPE_MISMATCH,

  /// SENTINEL: Not an error.  This Code must never be issued by an error/success-emitting API; I/O use only.
  S_END_SENTINEL
}; // enum class Code

// Free functions.

/**
 * Given a `Code` `enum` value, creates a lightweight #Error_code (boost.system `error_code`)
 * representing that error.  This is needed to make the `boost::system::error_code::error_code<Code>()` template
 * implementation work.  Or, slightly more in English, it glues the (completely general) #Error_code
 * to the (keyval-specific) error code set Code, so that one can implicitly covert from the latter to the former.
 *
 * @param err_code
 *        The `enum` value.
 * @return A corresponding #Error_code.
 */
Error_code make_error_code(Code err_code);

/**
 * Deserializes a Code from a standard input stream.  Reads up to but not including the next
 * non-alphanumeric-or-underscore character; the resulting string is then mapped to a Code.  If none is
 * recognized, Code::S_END_SENTINEL is the result.  The recognized values are:
 *   - `"<code_symbol>"` as printed by `operator<<()` (case-insensitive), e.g. `"REQUIRED_VALUE_MISSING"`;
 *   - the decimal integer equal to `int(<code>)`.
 *
 * @param is
 *        Stream from which to deserialize.
 * @param val
 *        Value to set.
 * @return `is`.
 */
std::istream& operator>>(std::istream& is, Code& val);
// @todo - `@relatesalso Code` makes Doxygen complain; maybe it doesn't work with `enum class`es like Code.

/**
 * Serializes a Code to a standard output stream, as the code's symbol sans `S_` prefix.
 *
 * @param os
 *        Stream to which to serialize.
 * @param val
 *        Value to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Code val);
// @todo - `@relatesalso Code` makes Doxygen complain; maybe it doesn't work with `enum class`es like Code.

} // namespace keyval::error

namespace boost::system
{

// Types.

/**
 * Ummm -- it specializes this `struct` to -- look -- the end result is boost.system uses this as
 * authorization to make `enum` `Code` convertible to `Error_code`.  The non-specialized
 * version of this sets `value` to `false`, so that random arbitary `enum`s can't just be used as
 * `Error_code`s.  Note that this is the offical way to accomplish that, as (confusingly but
 * formally) documented in boost.system docs.
 */
template<>
struct is_error_code_enum<::keyval::error::Code>
{
  /// Means `Code` `enum` values can be used for `Error_code`.
  static const bool value = true;
};

} // namespace boost::system
