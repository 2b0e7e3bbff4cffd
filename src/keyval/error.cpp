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
#include "keyval/error.hpp"
#include <flow/util/util.hpp>
#include <cassert>

namespace keyval::error
{

// Types.

/**
 * The boost.system category for errors returned by the keyval module.  Think of it as the polymorphic
 * counterpart of Code, and it kicks in when, for example, someone prints an #Error_code with a Code inside it;
 * at that point these virtual methods supply the name and message.
 */
class Category :
  public boost::system::error_category
{
public:
  // Constants.

  /// The one Category.
  static const Category S_CATEGORY;

  // Methods.

  /**
   * Returns a `static` string representing this category's name/identity.
   *
   * @return A `static` string that's a brief description of this error category.
   */
  const char* name() const noexcept override;

  /**
   * Given the integer value of a keyval-specific error code, returns a human-readable description of it.
   *
   * @param val
   *        Value of a Code `enum` value.
   * @return See above.
   */
  std::string message(int val) const override;

  /**
   * Helper that returns the brief symbolic name of the given Code: the `enum` member name sans `S_`.
   *
   * @param code
   *        Code to look up.
   * @return See above.
   */
  static util::String_view code_symbol(Code code);

private:
  // Constructors.

  /// Boring constructor.
  explicit Category();
}; // class Category

// Static initializations.

const Category Category::S_CATEGORY;

// Implementations.

Error_code make_error_code(Code err_code)
{
  /* Assign Category as the category for keyval::error::Code-cast error_codes;
   * this basically glues together Category::name()/message() with the Code enum. */
  return Error_code(static_cast<int>(err_code), Category::S_CATEGORY);
}

Category::Category() = default;

const char* Category::name() const noexcept // Virtual.
{
  return "keyval";
}

std::string Category::message(int val) const // Virtual.
{
  // KEEP THESE STRINGS IN SYNC WITH COMMENT IN error.hpp ON THE INDIVIDUAL ENUM MEMBERS!

  switch (static_cast<Code>(val))
  {
  case Code::S_TYPE_NOT_STRUCT:
    return "Copier compilation: the destination or source shape of a struct copier is not a struct shape.";
  case Code::S_FIELD_NOT_FOUND:
    return "Copier compilation: a source field has no same-named destination field (and omission was not "
           "requested).";
  case Code::S_UNSUPPORTED_TYPE_PAIR:
    return "Copier compilation: no conversion rule applies to a (destination, source) shape pair.";
  case Code::S_COPY_TO_TARGET_UNSUPPORTED:
    return "Copier compilation: a copy-to-capable source shape refuses the requested destination shape.";
  case Code::S_CIRCULAR_TYPE_REFERENCE:
    return "Copier compilation or shape transmutation: shape refers to itself (directly or via nesting).";
  case Code::S_UNEXPORTED_FIELD_IN_TRANSMUTABLE_STRUCT:
    return "Shape transmutation: struct shape contains an unexported field; it cannot cross the "
           "reinterpretation boundary.";
  case Code::S_TRANSMUTING_MARSHALABLE_TYPE:
    return "Shape transmutation: struct shape has its own marshaling logic which restructuring would bypass.";
  case Code::S_SHAPE_NOT_TRANSMUTED:
    return "Reinterpretation: the target shape was not produced by a Shape_transmuter.";
  case Code::S_CLOSED_ENUM_BAD_VALUE:
    return "Conversion: source string is not a declared member of the destination closed enumeration.";
  case Code::S_NUMERIC_OUT_OF_RANGE:
    return "Conversion: floating-point source value is not representable in the numeric destination.";
  case Code::S_UUID_PARSE_FAILED:
    return "Conversion: source string is not a valid UUID.";
  case Code::S_ULID_PARSE_FAILED:
    return "Conversion: source string is not a valid ULID.";
  case Code::S_DECIMAL_PARSE_FAILED:
    return "Conversion: source string is not a valid decimal number.";
  case Code::S_LANGUAGE_TAG_PARSE_FAILED:
    return "Conversion: source string is not a well-formed BCP 47 language tag.";
  case Code::S_REQUIRED_VALUE_MISSING:
    return "Conversion: required-wrapper source holds no value.";
  case Code::S_MAP_KEY_MISSING:
    return "Conversion: dynamic map source lacks the key for a destination field.";
  case Code::S_MAP_VALUE_TYPE_MISMATCH:
    return "Conversion: dynamic map source holds a value whose shape cannot be assigned to the destination field.";

  case Code::S_END_SENTINEL:
    assert(false && "SENTINEL: Not an error.  "
                    "This Code must never be issued by an error/success-emitting API; I/O use only.");
  }
  assert(false);
  return "";
} // Category::message()

util::String_view Category::code_symbol(Code code) // Static.
{
  // Note: Must satisfy istream_to_enum() requirements.

  switch (code)
  {
  case Code::S_TYPE_NOT_STRUCT:
    return "TYPE_NOT_STRUCT";
  case Code::S_FIELD_NOT_FOUND:
    return "FIELD_NOT_FOUND";
  case Code::S_UNSUPPORTED_TYPE_PAIR:
    return "UNSUPPORTED_TYPE_PAIR";
  case Code::S_COPY_TO_TARGET_UNSUPPORTED:
    return "COPY_TO_TARGET_UNSUPPORTED";
  case Code::S_CIRCULAR_TYPE_REFERENCE:
    return "CIRCULAR_TYPE_REFERENCE";
  case Code::S_UNEXPORTED_FIELD_IN_TRANSMUTABLE_STRUCT:
    return "UNEXPORTED_FIELD_IN_TRANSMUTABLE_STRUCT";
  case Code::S_TRANSMUTING_MARSHALABLE_TYPE:
    return "TRANSMUTING_MARSHALABLE_TYPE";
  case Code::S_SHAPE_NOT_TRANSMUTED:
    return "SHAPE_NOT_TRANSMUTED";
  case Code::S_CLOSED_ENUM_BAD_VALUE:
    return "CLOSED_ENUM_BAD_VALUE";
  case Code::S_NUMERIC_OUT_OF_RANGE:
    return "NUMERIC_OUT_OF_RANGE";
  case Code::S_UUID_PARSE_FAILED:
    return "UUID_PARSE_FAILED";
  case Code::S_ULID_PARSE_FAILED:
    return "ULID_PARSE_FAILED";
  case Code::S_DECIMAL_PARSE_FAILED:
    return "DECIMAL_PARSE_FAILED";
  case Code::S_LANGUAGE_TAG_PARSE_FAILED:
    return "LANGUAGE_TAG_PARSE_FAILED";
  case Code::S_REQUIRED_VALUE_MISSING:
    return "REQUIRED_VALUE_MISSING";
  case Code::S_MAP_KEY_MISSING:
    return "MAP_KEY_MISSING";
  case Code::S_MAP_VALUE_TYPE_MISMATCH:
    return "MAP_VALUE_TYPE_MISMATCH";

  case Code::S_END_SENTINEL:
    return "END_SENTINEL";
  }
  assert(false);
  return "";
}

std::ostream& operator<<(std::ostream& os, Code val)
{
  // Note: Must satisfy istream_to_enum() requirements.
  return os << Category::code_symbol(val);
}

std::istream& operator>>(std::istream& is, Code& val)
{
  /* Range [<1st Code>, END_SENTINEL); no match => END_SENTINEL;
   * allow for number instead of ostream<< string; case-insensitive. */
  val = flow::util::istream_to_enum(&is, Code::S_END_SENTINEL, Code::S_END_SENTINEL, true, false,
                                    Code(S_CODE_LOWEST_INT_VALUE));
  return is;
}

} // namespace keyval::error
