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
#include <google/protobuf/timestamp.pb.h>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/date_time/gregorian/gregorian_types.hpp>
#include <boost/multiprecision/cpp_dec_float.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/optional.hpp>
#include <boost/shared_ptr.hpp>
#include <array>
#include <ostream>
#include <string>

namespace keyval
{

// Types.

/// Time value leaf type.  Always UTC; the not-a-date-time special value plays the role of "zero time".
using Time_point = boost::posix_time::ptime;

/// Calendar date leaf type.
using Date = boost::gregorian::date;

/// Universally unique identifier leaf type.
using Uuid = boost::uuids::uuid;

/// Arbitrary-precision decimal leaf type.
using Decimal = boost::multiprecision::cpp_dec_float_50;

/// Protocol timestamp (externally-defined protocol structure); always held via #Proto_timestamp_ptr.
using Proto_timestamp = google::protobuf::Timestamp;

/// The way records hold a #Proto_timestamp: a nullable shared pointer.
using Proto_timestamp_ptr = boost::shared_ptr<Proto_timestamp>;

/**
 * A string type distinct from `std::string` (and from other `Named_string`s) but with exactly its layout; the
 * conversion engine copies between any two of these (and `std::string`) as-is.  `Tag` is any (possibly
 * incomplete) type used only to make the type unique.
 *
 * @tparam Tag
 *         Uniqueness tag.
 */
template<typename Tag>
class Named_string
{
public:
  // Constructors/destructor.

  /// Empty string.
  Named_string() = default;

  /**
   * Holds the given string.
   * @param value
   *        Value.
   */
  Named_string(std::string value);

  /**
   * Holds the given string.
   * @param value
   *        Value.
   */
  Named_string(const char* value);

  // Methods.

  /**
   * The string.
   * @return See above.
   */
  const std::string& str() const;

  /**
   * Equality.
   * @param other
   *        Other.
   * @return See above.
   */
  bool operator==(const Named_string& other) const;

  /**
   * Inequality.
   * @param other
   *        Other.
   * @return See above.
   */
  bool operator!=(const Named_string& other) const;

private:
  // Data.

  /// The string; the only member, so `*this` is pointer-interconvertible with it.
  std::string m_value;
}; // class Named_string

/**
 * A string-backed enumeration restricted to a fixed set of declared members: `Tag::members()` returns a
 * container of `std::string` listing them.  Any string can be stored (e.g., via the default ctor, which holds the
 * empty string, or by direct assignment in user code); what the set restricts is *conversion*: a copier writing
 * into a `Closed_enum` rejects a source string outside the set.  Layout is identical to `std::string`.
 *
 * @tparam Tag
 *         Provides `static ... members()`.
 */
template<typename Tag>
class Closed_enum
{
public:
  // Constructors/destructor.

  /// Empty string (not necessarily a member).
  Closed_enum() = default;

  /**
   * Holds the given string (not checked).
   * @param value
   *        Value.
   */
  Closed_enum(std::string value);

  /**
   * Holds the given string (not checked).
   * @param value
   *        Value.
   */
  Closed_enum(const char* value);

  // Methods.

  /**
   * Whether the string is a declared member.
   *
   * @param value
   *        Candidate.
   * @return See above.
   */
  static bool is_member(const std::string& value);

  /**
   * Whether the held string is a declared member.
   * @return See above.
   */
  bool valid() const;

  /**
   * The string.
   * @return See above.
   */
  const std::string& str() const;

  /**
   * Equality.
   * @param other
   *        Other.
   * @return See above.
   */
  bool operator==(const Closed_enum& other) const;

  /**
   * Inequality.
   * @param other
   *        Other.
   * @return See above.
   */
  bool operator!=(const Closed_enum& other) const;

private:
  // Data.

  /// The string; the only member, so `*this` is pointer-interconvertible with it.
  std::string m_value;
}; // class Closed_enum

/**
 * A value wrapper that must hold a value by the time it is converted: converting from a `Required` that holds
 * nothing is a conversion error (error::Code::S_REQUIRED_VALUE_MISSING), whereas one that holds a value converts
 * as if the value itself were the source.
 *
 * @tparam T
 *         Wrapped type.
 */
template<typename T>
class Required
{
public:
  // Types.

  /// Wrapped type.
  using Value_type = T;

  // Constructors/destructor.

  /// Holds nothing.
  Required() = default;

  /**
   * Holds the value.
   * @param value
   *        Value.
   */
  Required(T value);

  // Methods.

  /**
   * Whether a value is held.
   * @return See above.
   */
  bool has_value() const;

  /**
   * The held value; throws `boost::bad_optional_access` if none.
   * @return See above.
   */
  const T& value() const;

  /**
   * Replaces the held value (if any) with a default-constructed one.
   * @return Reference to it.
   */
  T& emplace();

  /// Makes `*this` hold nothing.
  void reset();

  /**
   * Equality.
   * @param other
   *        Other.
   * @return See above.
   */
  bool operator==(const Required& other) const;

private:
  // Data.

  /// The value if any.
  boost::optional<T> m_value;
}; // class Required

/**
 * Universally unique lexicographically sortable identifier: 128 bits, textually 26 characters of Crockford
 * base-32 (case-insensitive on input, upper-case on output).  The zero ULID is the default.
 */
class Ulid
{
public:
  // Types.

  /// Raw big-endian bytes.
  using Bytes = std::array<uint8_t, 16>;

  // Constants.

  /// Length of the textual form.
  static constexpr size_t S_STRING_SIZE = 26;

  // Constructors/destructor.

  /// Zero ULID.
  Ulid();

  /**
   * ULID with the given bytes.
   * @param bytes
   *        Big-endian bytes.
   */
  explicit Ulid(const Bytes& bytes);

  // Methods.

  /**
   * Parses the textual form.  Fails (returning `false`, `*target` untouched) if the length is not
   * #S_STRING_SIZE, any character is outside the Crockford alphabet, or the value would overflow 128 bits
   * (first character above `7`).
   *
   * @param str
   *        Text.
   * @param target
   *        Where to store the result on success.
   * @return Success or failure.
   */
  static bool from_string(util::String_view str, Ulid* target);

  /**
   * Textual form.
   * @return See above.
   */
  std::string to_string() const;

  /**
   * Raw bytes.
   * @return See above.
   */
  const Bytes& bytes() const;

  /**
   * Whether all bits are zero.
   * @return See above.
   */
  bool is_zero() const;

  /**
   * Equality.
   * @param other
   *        Other.
   * @return See above.
   */
  bool operator==(const Ulid& other) const;

  /**
   * Inequality.
   * @param other
   *        Other.
   * @return See above.
   */
  bool operator!=(const Ulid& other) const;

private:
  // Data.

  /// Big-endian bytes.
  Bytes m_bytes;
}; // class Ulid

/**
 * BCP 47 language tag in canonical form (e.g., `en-US`), parsed and canonicalized by ICU.  Default is the
 * undetermined language `und`.
 */
class Language_tag
{
public:
  // Constructors/destructor.

  /// The undetermined language `und`.
  Language_tag();

  // Methods.

  /**
   * Parses a tag.  Fails (returning `false`, `*target` untouched) if the string is empty or not entirely
   * well-formed.
   *
   * @param str
   *        Text.
   * @param target
   *        Where to store the result on success.
   * @return Success or failure.
   */
  static bool from_string(util::String_view str, Language_tag* target);

  /**
   * Canonical textual form.
   * @return See above.
   */
  const std::string& to_string() const;

  /**
   * Whether this is `und`.
   * @return See above.
   */
  bool is_zero() const;

  /**
   * Equality.
   * @param other
   *        Other.
   * @return See above.
   */
  bool operator==(const Language_tag& other) const;

  /**
   * Inequality.
   * @param other
   *        Other.
   * @return See above.
   */
  bool operator!=(const Language_tag& other) const;

private:
  // Constructors.

  /**
   * Holds the given canonical tag.
   * @param canonical
   *        Canonical form.
   */
  explicit Language_tag(std::string canonical);

  // Data.

  /// Canonical form.
  std::string m_tag;
}; // class Language_tag

// Free functions.

/**
 * Prints ULID textual form.
 *
 * @relatesalso Ulid
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Ulid& val);

/**
 * Prints language tag canonical form.
 *
 * @relatesalso Language_tag
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Language_tag& val);

/**
 * Formats a decimal in fixed notation with no superfluous trailing zeros (e.g., `10000`, `-0.25`, `0.00001`);
 * never uses exponent notation.
 *
 * @param val
 *        Value.
 * @return See above.
 */
std::string decimal_to_string(const Decimal& val);

/**
 * Parses a decimal (plain or exponent notation).  Non-finite values (`nan`, `inf`) are rejected.
 *
 * @param str
 *        Text.
 * @param target
 *        Where to store the result on success; untouched on failure.
 * @return Success or failure.
 */
bool decimal_from_string(const std::string& str, Decimal* target);

// Template implementations.

template<typename Tag>
Named_string<Tag>::Named_string(std::string value) :
  m_value(std::move(value))
{
  // Done.
}

template<typename Tag>
Named_string<Tag>::Named_string(const char* value) :
  m_value(value)
{
  // Done.
}

template<typename Tag>
const std::string& Named_string<Tag>::str() const
{
  return m_value;
}

template<typename Tag>
bool Named_string<Tag>::operator==(const Named_string& other) const
{
  return m_value == other.m_value;
}

template<typename Tag>
bool Named_string<Tag>::operator!=(const Named_string& other) const
{
  return !operator==(other);
}

template<typename Tag>
Closed_enum<Tag>::Closed_enum(std::string value) :
  m_value(std::move(value))
{
  // Done.
}

template<typename Tag>
Closed_enum<Tag>::Closed_enum(const char* value) :
  m_value(value)
{
  // Done.
}

template<typename Tag>
bool Closed_enum<Tag>::is_member(const std::string& value) // Static.
{
  static const auto s_members = Tag::members();
  for (const auto& member : s_members)
  {
    if (member == value)
    {
      return true;
    }
  }
  return false;
}

template<typename Tag>
bool Closed_enum<Tag>::valid() const
{
  return is_member(m_value);
}

template<typename Tag>
const std::string& Closed_enum<Tag>::str() const
{
  return m_value;
}

template<typename Tag>
bool Closed_enum<Tag>::operator==(const Closed_enum& other) const
{
  return m_value == other.m_value;
}

template<typename Tag>
bool Closed_enum<Tag>::operator!=(const Closed_enum& other) const
{
  return !operator==(other);
}

template<typename T>
Required<T>::Required(T value) :
  m_value(std::move(value))
{
  // Done.
}

template<typename T>
bool Required<T>::has_value() const
{
  return bool(m_value);
}

template<typename T>
const T& Required<T>::value() const
{
  return m_value.value();
}

template<typename T>
T& Required<T>::emplace()
{
  m_value.emplace();
  return *m_value;
}

template<typename T>
void Required<T>::reset()
{
  m_value = boost::none;
}

template<typename T>
bool Required<T>::operator==(const Required& other) const
{
  return m_value == other.m_value;
}

} // namespace keyval
