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
#include "keyval/domain.hpp"
#include <unicode/locid.h>
#include <unicode/stringpiece.h>
#include <algorithm>
#include <ios>
#include <limits>
#include <stdexcept>

namespace keyval
{

namespace
{

// Constants.

/// Crockford base-32 alphabet (no I, L, O, U).
constexpr char S_ULID_ALPHABET[] = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

/// Bits per textual ULID character.
constexpr unsigned int S_ULID_CHAR_BITS = 5;

// Free functions.

/**
 * Value of a Crockford base-32 character, case-insensitive; -1 if not in the alphabet.
 *
 * @param ch
 *        Character.
 * @return See above.
 */
int ulid_char_value(char ch)
{
  if ((ch >= 'a') && (ch <= 'z'))
  {
    ch = char(ch - 'a' + 'A');
  }
  for (int idx = 0; idx != 32; ++idx)
  {
    if (S_ULID_ALPHABET[idx] == ch)
    {
      return idx;
    }
  }
  return -1;
}

} // namespace (anon)

// Ulid implementations.

Ulid::Ulid()
{
  m_bytes.fill(0);
}

Ulid::Ulid(const Bytes& bytes) :
  m_bytes(bytes)
{
  // Done.
}

bool Ulid::from_string(util::String_view str, Ulid* target) // Static.
{
  if (str.size() != S_STRING_SIZE)
  {
    return false;
  }
  // 26 * 5 = 130 bits: the leading character carries only 3 significant bits.
  if (ulid_char_value(str[0]) > 7)
  {
    return false;
  }

  uint64_t hi = 0;
  uint64_t lo = 0;
  for (const char ch : str)
  {
    const int val = ulid_char_value(ch);
    if (val < 0)
    {
      return false;
    }
    hi = (hi << S_ULID_CHAR_BITS) | (lo >> (64 - S_ULID_CHAR_BITS));
    lo = (lo << S_ULID_CHAR_BITS) | uint64_t(val);
  }

  Bytes bytes;
  for (size_t idx = 0; idx != 8; ++idx)
  {
    bytes[idx] = uint8_t(hi >> (8 * (7 - idx)));
    bytes[8 + idx] = uint8_t(lo >> (8 * (7 - idx)));
  }
  *target = Ulid(bytes);
  return true;
} // Ulid::from_string()

std::string Ulid::to_string() const
{
  uint64_t hi = 0;
  uint64_t lo = 0;
  for (size_t idx = 0; idx != 8; ++idx)
  {
    hi = (hi << 8) | m_bytes[idx];
    lo = (lo << 8) | m_bytes[8 + idx];
  }

  std::string str(S_STRING_SIZE, '0');
  for (size_t idx = 0; idx != S_STRING_SIZE; ++idx)
  {
    const unsigned int bit_pos = S_ULID_CHAR_BITS * unsigned(S_STRING_SIZE - 1 - idx); // Of the low bit.
    uint64_t val;
    if (bit_pos >= 64)
    {
      val = hi >> (bit_pos - 64);
    }
    else if (bit_pos + S_ULID_CHAR_BITS <= 64)
    {
      val = lo >> bit_pos;
    }
    else // Straddles the two halves.
    {
      val = (lo >> bit_pos) | (hi << (64 - bit_pos));
    }
    str[idx] = S_ULID_ALPHABET[val & 0x1f];
  }
  return str;
} // Ulid::to_string()

const Ulid::Bytes& Ulid::bytes() const
{
  return m_bytes;
}

bool Ulid::is_zero() const
{
  return *this == Ulid();
}

bool Ulid::operator==(const Ulid& other) const
{
  return m_bytes == other.m_bytes;
}

bool Ulid::operator!=(const Ulid& other) const
{
  return !operator==(other);
}

std::ostream& operator<<(std::ostream& os, const Ulid& val)
{
  return os << val.to_string();
}

// Language_tag implementations.

Language_tag::Language_tag() :
  m_tag("und")
{
  // Done.
}

Language_tag::Language_tag(std::string canonical) :
  m_tag(std::move(canonical))
{
  // Done.
}

bool Language_tag::from_string(util::String_view str, Language_tag* target) // Static.
{
  if (str.empty())
  {
    return false;
  }

  // forLanguageTag() fails unless the *entire* input is well-formed.
  UErrorCode status = U_ZERO_ERROR;
  const auto locale = icu::Locale::forLanguageTag(icu::StringPiece(str.data(), int32_t(str.size())), status);
  if (U_FAILURE(status) || locale.isBogus())
  {
    return false;
  }

  auto canonical = locale.toLanguageTag<std::string>(status);
  if (U_FAILURE(status) || canonical.empty())
  {
    return false;
  }
  *target = Language_tag(std::move(canonical));
  return true;
}

const std::string& Language_tag::to_string() const
{
  return m_tag;
}

bool Language_tag::is_zero() const
{
  return *this == Language_tag();
}

bool Language_tag::operator==(const Language_tag& other) const
{
  return m_tag == other.m_tag;
}

bool Language_tag::operator!=(const Language_tag& other) const
{
  return !operator==(other);
}

std::ostream& operator<<(std::ostream& os, const Language_tag& val)
{
  return os << val.to_string();
}

// Decimal implementations.

std::string decimal_to_string(const Decimal& val)
{
  // Fixed notation keeping every significant digit the type holds: digits after the point = precision - order.
  const std::streamsize precision = std::numeric_limits<Decimal>::digits10;
  const std::streamsize frac_digits = std::max<std::streamsize>(precision - val.backend().order() - 1, 1);
  auto str = val.str(frac_digits, std::ios_base::fixed);

  if (str.find('.') != std::string::npos)
  {
    str.erase(str.find_last_not_of('0') + 1);
    if (str.back() == '.')
    {
      str.pop_back();
    }
  }
  if (str == "-0")
  {
    str = "0";
  }
  return str;
}

bool decimal_from_string(const std::string& str, Decimal* target)
{
  Decimal parsed;
  try
  {
    parsed = Decimal(str.c_str());
  }
  catch (const std::runtime_error&)
  {
    return false;
  }

  if (!(boost::multiprecision::isfinite)(parsed))
  {
    return false; // "nan", "inf" and friends are not decimals.
  }
  // else
  *target = std::move(parsed);
  return true;
}

} // namespace keyval
