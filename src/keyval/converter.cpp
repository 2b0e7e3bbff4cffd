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
#include "keyval/converter.hpp"
#include "keyval/struct_copier.hpp"
#include "keyval/memcopy.hpp"
#include "keyval/time_util.hpp"
#include "keyval/value.hpp"
#include <flow/error/error.hpp>
#include <boost/uuid/string_generator.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <boost/make_shared.hpp>
#include <cassert>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace keyval
{

namespace
{

// Free functions.

/**
 * The string of a string-kind object (all are layout-identical to `std::string`).
 *
 * @param addr
 *        Object.
 * @return See above.
 */
const std::string& string_at(const void* addr)
{
  return *static_cast<const std::string*>(addr);
}

/**
 * See string_at().
 *
 * @param addr
 *        Object.
 * @return See above.
 */
std::string& string_at(void* addr)
{
  return *static_cast<std::string*>(addr);
}

/**
 * Whether a floating-point value converts into `To` without leaving the range of `To`; a C++ conversion
 * outside that range is undefined.  NaN fits floating-point targets only.
 *
 * @tparam To
 *         Target arithmetic type.
 * @param val
 *        Value.
 * @return See above.
 */
template<typename To>
bool float_fits(double val)
{
  if (std::is_integral<To>::value)
  {
    // lowest() is 0 or a negative power of 2, and max() + 1 is a power of 2: all exact as `double`.
    const double lowest = static_cast<double>(std::numeric_limits<To>::lowest());
    const double bound = std::ldexp(1.0, std::numeric_limits<To>::digits);
    return (std::trunc(val) >= lowest) && (val < bound);
  }
  // else
  return (!std::isfinite(val)) || (std::fabs(val) <= static_cast<double>(std::numeric_limits<To>::max()));
}

/**
 * Reads a floating-point value into `*dst` of type `To`, unless it does not fit (see float_fits()).
 *
 * @tparam To
 *         Target arithmetic type.
 * @param val
 *        Value.
 * @param dst
 *        Target; untouched on failure.
 * @return `false` if and only if `val` does not fit.
 */
template<typename To>
bool read_float_as(double val, To* dst)
{
  if (!float_fits<To>(val))
  {
    return false;
  }
  *dst = static_cast<To>(val);
  return true;
}

/**
 * Reads a numeric-kind object into `*dst` of type `To`.  Integer sources follow C++ conversion semantics
 * (narrowing wraps); floating-point sources must fit (see float_fits()).
 *
 * @tparam To
 *         Target arithmetic type.
 * @param kind
 *        Numeric kind of the object.
 * @param src
 *        Object.
 * @param dst
 *        Target; untouched on failure.
 * @return `false` if and only if a floating-point source does not fit into `To`.
 */
template<typename To>
bool read_numeric_as(Kind kind, const void* src, To* dst)
{
  switch (kind)
  {
  case Kind::S_INT8:
    *dst = static_cast<To>(*static_cast<const int8_t*>(src));
    return true;
  case Kind::S_INT16:
    *dst = static_cast<To>(*static_cast<const int16_t*>(src));
    return true;
  case Kind::S_INT32:
    *dst = static_cast<To>(*static_cast<const int32_t*>(src));
    return true;
  case Kind::S_INT64:
    *dst = static_cast<To>(*static_cast<const int64_t*>(src));
    return true;
  case Kind::S_UINT8:
    *dst = static_cast<To>(*static_cast<const uint8_t*>(src));
    return true;
  case Kind::S_UINT16:
    *dst = static_cast<To>(*static_cast<const uint16_t*>(src));
    return true;
  case Kind::S_UINT32:
    *dst = static_cast<To>(*static_cast<const uint32_t*>(src));
    return true;
  case Kind::S_UINT64:
    *dst = static_cast<To>(*static_cast<const uint64_t*>(src));
    return true;
  case Kind::S_FLOAT32:
    return read_float_as<To>(*static_cast<const float*>(src), dst);
  case Kind::S_FLOAT64:
    return read_float_as<To>(*static_cast<const double*>(src), dst);
  default:
    break;
  }
  assert(false && "Resolver admitted a non-numeric kind into numeric conversion.");
  return false;
}

/**
 * Writes `*dst` of type `To` from a numeric-kind object.
 *
 * @tparam To
 *         Target arithmetic type.
 * @param dst
 *        Target.
 * @param src_kind
 *        Numeric kind of `*src`.
 * @param src
 *        Object.
 * @return See read_numeric_as().
 */
template<typename To>
bool write_numeric(void* dst, Kind src_kind, const void* src)
{
  return read_numeric_as<To>(src_kind, src, static_cast<To*>(dst));
}

} // namespace (anon)

// Implementations.

Converter::Converter(flow::log::Logger* logger_ptr, Op op, const Shape& dst_shape, const Shape& src_shape,
                     Operands&& operands) :
  flow::log::Log_context(logger_ptr, Log_component::S_COPIER),
  m_op(op),
  m_dst_shape(dst_shape),
  m_src_shape(src_shape),
  m_operands(std::move(operands))
{
  // Done.
}

bool Converter::convert(void* dst, const void* src, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, convert, dst, src, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  switch (m_op)
  {
  case Op::S_RAW_COPY:
    memcopy(dst, src, m_dst_shape.size());
    break;

  case Op::S_COPY_ASSIGN:
    m_dst_shape.copy_assign(dst, src);
    break;

  case Op::S_CLOSED_ENUM:
  {
    const auto& str = string_at(src);
    if (!m_dst_shape.is_closed_enum_member(str))
    {
      FLOW_LOG_WARNING("Value [" << str << "] is not a member of closed enumeration [" << m_dst_shape << "].");
      *err_code = error::Code::S_CLOSED_ENUM_BAD_VALUE;
      return false;
    }
    string_at(dst) = str;
    break;
  }

  case Op::S_ALIAS_COPY:
    if (m_dst_shape.kind() == Kind::S_STRING)
    {
      string_at(dst) = string_at(src);
    }
    else
    {
      memcopy(dst, src, m_dst_shape.size());
    }
    break;

  case Op::S_NUMERIC_CONVERT:
    return convert_numeric(dst, src, err_code);

  case Op::S_STRING_TO_BYTES:
  {
    const auto& str = string_at(src);
    static_cast<std::vector<uint8_t>*>(dst)->assign(str.begin(), str.end());
    break;
  }

  case Op::S_BYTES_TO_STRING:
  {
    const auto& bytes = *static_cast<const std::vector<uint8_t>*>(src);
    string_at(dst).assign(bytes.begin(), bytes.end());
    break;
  }

  case Op::S_DOMAIN:
    return convert_domain(dst, src, err_code);

  case Op::S_COPY_TO:
    m_src_shape.copy_to(src, m_dst_shape, dst);
    break;

  case Op::S_POINTER_SHARE:
    m_dst_shape.share_pointer(dst, src);
    break;

  case Op::S_POINTER_DEEP:
    if (const auto src_pointee = m_src_shape.pointee(src))
    {
      if (!m_operands.m_elem->convert(m_dst_shape.reset_pointee(dst), src_pointee, err_code))
      {
        return false;
      }
    }
    break;

  case Op::S_SLICE:
    return convert_slice(dst, src, err_code);

  case Op::S_OPTIONAL_TO_POINTER:
    if (m_src_shape.wrapper_has_value(src))
    {
      if (!m_operands.m_elem->convert(m_dst_shape.reset_pointee(dst), m_src_shape.wrapped_value(src), err_code))
      {
        return false;
      }
    }
    break;

  case Op::S_POINTER_TO_OPTIONAL:
    if (const auto src_pointee = m_src_shape.pointee(src))
    {
      if (!m_operands.m_elem->convert(m_dst_shape.emplace_wrapped(dst), src_pointee, err_code))
      {
        return false;
      }
    }
    break;

  case Op::S_VALUE_TO_OPTIONAL:
    if (!m_src_shape.is_zero(src))
    {
      if (!m_operands.m_elem->convert(m_dst_shape.emplace_wrapped(dst), src, err_code))
      {
        return false;
      }
    }
    break;

  case Op::S_REQUIRED_UNWRAP:
    if (!m_src_shape.wrapper_has_value(src))
    {
      FLOW_LOG_WARNING("Required value of shape [" << m_src_shape << "] has no value; cannot convert it into "
                       "[" << m_dst_shape << "].");
      *err_code = error::Code::S_REQUIRED_VALUE_MISSING;
      return false;
    }
    return m_operands.m_elem->convert(dst, m_src_shape.wrapped_value(src), err_code);

  case Op::S_BOX_INTO_POINTER:
    return m_operands.m_elem->convert(m_dst_shape.reset_pointee(dst), src, err_code);

  case Op::S_DEREF_POINTER:
    // Null source: destination keeps its value (normally the zero value).
    if (const auto src_pointee = m_src_shape.pointee(src))
    {
      return m_operands.m_elem->convert(dst, src_pointee, err_code);
    }
    break;

  case Op::S_STRUCT:
    return m_operands.m_struct_copier->copy(dst, src, err_code);

  case Op::S_STRUCT_TO_MAP:
    struct_to_map(dst, src);
    break;

  case Op::S_MAP_TO_STRUCT:
    return map_to_struct(dst, src, err_code);
  } // switch (m_op)

  err_code->clear();
  return true;
} // Converter::convert()

bool Converter::convert_domain(void* dst, const void* src, Error_code* err_code) const
{
  using time_util::timestamp_is_valid;
  using time_util::timestamp_to_time;

  switch (m_operands.m_domain)
  {
  case Domain_pair::S_TIME_TO_TIMESTAMP:
    *static_cast<Proto_timestamp_ptr*>(dst) = time_util::time_to_timestamp(*static_cast<const Time_point*>(src));
    break;

  case Domain_pair::S_TIME_PTR_TO_TIMESTAMP:
    if (const auto& time = *static_cast<const boost::shared_ptr<Time_point>*>(src))
    {
      *static_cast<Proto_timestamp_ptr*>(dst) = time_util::time_to_timestamp(*time);
    }
    break;

  case Domain_pair::S_TIMESTAMP_TO_TIME:
  {
    const auto& timestamp = *static_cast<const Proto_timestamp_ptr*>(src);
    if (timestamp_is_valid(timestamp.get()))
    {
      *static_cast<Time_point*>(dst) = timestamp_to_time(*timestamp);
    }
    break;
  }

  case Domain_pair::S_TIMESTAMP_TO_TIME_PTR:
  {
    const auto& timestamp = *static_cast<const Proto_timestamp_ptr*>(src);
    if (timestamp_is_valid(timestamp.get()))
    {
      *static_cast<boost::shared_ptr<Time_point>*>(dst) = boost::make_shared<Time_point>(timestamp_to_time(*timestamp));
    }
    break;
  }

  case Domain_pair::S_OPTIONAL_TIME_TO_TIMESTAMP:
    if (const auto& time = *static_cast<const boost::optional<Time_point>*>(src))
    {
      *static_cast<Proto_timestamp_ptr*>(dst) = time_util::time_to_timestamp(*time);
    }
    break;

  case Domain_pair::S_TIMESTAMP_TO_OPTIONAL_TIME:
  {
    const auto& timestamp = *static_cast<const Proto_timestamp_ptr*>(src);
    if (timestamp_is_valid(timestamp.get()))
    {
      *static_cast<boost::optional<Time_point>*>(dst) = timestamp_to_time(*timestamp);
    }
    break;
  }

  case Domain_pair::S_TIMESTAMP_TO_DATE:
  {
    const auto& timestamp = *static_cast<const Proto_timestamp_ptr*>(src);
    if (timestamp_is_valid(timestamp.get()))
    {
      *static_cast<Date*>(dst) = time_util::timestamp_to_date(*timestamp);
    }
    break;
  }

  case Domain_pair::S_DATE_TO_TIMESTAMP:
    *static_cast<Proto_timestamp_ptr*>(dst) = time_util::date_to_timestamp(*static_cast<const Date*>(src));
    break;

  case Domain_pair::S_UUID_TO_STRING:
    string_at(dst) = boost::uuids::to_string(*static_cast<const Uuid*>(src));
    break;

  case Domain_pair::S_STRING_TO_UUID:
  {
    const auto& str = string_at(src);
    try
    {
      *static_cast<Uuid*>(dst) = boost::uuids::string_generator()(str);
    }
    catch (const std::runtime_error& exc)
    {
      FLOW_LOG_WARNING("Value [" << str << "] is not a valid UUID ([" << exc.what() << "]).");
      *err_code = error::Code::S_UUID_PARSE_FAILED;
      return false;
    }
    break;
  }

  case Domain_pair::S_ULID_TO_STRING:
    string_at(dst) = static_cast<const Ulid*>(src)->to_string();
    break;

  case Domain_pair::S_STRING_TO_ULID:
  {
    const auto& str = string_at(src);
    if (!Ulid::from_string(str, static_cast<Ulid*>(dst)))
    {
      FLOW_LOG_WARNING("Value [" << str << "] is not a valid ULID.");
      *err_code = error::Code::S_ULID_PARSE_FAILED;
      return false;
    }
    break;
  }

  case Domain_pair::S_DECIMAL_TO_STRING:
    string_at(dst) = decimal_to_string(*static_cast<const Decimal*>(src));
    break;

  case Domain_pair::S_STRING_TO_DECIMAL:
  {
    const auto& str = string_at(src);
    if (str.empty())
    {
      *static_cast<Decimal*>(dst) = Decimal();
    }
    else if (!decimal_from_string(str, static_cast<Decimal*>(dst)))
    {
      FLOW_LOG_WARNING("Value [" << str << "] is not a valid decimal number.");
      *err_code = error::Code::S_DECIMAL_PARSE_FAILED;
      return false;
    }
    break;
  }

  case Domain_pair::S_LANGUAGE_TAG_TO_STRING:
    string_at(dst) = static_cast<const Language_tag*>(src)->to_string();
    break;

  case Domain_pair::S_STRING_TO_LANGUAGE_TAG:
  {
    const auto& str = string_at(src);
    if (!Language_tag::from_string(str, static_cast<Language_tag*>(dst)))
    {
      FLOW_LOG_WARNING("Value [" << str << "] is not a well-formed language tag.");
      *err_code = error::Code::S_LANGUAGE_TAG_PARSE_FAILED;
      return false;
    }
    break;
  }
  } // switch (m_operands.m_domain)

  err_code->clear();
  return true;
} // Converter::convert_domain()

bool Converter::convert_slice(void* dst, const void* src, Error_code* err_code) const
{
  const size_t n = m_src_shape.slice_size(src);

  // A fresh slice of the source's length (an empty source empties the destination); elements the converter
  // does not write must be zero, not left over.
  m_dst_shape.slice_resize(dst, 0);
  m_dst_shape.slice_resize(dst, n);

  const size_t dst_elem_size = m_dst_shape.elem().size();
  const size_t src_elem_size = m_src_shape.elem().size();
  auto dst_elem = static_cast<uint8_t*>(m_dst_shape.slice_data(dst));
  auto src_elem = static_cast<const uint8_t*>(m_src_shape.slice_data(src));
  for (size_t idx = 0; idx != n; ++idx)
  {
    if (!m_operands.m_elem->convert(dst_elem, src_elem, err_code))
    {
      FLOW_LOG_WARNING("Slice [" << m_dst_shape << "] <- [" << m_src_shape << "]: element [" << idx << "] of "
                       "[" << n << "] failed to convert.");
      return false;
    }
    dst_elem += dst_elem_size;
    src_elem += src_elem_size;
  }

  err_code->clear();
  return true;
}

bool Converter::convert_numeric(void* dst, const void* src, Error_code* err_code) const
{
  const auto src_kind = m_src_shape.kind();
  bool ok = false;
  switch (m_dst_shape.kind())
  {
  case Kind::S_INT8:
    ok = write_numeric<int8_t>(dst, src_kind, src);
    break;
  case Kind::S_INT16:
    ok = write_numeric<int16_t>(dst, src_kind, src);
    break;
  case Kind::S_INT32:
    ok = write_numeric<int32_t>(dst, src_kind, src);
    break;
  case Kind::S_INT64:
    ok = write_numeric<int64_t>(dst, src_kind, src);
    break;
  case Kind::S_UINT8:
    ok = write_numeric<uint8_t>(dst, src_kind, src);
    break;
  case Kind::S_UINT16:
    ok = write_numeric<uint16_t>(dst, src_kind, src);
    break;
  case Kind::S_UINT32:
    ok = write_numeric<uint32_t>(dst, src_kind, src);
    break;
  case Kind::S_UINT64:
    ok = write_numeric<uint64_t>(dst, src_kind, src);
    break;
  case Kind::S_FLOAT32:
    ok = write_numeric<float>(dst, src_kind, src);
    break;
  case Kind::S_FLOAT64:
    ok = write_numeric<double>(dst, src_kind, src);
    break;
  default:
    assert(false && "Resolver admitted a non-numeric kind into numeric conversion.");
  }

  if (!ok)
  {
    double val = 0;
    read_numeric_as<double>(src_kind, src, &val);
    FLOW_LOG_WARNING("Value [" << val << "] of shape [" << m_src_shape << "] is outside the range of "
                     "[" << m_dst_shape << "]; not converting.");
    *err_code = error::Code::S_NUMERIC_OUT_OF_RANGE;
    return false;
  }
  // else

  err_code->clear();
  return true;
}

void Converter::struct_to_map(void* dst, const void* src) const
{
  auto& map = *static_cast<Dyn_map*>(dst);
  const auto src_base = static_cast<const uint8_t*>(src);
  for (const auto& map_key : m_operands.m_map_keys)
  {
    const auto& field_shape = map_key.m_field->shape();
    auto value = Value::make(field_shape);
    field_shape.copy_assign(value.data(), src_base + map_key.m_field->offset());
    map[map_key.m_key] = std::move(value);
  }
}

bool Converter::map_to_struct(void* dst, const void* src, Error_code* err_code) const
{
  const auto& map = *static_cast<const Dyn_map*>(src);
  const auto dst_base = static_cast<uint8_t*>(dst);
  for (const auto& map_key : m_operands.m_map_keys)
  {
    const auto& field_shape = map_key.m_field->shape();
    const auto it = map.find(map_key.m_key);
    if (it == map.end())
    {
      FLOW_LOG_WARNING("Map -> [" << m_dst_shape << "]: key [" << map_key.m_key << "] for field "
                       "[" << map_key.m_field->name() << "] is missing.");
      *err_code = error::Code::S_MAP_KEY_MISSING;
      return false;
    }
    // else
    const auto& value = it->second;
    if (value.shape() != &field_shape)
    {
      FLOW_LOG_WARNING("Map -> [" << m_dst_shape << "]: value at key [" << map_key.m_key << "] has shape "
                       "[" << (value.empty() ? std::string("(none)") : value.shape()->name()) << "] which cannot "
                       "be assigned to field [" << map_key.m_field->name() << "] of shape [" << field_shape << "].");
      *err_code = error::Code::S_MAP_VALUE_TYPE_MISMATCH;
      return false;
    }
    // else
    field_shape.copy_assign(dst_base + map_key.m_field->offset(), value.data());
  }

  err_code->clear();
  return true;
} // Converter::map_to_struct()

Converter::Op Converter::op() const
{
  return m_op;
}

const Shape& Converter::dst_shape() const
{
  return m_dst_shape;
}

const Shape& Converter::src_shape() const
{
  return m_src_shape;
}

std::ostream& operator<<(std::ostream& os, Converter::Op val)
{
  using Op = Converter::Op;

  switch (val)
  {
  case Op::S_RAW_COPY: return os << "RAW_COPY";
  case Op::S_COPY_ASSIGN: return os << "COPY_ASSIGN";
  case Op::S_CLOSED_ENUM: return os << "CLOSED_ENUM";
  case Op::S_ALIAS_COPY: return os << "ALIAS_COPY";
  case Op::S_NUMERIC_CONVERT: return os << "NUMERIC_CONVERT";
  case Op::S_STRING_TO_BYTES: return os << "STRING_TO_BYTES";
  case Op::S_BYTES_TO_STRING: return os << "BYTES_TO_STRING";
  case Op::S_DOMAIN: return os << "DOMAIN";
  case Op::S_COPY_TO: return os << "COPY_TO";
  case Op::S_POINTER_SHARE: return os << "POINTER_SHARE";
  case Op::S_POINTER_DEEP: return os << "POINTER_DEEP";
  case Op::S_SLICE: return os << "SLICE";
  case Op::S_OPTIONAL_TO_POINTER: return os << "OPTIONAL_TO_POINTER";
  case Op::S_POINTER_TO_OPTIONAL: return os << "POINTER_TO_OPTIONAL";
  case Op::S_VALUE_TO_OPTIONAL: return os << "VALUE_TO_OPTIONAL";
  case Op::S_REQUIRED_UNWRAP: return os << "REQUIRED_UNWRAP";
  case Op::S_BOX_INTO_POINTER: return os << "BOX_INTO_POINTER";
  case Op::S_DEREF_POINTER: return os << "DEREF_POINTER";
  case Op::S_STRUCT: return os << "STRUCT";
  case Op::S_STRUCT_TO_MAP: return os << "STRUCT_TO_MAP";
  case Op::S_MAP_TO_STRUCT: return os << "MAP_TO_STRUCT";
  }
  assert(false);
  return os;
}

std::ostream& operator<<(std::ostream& os, Converter::Domain_pair val)
{
  using Domain_pair = Converter::Domain_pair;

  switch (val)
  {
  case Domain_pair::S_TIME_TO_TIMESTAMP: return os << "TIME_TO_TIMESTAMP";
  case Domain_pair::S_TIME_PTR_TO_TIMESTAMP: return os << "TIME_PTR_TO_TIMESTAMP";
  case Domain_pair::S_TIMESTAMP_TO_TIME: return os << "TIMESTAMP_TO_TIME";
  case Domain_pair::S_TIMESTAMP_TO_TIME_PTR: return os << "TIMESTAMP_TO_TIME_PTR";
  case Domain_pair::S_OPTIONAL_TIME_TO_TIMESTAMP: return os << "OPTIONAL_TIME_TO_TIMESTAMP";
  case Domain_pair::S_TIMESTAMP_TO_OPTIONAL_TIME: return os << "TIMESTAMP_TO_OPTIONAL_TIME";
  case Domain_pair::S_TIMESTAMP_TO_DATE: return os << "TIMESTAMP_TO_DATE";
  case Domain_pair::S_DATE_TO_TIMESTAMP: return os << "DATE_TO_TIMESTAMP";
  case Domain_pair::S_UUID_TO_STRING: return os << "UUID_TO_STRING";
  case Domain_pair::S_STRING_TO_UUID: return os << "STRING_TO_UUID";
  case Domain_pair::S_ULID_TO_STRING: return os << "ULID_TO_STRING";
  case Domain_pair::S_STRING_TO_ULID: return os << "STRING_TO_ULID";
  case Domain_pair::S_DECIMAL_TO_STRING: return os << "DECIMAL_TO_STRING";
  case Domain_pair::S_STRING_TO_DECIMAL: return os << "STRING_TO_DECIMAL";
  case Domain_pair::S_LANGUAGE_TAG_TO_STRING: return os << "LANGUAGE_TAG_TO_STRING";
  case Domain_pair::S_STRING_TO_LANGUAGE_TAG: return os << "STRING_TO_LANGUAGE_TAG";
  }
  assert(false);
  return os;
}

} // namespace keyval
