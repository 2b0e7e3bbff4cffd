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
#include "keyval/shape_of.hpp"
#include "keyval/time_util.hpp"
#include <google/protobuf/util/time_util.h>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>
#include <cassert>

namespace keyval::detail
{

const char* kind_name(Kind kind)
{
  switch (kind)
  {
  case Kind::S_BOOL:
    return "bool";
  case Kind::S_INT8:
    return "int8";
  case Kind::S_INT16:
    return "int16";
  case Kind::S_INT32:
    return "int32";
  case Kind::S_INT64:
    return "int64";
  case Kind::S_UINT8:
    return "uint8";
  case Kind::S_UINT16:
    return "uint16";
  case Kind::S_UINT32:
    return "uint32";
  case Kind::S_UINT64:
    return "uint64";
  case Kind::S_FLOAT32:
    return "float32";
  case Kind::S_FLOAT64:
    return "float64";
  case Kind::S_STRING:
    return "string";
  case Kind::S_STRUCT:
  case Kind::S_SLICE:
  case Kind::S_POINTER:
  case Kind::S_MAP:
  case Kind::S_OPAQUE:
    break;
  }
  assert(false && "Not a scalar kind.");
  return "";
}

void marshal_time_json(const void* addr, Json* target)
{
  *target = time_util::time_to_rfc3339(*static_cast<const Time_point*>(addr));
}

void marshal_date_json(const void* addr, Json* target)
{
  const auto& date = *static_cast<const Date*>(addr);
  if (date.is_special())
  {
    *target = nullptr;
  }
  else
  {
    *target = boost::gregorian::to_iso_extended_string(date);
  }
}

void marshal_uuid_json(const void* addr, Json* target)
{
  *target = boost::uuids::to_string(*static_cast<const Uuid*>(addr));
}

void marshal_decimal_json(const void* addr, Json* target)
{
  // Quoted, so that no precision is lost to a reader's floating point.
  *target = decimal_to_string(*static_cast<const Decimal*>(addr));
}

void marshal_ulid_json(const void* addr, Json* target)
{
  *target = static_cast<const Ulid*>(addr)->to_string();
}

void marshal_language_tag_json(const void* addr, Json* target)
{
  *target = static_cast<const Language_tag*>(addr)->to_string();
}

void marshal_timestamp_json(const void* addr, Json* target)
{
  *target = google::protobuf::util::TimeUtil::ToString(*static_cast<const Proto_timestamp*>(addr));
}

} // namespace keyval::detail
