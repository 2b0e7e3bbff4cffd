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
#include "keyval/json_writer.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>

namespace keyval
{

namespace
{

template<typename T>
void write_as(const void* addr, Json* target)
{
  *target = *static_cast<const T*>(addr);
}

} // namespace (anonymous)

Json_writer::Json_writer(flow::log::Logger* logger_ptr, std::string tag_ns) :
  flow::log::Log_context(logger_ptr, Log_component::S_SERIALIZE),
  m_tag_ns(std::move(tag_ns))
{
  // Done.
}

void Json_writer::write(const Shape& shape, const void* addr, Json* target) const
{
  if (shape.has_marshal_json())
  {
    shape.marshal_json(addr, target);
    return;
  }
  // else

  switch (shape.kind())
  {
  case Kind::S_BOOL: write_as<bool>(addr, target); return;
  case Kind::S_INT8: write_as<int8_t>(addr, target); return;
  case Kind::S_INT16: write_as<int16_t>(addr, target); return;
  case Kind::S_INT32: write_as<int32_t>(addr, target); return;
  case Kind::S_INT64: write_as<int64_t>(addr, target); return;
  case Kind::S_UINT8: write_as<uint8_t>(addr, target); return;
  case Kind::S_UINT16: write_as<uint16_t>(addr, target); return;
  case Kind::S_UINT32: write_as<uint32_t>(addr, target); return;
  case Kind::S_UINT64: write_as<uint64_t>(addr, target); return;
  case Kind::S_FLOAT32: write_as<float>(addr, target); return;
  case Kind::S_FLOAT64: write_as<double>(addr, target); return;
  case Kind::S_STRING: write_as<std::string>(addr, target); return;

  case Kind::S_STRUCT:
    write_struct(shape, addr, target);
    return;

  case Kind::S_SLICE:
  {
    const Shape& elem_shape = shape.elem();
    const size_t n = shape.slice_size(addr);
    const auto data = static_cast<const uint8_t*>(shape.slice_data(addr));
    *target = Json::array();
    for (size_t idx = 0; idx != n; ++idx)
    {
      Json elem;
      write(elem_shape, data + (idx * elem_shape.size()), &elem);
      target->push_back(std::move(elem));
    }
    return;
  }

  case Kind::S_POINTER:
  {
    const void* const pointee = shape.pointee(addr);
    if (pointee)
    {
      write(shape.elem(), pointee, target);
    }
    else
    {
      *target = nullptr;
    }
    return;
  }

  case Kind::S_MAP:
    *target = Json::object();
    for (const auto& key_and_val : *static_cast<const Dyn_map*>(addr))
    {
      write(key_and_val.second, &(*target)[key_and_val.first]);
    }
    return;

  case Kind::S_OPAQUE:
    if (shape.is_optional() || shape.is_required())
    {
      if (shape.wrapper_has_value(addr))
      {
        write(shape.elem(), shape.wrapped_value(addr), target);
      }
      else
      {
        *target = nullptr;
      }
      return;
    }
    // else
    break;
  } // switch (shape.kind())

  FLOW_LOG_WARNING("Json_writer [" << this << "]: [" << shape << "] is opaque and has no marshal hook; "
                   "writing null.");
  *target = nullptr;
} // Json_writer::write()

void Json_writer::write_struct(const Shape& shape, const void* addr, Json* target) const
{
  const auto base = static_cast<const uint8_t*>(addr);

  *target = Json::object();
  for (const auto& field : shape.fields())
  {
    if (!field.exported())
    {
      continue;
    }
    // else

    std::string key = field.name();
    bool omit_empty = false;
    if (const std::string* const tag = field.tag_or_null(m_tag_ns))
    {
      if (*tag == "-")
      {
        continue;
      }
      // else
      const auto comma_pos = tag->find(',');
      const auto name = tag->substr(0, comma_pos);
      if (!name.empty())
      {
        key = name;
      }
      omit_empty = (comma_pos != std::string::npos) && (tag->find("omitempty", comma_pos) != std::string::npos);
    }

    const void* const field_addr = base + field.offset();
    if (omit_empty && field.shape().is_zero(field_addr))
    {
      continue;
    }
    // else

    write(field.shape(), field_addr, &(*target)[key]);
  } // for (field : shape.fields())
}

void Json_writer::write(const Value& value, Json* target) const
{
  if (value.empty())
  {
    *target = nullptr;
    return;
  }
  // else
  write(*value.shape(), value.data(), target);
}

std::string Json_writer::dump(const Value& value) const
{
  Json doc;
  write(value, &doc);
  return to_text(doc);
}

std::string Json_writer::to_text(const Json& doc) // Static.
{
  return doc.dump();
}

const std::string& Json_writer::tag_ns() const
{
  return m_tag_ns;
}

} // namespace keyval
