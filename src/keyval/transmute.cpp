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
#include "keyval/transmute.hpp"
#include <flow/error/error.hpp>
#include <algorithm>

namespace keyval
{

Shape_transmuter::Shape_transmuter(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSMUTE)
{
  // Done.
}

const Shape* Shape_transmuter::derive(const Shape& shape, const std::string& tag_ns, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(const Shape*, derive, shape, tag_ns, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  util::Lock_guard lock(m_mutex);
  Ancestors ancestors;
  const auto result = derive_impl(shape, tag_ns, &ancestors, err_code);
  if (result)
  {
    err_code->clear();
    FLOW_LOG_TRACE("Shape_transmuter [" << this << "]: [" << shape << "] in tag namespace [" << tag_ns << "] "
                   "-> [" << *result << "] (synthesized so far: [" << m_owned.size() << "]).");
  }
  return result;
}

const Shape* Shape_transmuter::derive_impl(const Shape& shape, const std::string& tag_ns, Ancestors* ancestors,
                                           Error_code* err_code)
{
  if ((&shape == &shape_of<Time_point>()) || (&shape == &shape_of<Decimal>()))
  {
    return &shape;
  }
  // else

  if (std::find(ancestors->begin(), ancestors->end(), &shape) != ancestors->end())
  {
    FLOW_LOG_WARNING("Shape_transmuter [" << this << "]: [" << shape << "] refers to itself; cannot derive a "
                     "finite transmuted shape.");
    *err_code = error::Code::S_CIRCULAR_TYPE_REFERENCE;
    return nullptr;
  }
  // else

  const Memo_key key(&shape, tag_ns);
  const auto memo_it = m_memo.find(key);
  if (memo_it != m_memo.end())
  {
    return memo_it->second;
  }
  // else

  const Shape* result;
  ancestors->push_back(&shape);
  switch (shape.kind())
  {
  case Kind::S_STRUCT:
    result = derive_struct(shape, tag_ns, ancestors, err_code);
    break;
  case Kind::S_SLICE:
    result = ((shape.elem().kind() == Kind::S_STRUCT) || (shape.elem().kind() == Kind::S_POINTER))
               ? derive_container(shape, tag_ns, ancestors, err_code)
               : &shape;
    break;
  case Kind::S_POINTER:
    result = derive_container(shape, tag_ns, ancestors, err_code);
    break;
  case Kind::S_OPAQUE:
    result = (shape.is_optional() || shape.is_required())
               ? derive_container(shape, tag_ns, ancestors, err_code)
               : &shape;
    break;
  default:
    result = &shape;
  }
  ancestors->pop_back();

  if (result)
  {
    m_memo.emplace(key, result);
  }
  return result;
} // Shape_transmuter::derive_impl()

const Shape* Shape_transmuter::derive_struct(const Shape& shape, const std::string& tag_ns, Ancestors* ancestors,
                                             Error_code* err_code)
{
  if (shape.has_marshal_json())
  {
    FLOW_LOG_WARNING("Shape_transmuter [" << this << "]: [" << shape << "] marshals itself; restructuring it "
                     "would bypass that logic.");
    *err_code = error::Code::S_TRANSMUTING_MARSHALABLE_TYPE;
    return nullptr;
  }
  // else

  Shape::Config config = shape.config();
  std::vector<Field> fields;
  fields.reserve(shape.fields().size());
  for (const auto& field : shape.fields())
  {
    if (!field.exported())
    {
      FLOW_LOG_WARNING("Shape_transmuter [" << this << "]: [" << shape << "] has unexported field "
                       "[" << field.name() << "].");
      *err_code = error::Code::S_UNEXPORTED_FIELD_IN_TRANSMUTABLE_STRUCT;
      return nullptr;
    }
    // else

    const std::string* const tag = field.tag_or_null(tag_ns);
    std::string key;
    if (tag)
    {
      key = *tag;
    }
    else
    {
      key = "missing_" + tag_ns + "_tag_for_field_" + field.name();
      FLOW_LOG_WARNING("Shape_transmuter [" << this << "]: [" << shape << "] field [" << field.name() << "] has "
                       "no [" << tag_ns << "] tag; it will be serialized as [" << key << "].");
    }

    const Shape* const field_shape = derive_impl(field.shape(), tag_ns, ancestors, err_code);
    if (!field_shape)
    {
      return nullptr;
    }
    // else

    fields.emplace_back(field.name(), field_shape, field.offset(), std::vector<Field_tag>{ { "json", key } }, true);
  } // for (field : shape.fields())

  config.m_name = "transmuted<" + tag_ns + ">(" + shape.name() + ')';
  config.m_fields = std::move(fields);
  config.m_copy_to = Shape::Copy_to_ops();
  config.m_origin_or_null = &shape;
  return adopt(std::move(config));
} // Shape_transmuter::derive_struct()

const Shape* Shape_transmuter::derive_container(const Shape& shape, const std::string& tag_ns, Ancestors* ancestors,
                                                Error_code* err_code)
{
  const Shape* const elem_shape = derive_impl(shape.elem(), tag_ns, ancestors, err_code);
  if (!elem_shape)
  {
    return nullptr;
  }
  if (elem_shape == &shape.elem())
  {
    return &shape; // Nothing below needed renaming.
  }
  // else

  Shape::Config config = shape.config();
  config.m_name = "transmuted<" + tag_ns + ">(" + shape.name() + ')';
  config.m_elem_getter = nullptr;
  config.m_elem_or_null = elem_shape;
  config.m_origin_or_null = &shape;
  return adopt(std::move(config));
}

const Shape* Shape_transmuter::adopt(Shape::Config&& config)
{
  m_owned.emplace_back(new Shape(std::move(config)));
  return m_owned.back().get();
}

size_t Shape_transmuter::size() const
{
  util::Lock_guard lock(m_mutex);
  return m_owned.size();
}

} // namespace keyval
