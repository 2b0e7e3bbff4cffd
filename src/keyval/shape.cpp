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
#include "keyval/shape.hpp"
#include <flow/util/util.hpp>
#include <cassert>
#include <cstdint>

namespace keyval
{

// Field implementations.

Field::Field(std::string name, Shape_getter shape_getter, size_t offset,
             std::vector<Field_tag> tags, bool exported) :
  m_name(std::move(name)),
  m_shape_getter(shape_getter),
  m_shape_or_null(nullptr),
  m_offset(offset),
  m_tags(std::move(tags)),
  m_exported(exported)
{
  assert(m_shape_getter);
}

Field::Field(std::string name, const Shape* shape, size_t offset, std::vector<Field_tag> tags, bool exported) :
  m_name(std::move(name)),
  m_shape_getter(nullptr),
  m_shape_or_null(shape),
  m_offset(offset),
  m_tags(std::move(tags)),
  m_exported(exported)
{
  assert(m_shape_or_null);
}

const std::string& Field::name() const
{
  return m_name;
}

const Shape& Field::shape() const
{
  return m_shape_or_null ? *m_shape_or_null : m_shape_getter();
}

size_t Field::offset() const
{
  return m_offset;
}

bool Field::exported() const
{
  return m_exported;
}

const std::vector<Field_tag>& Field::tags() const
{
  return m_tags;
}

const std::string* Field::tag_or_null(util::String_view key) const
{
  for (const auto& tag : m_tags)
  {
    if ((tag.m_key == key) && (!tag.m_value.empty()))
    {
      return &tag.m_value;
    }
  }
  return nullptr;
}

// Shape implementations.

Shape::Shape(Config&& config) :
  m_config(std::move(config))
{
  assert(m_config.m_lifetime.m_construct && m_config.m_lifetime.m_destroy
         && m_config.m_lifetime.m_copy_assign && m_config.m_lifetime.m_is_zero);
}

const Shape::Config& Shape::config() const
{
  return m_config;
}

const std::string& Shape::name() const
{
  return m_config.m_name;
}

Kind Shape::kind() const
{
  return m_config.m_kind;
}

size_t Shape::size() const
{
  return m_config.m_size;
}

size_t Shape::alignment() const
{
  return m_config.m_alignment;
}

bool Shape::trivially_copyable() const
{
  return m_config.m_trivially_copyable;
}

bool Shape::is_numeric() const
{
  switch (kind())
  {
  case Kind::S_INT8:
  case Kind::S_INT16:
  case Kind::S_INT32:
  case Kind::S_INT64:
  case Kind::S_UINT8:
  case Kind::S_UINT16:
  case Kind::S_UINT32:
  case Kind::S_UINT64:
  case Kind::S_FLOAT32:
  case Kind::S_FLOAT64:
    return true;
  default:
    return false;
  }
}

bool Shape::is_scalar() const
{
  return (kind() == Kind::S_BOOL) || (kind() == Kind::S_STRING) || is_numeric();
}

const std::vector<Field>& Shape::fields() const
{
  return m_config.m_fields;
}

const Field* Shape::field_or_null(util::String_view name) const
{
  for (const auto& field : m_config.m_fields)
  {
    if (field.name() == name)
    {
      return &field;
    }
  }
  return nullptr;
}

const Shape& Shape::elem() const
{
  assert((m_config.m_elem_or_null || m_config.m_elem_getter) && "Shape has no element shape.");
  return m_config.m_elem_or_null ? *m_config.m_elem_or_null : m_config.m_elem_getter();
}

const Shape* Shape::origin_or_null() const
{
  return m_config.m_origin_or_null;
}

bool Shape::same_representation(const Shape& other) const
{
  return (kind() == other.kind()) && is_scalar();
}

void Shape::construct(void* addr) const
{
  m_config.m_lifetime.m_construct(addr);
}

void Shape::destroy(void* addr) const
{
  m_config.m_lifetime.m_destroy(addr);
}

void Shape::copy_assign(void* dst, const void* src) const
{
  m_config.m_lifetime.m_copy_assign(dst, src);
}

bool Shape::is_zero(const void* addr) const
{
  return m_config.m_lifetime.m_is_zero(addr);
}

bool Shape::fields_are_zero(const void* addr) const
{
  const auto base = static_cast<const uint8_t*>(addr);
  for (const auto& field : m_config.m_fields)
  {
    if (!field.shape().is_zero(base + field.offset()))
    {
      return false;
    }
  }
  return true;
}

size_t Shape::slice_size(const void* addr) const
{
  assert(kind() == Kind::S_SLICE);
  return m_config.m_slice.m_size(addr);
}

const void* Shape::slice_data(const void* addr) const
{
  assert(kind() == Kind::S_SLICE);
  return m_config.m_slice.m_const_data(addr);
}

void* Shape::slice_data(void* addr) const
{
  assert(kind() == Kind::S_SLICE);
  return m_config.m_slice.m_data(addr);
}

void Shape::slice_resize(void* addr, size_t n) const
{
  assert(kind() == Kind::S_SLICE);
  m_config.m_slice.m_resize(addr, n);
}

const void* Shape::pointee(const void* addr) const
{
  assert(kind() == Kind::S_POINTER);
  return m_config.m_pointer.m_get(addr);
}

void* Shape::reset_pointee(void* addr) const
{
  assert(kind() == Kind::S_POINTER);
  return m_config.m_pointer.m_reset_to_new(addr);
}

void Shape::share_pointer(void* dst, const void* src) const
{
  assert(kind() == Kind::S_POINTER);
  m_config.m_pointer.m_share(dst, src);
}

bool Shape::is_optional() const
{
  return m_config.m_wrapper == Wrapper::S_OPTIONAL;
}

bool Shape::is_required() const
{
  return m_config.m_wrapper == Wrapper::S_REQUIRED;
}

bool Shape::wrapper_has_value(const void* addr) const
{
  assert(m_config.m_wrapper != Wrapper::S_NONE);
  return m_config.m_wrapper_ops.m_has_value(addr);
}

const void* Shape::wrapped_value(const void* addr) const
{
  assert(m_config.m_wrapper != Wrapper::S_NONE);
  return m_config.m_wrapper_ops.m_value(addr);
}

void* Shape::emplace_wrapped(void* addr) const
{
  assert(m_config.m_wrapper != Wrapper::S_NONE);
  return m_config.m_wrapper_ops.m_emplace(addr);
}

bool Shape::is_closed_enum() const
{
  return m_config.m_closed_enum_check;
}

bool Shape::is_closed_enum_member(const std::string& value) const
{
  assert(is_closed_enum());
  return m_config.m_closed_enum_check(value);
}

bool Shape::has_copy_to() const
{
  return m_config.m_copy_to.m_can_copy_to && m_config.m_copy_to.m_copy_to;
}

bool Shape::can_copy_to(const Shape& dst_shape) const
{
  assert(has_copy_to());
  return m_config.m_copy_to.m_can_copy_to(dst_shape);
}

void Shape::copy_to(const void* src, const Shape& dst_shape, void* dst) const
{
  assert(has_copy_to());
  m_config.m_copy_to.m_copy_to(src, dst_shape, dst);
}

bool Shape::has_marshal_json() const
{
  return m_config.m_marshal_json;
}

void Shape::marshal_json(const void* addr, Json* target) const
{
  assert(has_marshal_json());
  m_config.m_marshal_json(addr, target);
}

std::ostream& operator<<(std::ostream& os, const Shape& val)
{
  return os << val.name();
}

std::ostream& operator<<(std::ostream& os, Kind val)
{
  switch (val)
  {
  case Kind::S_BOOL:
    return os << "BOOL";
  case Kind::S_INT8:
    return os << "INT8";
  case Kind::S_INT16:
    return os << "INT16";
  case Kind::S_INT32:
    return os << "INT32";
  case Kind::S_INT64:
    return os << "INT64";
  case Kind::S_UINT8:
    return os << "UINT8";
  case Kind::S_UINT16:
    return os << "UINT16";
  case Kind::S_UINT32:
    return os << "UINT32";
  case Kind::S_UINT64:
    return os << "UINT64";
  case Kind::S_FLOAT32:
    return os << "FLOAT32";
  case Kind::S_FLOAT64:
    return os << "FLOAT64";
  case Kind::S_STRING:
    return os << "STRING";
  case Kind::S_STRUCT:
    return os << "STRUCT";
  case Kind::S_SLICE:
    return os << "SLICE";
  case Kind::S_POINTER:
    return os << "POINTER";
  case Kind::S_MAP:
    return os << "MAP";
  case Kind::S_OPAQUE:
    return os << "OPAQUE";
  }
  assert(false);
  return os;
}

} // namespace keyval
