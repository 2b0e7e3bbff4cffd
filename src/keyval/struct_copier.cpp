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
#include "keyval/struct_copier.hpp"
#include <flow/error/error.hpp>

namespace keyval
{

bool Copier_options::is_default() const
{
  return (!m_omit_unmatched_fields) && (!m_fields_to_include) && m_fields_to_exclude.empty();
}

Struct_copier::Struct_copier(flow::log::Logger* logger_ptr, const Shape& dst_shape, const Shape& src_shape,
                             std::vector<Field_converter>&& field_converters) :
  flow::log::Log_context(logger_ptr, Log_component::S_COPIER),
  m_dst_shape(dst_shape),
  m_src_shape(src_shape),
  m_field_converters(std::move(field_converters))
{
  // Done.
}

bool Struct_copier::copy(void* dst, const void* src, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, copy, dst, src, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const auto dst_base = static_cast<uint8_t*>(dst);
  const auto src_base = static_cast<const uint8_t*>(src);
  for (const auto& field_converter : m_field_converters)
  {
    if (!field_converter.m_converter->convert(dst_base + field_converter.m_dst_offset,
                                              src_base + field_converter.m_src_offset, err_code))
    {
      FLOW_LOG_WARNING("Struct copier [" << m_dst_shape << "] <- [" << m_src_shape << "]: "
                       "conversion of field [" << field_converter.m_field_name << "] failed "
                       "([" << *err_code << "] [" << err_code->message() << "]); copy aborted with the "
                       "destination partially written.");
      return false;
    }
  }

  err_code->clear();
  return true;
}

const Shape& Struct_copier::dst_shape() const
{
  return m_dst_shape;
}

const Shape& Struct_copier::src_shape() const
{
  return m_src_shape;
}

const std::vector<Struct_copier::Field_converter>& Struct_copier::field_converters() const
{
  return m_field_converters;
}

} // namespace keyval
