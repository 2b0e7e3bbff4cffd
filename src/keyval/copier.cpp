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
#include "keyval/copier.hpp"
#include <flow/error/error.hpp>

namespace keyval
{

Copier::Copier(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_COPIER),
  m_cache(logger_ptr),
  m_resolver(logger_ptr, &m_cache)
{
  FLOW_LOG_INFO("Copier [" << this << "]: created with empty copier cache and conversion registry.");
}

Struct_copier::Ptr Copier::build_struct_copier(const Shape& dst_shape, const Shape& src_shape,
                                               const Copier_options& options, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Struct_copier::Ptr, build_struct_copier, dst_shape, src_shape, options, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!options.is_default())
  {
    FLOW_LOG_TRACE("Copier [" << this << "]: non-default options; compiling [" << dst_shape << "] <- "
                   "[" << src_shape << "] without caching.");
    return m_resolver.compile_struct(dst_shape, src_shape, options, err_code);
  }
  // else

  return m_cache.get_or_compile(Type_pair{ &dst_shape, &src_shape },
                                [&](Error_code* actual_err_code) -> Struct_copier::Ptr
  {
    return m_resolver.compile_struct(dst_shape, src_shape, options, actual_err_code);
  }, err_code);
}

bool Copier::copy(const Shape& dst_shape, void* dst, const Shape& src_shape, const void* src, Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(bool, copy, dst_shape, dst, src_shape, src, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  const Type_pair key{ &dst_shape, &src_shape };
  if (const auto func = m_registry.find(key))
  {
    FLOW_LOG_TRACE("Copier [" << this << "]: using registered conversion for " << key << '.');
    err_code->clear();
    if (!func(dst, src, err_code))
    {
      FLOW_LOG_WARNING("Copier [" << this << "]: registered conversion for " << key << " failed "
                       "([" << *err_code << "] [" << err_code->message() << "]).");
      return false;
    }
    return true;
  }
  // else

  const auto copier = build_struct_copier(dst_shape, src_shape, Copier_options(), err_code);
  return copier && copier->copy(dst, src, err_code);
}

Conversion_registry* Copier::registry()
{
  return &m_registry;
}

const Conversion_resolver& Copier::resolver() const
{
  return m_resolver;
}

const Copier_cache& Copier::cache() const
{
  return m_cache;
}

} // namespace keyval
