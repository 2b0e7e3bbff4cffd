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
#include "keyval/copier_cache.hpp"
#include <flow/error/error.hpp>
#include <cassert>

namespace keyval
{

Copier_cache::Copier_cache(flow::log::Logger* logger_ptr) :
  flow::log::Log_context(logger_ptr, Log_component::S_COPIER)
{
  // Done.
}

Struct_copier::Ptr Copier_cache::get_or_compile(const Type_pair& key, const Compile_func& compile_func,
                                                Error_code* err_code)
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Struct_copier::Ptr, get_or_compile, key, compile_func, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  auto copier = find(key);
  if (copier)
  {
    FLOW_LOG_TRACE("Copier cache: hit for [" << key << "].");
    err_code->clear();
    return copier;
  }
  // else

  FLOW_LOG_TRACE("Copier cache: miss for [" << key << "]; compiling.");
  copier = compile_func(err_code);
  if (!copier)
  {
    assert(*err_code);
    return copier; // Failures are never cached: a later request re-attempts.
  }
  // else

  {
    util::Lock_guard_exclusive lock(m_mutex);
    // A concurrent compilation of the same pair may have got here first; everyone shares its (equivalent) copier.
    copier = m_copiers.emplace(key, std::move(copier)).first->second;
  }
  FLOW_LOG_TRACE("Copier cache: cached copier for [" << key << "] "
                 "([" << copier->field_converters().size() << "] field converters).");
  return copier;
}

Struct_copier::Ptr Copier_cache::find(const Type_pair& key) const
{
  util::Lock_guard_shared lock(m_mutex);
  const auto it = m_copiers.find(key);
  return (it == m_copiers.end()) ? Struct_copier::Ptr() : it->second;
}

size_t Copier_cache::size() const
{
  util::Lock_guard_shared lock(m_mutex);
  return m_copiers.size();
}

} // namespace keyval
