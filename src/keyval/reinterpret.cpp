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
#include "keyval/reinterpret.hpp"
#include "keyval/shape.hpp"
#include <flow/error/error.hpp>
#include <cassert>
#include <ostream>

namespace keyval
{

Reinterpreter::Ptr Reinterpreter::create(flow::log::Logger* logger_ptr, const Shape& target_shape, Mode mode,
                                         Error_code* err_code) // Static.
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Ptr, create, logger_ptr, target_shape, mode, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  if (!target_shape.origin_or_null())
  {
    FLOW_LOG_SET_CONTEXT(logger_ptr, Log_component::S_TRANSMUTE);
    FLOW_LOG_WARNING("Reinterpreter: target [" << target_shape << "] was not synthesized by a transmuter; there "
                     "is no shape it can be reinterpreted from.");
    *err_code = error::Code::S_SHAPE_NOT_TRANSMUTED;
    return Ptr();
  }
  // else

  err_code->clear();
  return Ptr(new Reinterpreter(logger_ptr, target_shape, mode));
}

Reinterpreter::Reinterpreter(flow::log::Logger* logger_ptr, const Shape& target_shape, Mode mode) :
  flow::log::Log_context(logger_ptr, Log_component::S_TRANSMUTE),
  m_target_shape(target_shape),
  m_mode(mode)
{
  FLOW_LOG_TRACE("Reinterpreter [" << this << "]: [" << origin_shape() << "] -> [" << m_target_shape << "] "
                 "in mode [" << m_mode << "].");
}

Value Reinterpreter::operator()(const Value& value) const
{
  assert((value.shape() == &origin_shape()) && "Reinterpreting a value not of the transmuted shape's origin.");

  switch (m_mode)
  {
  case Mode::S_ZERO_COPY:
    return value.with_shape(m_target_shape);
  case Mode::S_VIEW:
    return Value::view(m_target_shape, value.data());
  case Mode::S_RECONSTRUCT:
    break;
  }

  auto result = Value::make(m_target_shape);
  m_target_shape.copy_assign(result.data(), value.data());
  return result;
}

const Shape& Reinterpreter::target_shape() const
{
  return m_target_shape;
}

const Shape& Reinterpreter::origin_shape() const
{
  return *m_target_shape.origin_or_null();
}

Reinterpreter::Mode Reinterpreter::mode() const
{
  return m_mode;
}

std::ostream& operator<<(std::ostream& os, Reinterpreter::Mode val)
{
  using Mode = Reinterpreter::Mode;
  switch (val)
  {
  case Mode::S_RECONSTRUCT: return os << "RECONSTRUCT";
  case Mode::S_VIEW: return os << "VIEW";
  case Mode::S_ZERO_COPY: return os << "ZERO_COPY";
  }
  return os << "UNKNOWN";
}

} // namespace keyval
