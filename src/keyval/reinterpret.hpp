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
#pragma once

#include "keyval/value.hpp"
#include "keyval/error.hpp"
#include <flow/log/log.hpp>
#include <boost/shared_ptr.hpp>
#include <iosfwd>

namespace keyval
{

// Types.

/**
 * Turns values of an original shape into values bearing the transmuted shape derived from it by
 * Shape_transmuter, so that a shape-driven serializer writes them with the renamed keys.  Created once per
 * transmuted shape; stateless beyond the target shape and the Mode.
 *
 * Correctness of the two aliasing modes rests entirely on the layout identity of a transmuted shape and its
 * origin, established at derivation time; nothing about the bytes is checked per call.  S_RECONSTRUCT is the safe
 * fallback, and all three modes serialize identically.
 */
class Reinterpreter :
  public flow::log::Log_context
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to immutable `*this`.
  using Ptr = boost::shared_ptr<const Reinterpreter>;

  /// How a value is carried over to the target shape.
  enum class Mode
  {
    /**
     * A fresh object of the target shape is constructed and the payload copy-assigned into it.  The result owns
     * its payload independently of the input.  Default.
     */
    S_RECONSTRUCT,

    /**
     * A fresh non-owning handle to the input's payload, bearing the target shape.  No payload copy; the input's
     * payload must outlive the result.
     */
    S_VIEW,

    /**
     * Only the shape descriptor of the input is swapped; the result shares ownership of the very same payload.
     * No allocation, no payload copy.
     */
    S_ZERO_COPY
  }; // enum class Mode

  // Constructors/destructor.

  /**
   * Creates a reinterpreter onto `target_shape`.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  May be null.
   * @param target_shape
   *        A shape synthesized by Shape_transmuter (which must outlive the result and every value it yields).
   * @param mode
   *        See Mode.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_SHAPE_NOT_TRANSMUTED (`target_shape` has no origin shape).
   * @return Null if and only if `*err_code` is set to truthy.
   */
  static Ptr create(flow::log::Logger* logger_ptr, const Shape& target_shape, Mode mode = Mode::S_RECONSTRUCT,
                    Error_code* err_code = 0);

  // Methods.

  /**
   * Reinterprets `value`, whose shape must be origin_shape().
   *
   * @param value
   *        Value of origin_shape().
   * @return Value of target_shape(); see Mode.
   */
  Value operator()(const Value& value) const;

  /**
   * The transmuted shape produced values bear.
   * @return See above.
   */
  const Shape& target_shape() const;

  /**
   * The shape input values bear.
   * @return See above.
   */
  const Shape& origin_shape() const;

  /**
   * The mode.
   * @return See above.
   */
  Mode mode() const;

private:
  // Constructors.

  /**
   * See create().
   *
   * @param logger_ptr
   *        See create().
   * @param target_shape
   *        See create().
   * @param mode
   *        See create().
   */
  explicit Reinterpreter(flow::log::Logger* logger_ptr, const Shape& target_shape, Mode mode);

  // Data.

  /// See target_shape().
  const Shape& m_target_shape;

  /// See mode().
  const Mode m_mode;
}; // class Reinterpreter

// Free functions.

/**
 * Prints string representation of the given `Reinterpreter::Mode` to the given `ostream`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Reinterpreter::Mode val);

} // namespace keyval
