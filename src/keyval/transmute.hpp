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

#include "keyval/shape_of.hpp"
#include "keyval/error.hpp"
#include <flow/log/log.hpp>
#include <boost/move/unique_ptr.hpp>
#include <map>
#include <vector>

namespace keyval
{

// Types.

/**
 * Derives, from a struct Shape, a *transmuted* Shape: layout-identical (same size, alignment, field offsets, and
 * the same lifetime operations) but with each field carrying a single `json` tag whose value is taken from the
 * field's tag in a chosen namespace.  A shape-driven serializer (Json_writer) given a value reinterpreted as the
 * transmuted shape (Reinterpreter) thus writes the renamed keys without any per-field translation at
 * serialization time.
 *
 * ### Derivation rules ###
 *   - `Time_point` and `Decimal` are returned unchanged (their marshal hooks are authoritative).
 *   - A shape already being derived higher up the current chain is a circular reference: fails with
 *     error::Code::S_CIRCULAR_TYPE_REFERENCE.
 *   - Struct: fails with error::Code::S_TRANSMUTING_MARSHALABLE_TYPE if it marshals itself; fails with
 *     error::Code::S_UNEXPORTED_FIELD_IN_TRANSMUTABLE_STRUCT if any field is unexported; else each field's shape is
 *     derived recursively.  A field without a (non-empty) tag in the namespace gets the placeholder key
 *     `missing_<namespace>_tag_for_field_<name>`, which is logged at WARNING level.
 *   - Slice of struct or pointer elements: element shape derived; other slices unchanged.
 *   - Pointer, optional, required: element shape derived and re-wrapped.
 *   - Everything else: unchanged.
 *
 * ### Ownership ###
 * Synthesized shapes are owned by `*this` and memoized per (shape, namespace): deriving the same pair again
 * returns the same Shape.  Therefore `*this` must outlive every Value bearing one of its shapes.  Failures are
 * not memoized.
 *
 * ### Thread safety ###
 * derive() may be invoked concurrently.
 */
class Shape_transmuter :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs with nothing derived yet.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  May be null.
   */
  explicit Shape_transmuter(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Returns the transmuted counterpart of `shape` for the tag namespace; see class doc header.
   *
   * @param shape
   *        Shape to derive from; typically a struct.
   * @param tag_ns
   *        Tag namespace supplying the serialization names, e.g., `"json"`.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        error::Code::S_CIRCULAR_TYPE_REFERENCE, error::Code::S_TRANSMUTING_MARSHALABLE_TYPE,
   *        error::Code::S_UNEXPORTED_FIELD_IN_TRANSMUTABLE_STRUCT.
   * @return The derived shape (possibly `&shape` itself); null if and only if `*err_code` is set to truthy.
   */
  const Shape* derive(const Shape& shape, const std::string& tag_ns, Error_code* err_code = 0);

  /**
   * Typed derive().
   *
   * @tparam T
   *         Type to derive from.
   * @param tag_ns
   *        See untyped derive().
   * @param err_code
   *        See untyped derive().
   * @return See untyped derive().
   */
  template<typename T>
  const Shape* derive(const std::string& tag_ns, Error_code* err_code = 0);

  /**
   * Number of shapes synthesized so far (shapes returned unchanged do not count).
   * @return See above.
   */
  size_t size() const;

private:
  // Types.

  /// Shapes whose derivation is in progress, outermost first.
  using Ancestors = std::vector<const Shape*>;

  /// Memo key.
  using Memo_key = std::pair<const Shape*, std::string>;

  // Methods.

  /**
   * Recursive core of derive(); #m_mutex must be locked.
   *
   * @param shape
   *        See derive().
   * @param tag_ns
   *        See derive().
   * @param ancestors
   *        Derivations in progress.
   * @param err_code
   *        Not null.
   * @return See derive().
   */
  const Shape* derive_impl(const Shape& shape, const std::string& tag_ns, Ancestors* ancestors,
                           Error_code* err_code);

  /**
   * Struct case of derive_impl().
   *
   * @param shape
   *        Struct shape.
   * @param tag_ns
   *        See derive().
   * @param ancestors
   *        Derivations in progress, already including `shape`.
   * @param err_code
   *        Not null.
   * @return See derive().
   */
  const Shape* derive_struct(const Shape& shape, const std::string& tag_ns, Ancestors* ancestors,
                             Error_code* err_code);

  /**
   * Element-bearing (slice, pointer, wrapper) case of derive_impl().
   *
   * @param shape
   *        The shape.
   * @param tag_ns
   *        See derive().
   * @param ancestors
   *        Derivations in progress, already including `shape`.
   * @param err_code
   *        Not null.
   * @return See derive().
   */
  const Shape* derive_container(const Shape& shape, const std::string& tag_ns, Ancestors* ancestors,
                                Error_code* err_code);

  /**
   * Takes ownership of a synthesized shape.
   *
   * @param config
   *        Its contents.
   * @return The shape.
   */
  const Shape* adopt(Shape::Config&& config);

  // Data.

  /// Protects the data below.
  mutable util::Mutex m_mutex;

  /// Successful derivations; values either point into #m_owned or are the key's own shape.
  std::map<Memo_key, const Shape*> m_memo;

  /// Synthesized shapes.
  std::vector<boost::movelib::unique_ptr<const Shape>> m_owned;
}; // class Shape_transmuter

// Template implementations.

template<typename T>
const Shape* Shape_transmuter::derive(const std::string& tag_ns, Error_code* err_code)
{
  return derive(shape_of<T>(), tag_ns, err_code);
}

} // namespace keyval
