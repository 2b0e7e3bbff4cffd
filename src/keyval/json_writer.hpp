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
#include <flow/log/log.hpp>
#include <string>

namespace keyval
{

// Types.

/**
 * Shape-driven JSON serializer: walks any value by its Shape and builds a `nlohmann::ordered_json` document, so
 * that it writes a value of a transmuted shape (Shape_transmuter, Reinterpreter) with the renamed keys exactly as
 * it writes the original value with its tags.
 *
 * Output per shape:
 *   - a marshal hook (domain leaf types, records declaring `marshal_json()`) is authoritative;
 *   - bool and numbers as JSON booleans and numbers; string kinds as strings;
 *   - structs as objects in field order: unexported fields are skipped; the key is the field's tag in the tag
 *     namespace (`"name"`, `"name,omitempty"`, `",omitempty"`) or else the field name; tag `"-"` skips the
 *     field; `omitempty` skips a zero value;
 *   - slices as arrays; Dyn_map as an object (an empty Value is `null`);
 *   - null pointers and absent optional or required values as `null`, else the pointee or value.
 */
class Json_writer :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs the writer.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  May be null.
   * @param tag_ns
   *        Tag namespace naming struct fields.
   */
  explicit Json_writer(flow::log::Logger* logger_ptr, std::string tag_ns = "json");

  // Methods.

  /**
   * Writes the object at `addr`, of shape `shape`, into `*target` (replacing its contents).
   *
   * @param shape
   *        Shape of `*addr`.
   * @param addr
   *        Object.
   * @param target
   *        Output.
   */
  void write(const Shape& shape, const void* addr, Json* target) const;

  /**
   * Writes a Value; an empty one is `null`.
   *
   * @param value
   *        Value.
   * @param target
   *        Output.
   */
  void write(const Value& value, Json* target) const;

  /**
   * Serialized compact JSON text of a Value.
   *
   * @param value
   *        Value.
   * @return See above.
   */
  std::string dump(const Value& value) const;

  /**
   * Serialized compact JSON text of an object.
   *
   * @tparam T
   *         Type with a Shape.
   * @param obj
   *        Object.
   * @return See above.
   */
  template<typename T>
  std::string dump(const T& obj) const;

  /**
   * Tag namespace naming struct fields.
   * @return See above.
   */
  const std::string& tag_ns() const;

private:
  // Methods.

  /**
   * S_STRUCT case of write().
   *
   * @param shape
   *        Struct shape.
   * @param addr
   *        Object.
   * @param target
   *        Output.
   */
  void write_struct(const Shape& shape, const void* addr, Json* target) const;

  /**
   * Compact text of a document.
   *
   * @param doc
   *        Document.
   * @return See above.
   */
  static std::string to_text(const Json& doc);

  // Data.

  /// See tag_ns().
  const std::string m_tag_ns;
}; // class Json_writer

// Template implementations.

template<typename T>
std::string Json_writer::dump(const T& obj) const
{
  Json doc;
  write(shape_of<T>(), &obj, &doc);
  return to_text(doc);
}

} // namespace keyval
