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

#include "keyval/common.hpp"
#include <nlohmann/json_fwd.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace keyval
{

// Types.

class Shape;

/// Function returning a Shape; used so that nested shapes are resolved lazily (self-referential records work).
using Shape_getter = const Shape& (*)();

/// The JSON document type produced by our shape-driven serializer and by custom marshal hooks.
using Json = nlohmann::ordered_json;

/// Structural kind of a Shape.
enum class Kind
{
  /// `bool`.
  S_BOOL,
  /// Signed 8-bit integer.
  S_INT8,
  /// Signed 16-bit integer.
  S_INT16,
  /// Signed 32-bit integer.
  S_INT32,
  /// Signed 64-bit integer.
  S_INT64,
  /// Unsigned 8-bit integer.
  S_UINT8,
  /// Unsigned 16-bit integer.
  S_UINT16,
  /// Unsigned 32-bit integer.
  S_UINT32,
  /// Unsigned 64-bit integer.
  S_UINT64,
  /// `float`.
  S_FLOAT32,
  /// `double`.
  S_FLOAT64,
  /// `std::string` or a named type layout-identical to it.
  S_STRING,
  /// Record with named fields at fixed byte offsets.
  S_STRUCT,
  /// `std::vector<E>`.
  S_SLICE,
  /// `boost::shared_ptr<E>`.
  S_POINTER,
  /// The dynamic key-value map, keyval::Dyn_map.
  S_MAP,
  /// Leaf domain types and capability wrappers; structure not visible to the engine.
  S_OPAQUE
}; // enum class Kind

/// One `key:"value"` tag attached to a struct field (e.g., `{ "json", "make" }`).
struct Field_tag
{
  // Data.

  /// Tag namespace, e.g., `"json"`, `"key"`, `"kv"`.
  std::string m_key;

  /// Tag value.
  std::string m_value;
};

/**
 * A field of a struct Shape: name, shape, byte offset inside the struct, tags and the exported flag.
 * Immutable once the owning Shape exists.
 *
 * The field's Shape is reached either through a Shape_getter (shapes described from C++ types; resolved on
 * each access, so no ordering issue arises among mutually-referring types) or through a direct pointer
 * (synthesized shapes, see Shape_transmuter).
 */
class Field
{
public:
  // Constructors/destructor.

  /**
   * Constructs field whose shape is resolved lazily.
   *
   * @param name
   *        Field name; copier matching between shapes is by this name.
   * @param shape_getter
   *        Returns the field's Shape.  Not null.
   * @param offset
   *        Byte offset of the field inside the struct.
   * @param tags
   *        Tags.
   * @param exported
   *        `false` means the field is invisible to copiers and rejected by transmutation.
   */
  explicit Field(std::string name, Shape_getter shape_getter, size_t offset,
                 std::vector<Field_tag> tags, bool exported);

  /**
   * Constructs field whose shape is given directly.
   *
   * @param name
   *        See other ctor.
   * @param shape
   *        The field's Shape; must outlive `*this`.
   * @param offset
   *        See other ctor.
   * @param tags
   *        See other ctor.
   * @param exported
   *        See other ctor.
   */
  explicit Field(std::string name, const Shape* shape, size_t offset, std::vector<Field_tag> tags, bool exported);

  // Methods.

  /**
   * Field name.
   * @return See above.
   */
  const std::string& name() const;

  /**
   * Field shape.
   * @return See above.
   */
  const Shape& shape() const;

  /**
   * Byte offset inside the owning struct.
   * @return See above.
   */
  size_t offset() const;

  /**
   * Whether the field is exported (visible to copiers and transmutable).
   * @return See above.
   */
  bool exported() const;

  /**
   * All tags.
   * @return See above.
   */
  const std::vector<Field_tag>& tags() const;

  /**
   * Returns the value of the tag in the given namespace; null if there is no such tag *or* its value is empty
   * (an empty tag is treated as absent, as it conveys nothing).
   *
   * @param key
   *        Tag namespace.
   * @return See above.
   */
  const std::string* tag_or_null(util::String_view key) const;

private:
  // Data.

  /// See name().
  std::string m_name;

  /// See shape(); null if #m_shape_or_null is used.
  Shape_getter m_shape_getter;

  /// See shape(); null if #m_shape_getter is used.
  const Shape* m_shape_or_null;

  /// See offset().
  size_t m_offset;

  /// See tags().
  std::vector<Field_tag> m_tags;

  /// See exported().
  bool m_exported;
}; // class Field

/**
 * Immutable description of a C++ type as seen by the conversion engine: kind, size, alignment, for structs the
 * ordered field list, for containers the element shape, the capabilities the type carries, and a table of
 * type-erased operations (construct, destroy, copy, etc.) so that compiled converters can work on raw addresses.
 *
 * ### Identity ###
 * There is exactly one Shape per C++ type; it is obtained via `shape_of<T>()` (see shape_of.hpp) and lives for the
 * rest of the process.  Therefore two shapes are "identical" if and only if their addresses are equal; all
 * identity checks in keyval are address comparisons.  Synthesized shapes (Shape_transmuter) are owned by their
 * creator and have their own identities; they record the shape they were derived from (origin_or_null()).
 *
 * ### Capabilities ###
 * Recorded once, when the Shape is built, and never re-checked by executing converters:
 *   - closed enumeration (string-kind shape restricted to a declared member set);
 *   - optional (`boost::optional<E>`: value present or absent);
 *   - required (keyval::Required<E>: must hold a value);
 *   - copy-to (the type itself knows how to produce values of certain other shapes);
 *   - JSON marshal (the type serializes itself; leaf domain types have one).
 *
 * ### Thread safety ###
 * All methods are `const` and safe to call concurrently.
 */
class Shape
{
public:
  // Types.

  /// Type-erased lifetime operations; every Shape has all of them.
  struct Lifetime_ops
  {
    // Data.

    /// Default-constructs an object in raw storage.
    void (*m_construct)(void* addr) = nullptr;
    /// Destroys the object at the address (storage is not freed).
    void (*m_destroy)(void* addr) = nullptr;
    /// Copy-assigns `*src` to `*dst`, both live objects.
    void (*m_copy_assign)(void* dst, const void* src) = nullptr;
    /// Whether the object equals its default-constructed (zero) value.
    bool (*m_is_zero)(const void* addr) = nullptr;
  };

  /// Operations of S_SLICE shapes.
  struct Slice_ops
  {
    // Data.

    /// Element count.
    size_t (*m_size)(const void* addr) = nullptr;
    /// Pointer to the first element.
    void* (*m_data)(void* addr) = nullptr;
    /// Pointer to the first element.
    const void* (*m_const_data)(const void* addr) = nullptr;
    /// Resizes to the given count; new elements are default-constructed.
    void (*m_resize)(void* addr, size_t n) = nullptr;
  };

  /// Operations of S_POINTER shapes.
  struct Pointer_ops
  {
    // Data.

    /// Pointee address; null if the pointer is null.
    const void* (*m_get)(const void* addr) = nullptr;
    /// Points the pointer at a freshly allocated default-constructed pointee; returns the pointee address.
    void* (*m_reset_to_new)(void* addr) = nullptr;
    /// Makes `*dst` point where `*src` points (shared pointee).
    void (*m_share)(void* dst, const void* src) = nullptr;
  };

  /// Which value-wrapping capability (if any) a Shape carries.
  enum class Wrapper
  {
    /// None.
    S_NONE,
    /// Optional: value present or absent; absence is a legitimate state.
    S_OPTIONAL,
    /// Required: absence is a conversion error.
    S_REQUIRED
  };

  /// Operations of wrapper (optional/required) shapes.
  struct Wrapper_ops
  {
    // Data.

    /// Whether a value is present.
    bool (*m_has_value)(const void* addr) = nullptr;
    /// Address of the present value.
    const void* (*m_value)(const void* addr) = nullptr;
    /// Makes a default-constructed value present; returns its address.
    void* (*m_emplace)(void* addr) = nullptr;
  };

  /// Operations of the copy-to capability.
  struct Copy_to_ops
  {
    // Data.

    /// Whether values of this shape can produce values of the given destination shape.
    bool (*m_can_copy_to)(const Shape& dst_shape) = nullptr;
    /// Writes into `dst` (a live object of `dst_shape`) the value produced from `*src`.
    void (*m_copy_to)(const void* src, const Shape& dst_shape, void* dst) = nullptr;
  };

  /// Closed-enumeration membership check; null for shapes that are not closed enumerations.
  using Closed_enum_check = bool (*)(const std::string& value);

  /// Custom JSON marshal hook; null if the shape has none.
  using Marshal_json_func = void (*)(const void* addr, Json* target);

  /**
   * Everything a Shape is made of.  Filled by `Shape_traits<T>::config()` (shape_of.hpp) for C++ types;
   * copied-then-edited by Shape_transmuter for synthesized shapes.
   */
  struct Config
  {
    // Data.

    /// Human-readable name, for logging only (identity is by address).
    std::string m_name;
    /// See Kind.
    Kind m_kind = Kind::S_OPAQUE;
    /// `sizeof`.
    size_t m_size = 0;
    /// `alignof`.
    size_t m_alignment = 0;
    /// Whether a bytewise copy is a valid copy (enables the memcopy() fast path).
    bool m_trivially_copyable = false;
    /// See Lifetime_ops.
    Lifetime_ops m_lifetime;
    /// S_STRUCT: fields in declaration order.
    std::vector<Field> m_fields;
    /// S_SLICE, S_POINTER, wrappers: element shape; null if #m_elem_or_null is used (or no element).
    Shape_getter m_elem_getter = nullptr;
    /// See #m_elem_getter.
    const Shape* m_elem_or_null = nullptr;
    /// S_SLICE only.
    Slice_ops m_slice;
    /// S_POINTER only.
    Pointer_ops m_pointer;
    /// See Wrapper.
    Wrapper m_wrapper = Wrapper::S_NONE;
    /// Non-S_NONE #m_wrapper only.
    Wrapper_ops m_wrapper_ops;
    /// See Closed_enum_check.
    Closed_enum_check m_closed_enum_check = nullptr;
    /// Both null unless the copy-to capability is present.
    Copy_to_ops m_copy_to;
    /// See Marshal_json_func.
    Marshal_json_func m_marshal_json = nullptr;
    /// Synthesized shapes: the shape this one was derived from (layout-identical); else null.
    const Shape* m_origin_or_null = nullptr;
  }; // struct Config

  // Constructors/destructor.

  /**
   * Constructs the shape.  Normally only shape_of() and Shape_transmuter do this.
   *
   * @param config
   *        Contents.
   */
  explicit Shape(Config&& config);

  /// Disallow copy (identity is by address).
  Shape(const Shape&) = delete;

  // Methods.

  /// Disallow copy (identity is by address).
  Shape& operator=(const Shape&) = delete;

  /**
   * Contents, e.g., for deriving a synthesized shape.
   * @return See above.
   */
  const Config& config() const;

  /**
   * Name (for logging).
   * @return See above.
   */
  const std::string& name() const;

  /**
   * Kind.
   * @return See above.
   */
  Kind kind() const;

  /**
   * `sizeof` of the described type.
   * @return See above.
   */
  size_t size() const;

  /**
   * `alignof` of the described type.
   * @return See above.
   */
  size_t alignment() const;

  /**
   * Whether a bytewise copy is a valid copy.
   * @return See above.
   */
  bool trivially_copyable() const;

  /**
   * Whether kind is one of the integer or floating-point kinds (not S_BOOL).
   * @return See above.
   */
  bool is_numeric() const;

  /**
   * Whether kind is S_BOOL, numeric, or S_STRING.
   * @return See above.
   */
  bool is_scalar() const;

  /**
   * Struct fields in declaration order; empty for non-structs.
   * @return See above.
   */
  const std::vector<Field>& fields() const;

  /**
   * Field with the given name, or null.
   *
   * @param name
   *        Field name.
   * @return See above.
   */
  const Field* field_or_null(util::String_view name) const;

  /**
   * Element shape of slices, pointee shape of pointers, wrapped shape of optional/required.  Must not be called
   * on other shapes.
   *
   * @return See above.
   */
  const Shape& elem() const;

  /**
   * For synthesized shapes, the shape this was derived from; else null.
   * @return See above.
   */
  const Shape* origin_or_null() const;

  /**
   * Whether `*this` and `other` are distinct shapes with the same underlying scalar representation, so that
   * a value of one can be copied into the other as-is: both S_STRING (all string-kind shapes are layout-identical
   * to `std::string`), or both the same bool/numeric kind.
   *
   * @param other
   *        The other shape.
   * @return See above.
   */
  bool same_representation(const Shape& other) const;

  /**
   * Default-constructs an object in raw storage of size() bytes aligned at alignment().
   * @param addr
   *        Storage.
   */
  void construct(void* addr) const;

  /**
   * Destroys the object at the address.
   * @param addr
   *        Object.
   */
  void destroy(void* addr) const;

  /**
   * Copy-assigns.
   * @param dst
   *        Live target object.
   * @param src
   *        Source object.
   */
  void copy_assign(void* dst, const void* src) const;

  /**
   * Whether the object equals the zero (default-constructed) value of its type; for structs, whether every
   * field is zero.
   *
   * @param addr
   *        Object.
   * @return See above.
   */
  bool is_zero(const void* addr) const;

  /**
   * S_STRUCT: whether every field is zero.  Used to implement is_zero() for structs.
   * @param addr
   *        Object.
   * @return See above.
   */
  bool fields_are_zero(const void* addr) const;

  /**
   * S_SLICE: element count.
   * @param addr
   *        Object.
   * @return See above.
   */
  size_t slice_size(const void* addr) const;

  /**
   * S_SLICE: first element.
   * @param addr
   *        Object.
   * @return See above.
   */
  const void* slice_data(const void* addr) const;

  /**
   * S_SLICE: first element.
   * @param addr
   *        Object.
   * @return See above.
   */
  void* slice_data(void* addr) const;

  /**
   * S_SLICE: resize to `n` default-constructed-where-new elements.
   * @param addr
   *        Object.
   * @param n
   *        Count.
   */
  void slice_resize(void* addr, size_t n) const;

  /**
   * S_POINTER: pointee address or null.
   * @param addr
   *        Object.
   * @return See above.
   */
  const void* pointee(const void* addr) const;

  /**
   * S_POINTER: allocates a default-constructed pointee and points at it.
   * @param addr
   *        Object.
   * @return Address of the new pointee.
   */
  void* reset_pointee(void* addr) const;

  /**
   * S_POINTER: `*dst` is made to point at `*src`'s pointee (shared, not copied).
   * @param dst
   *        Target pointer object.
   * @param src
   *        Source pointer object.
   */
  void share_pointer(void* dst, const void* src) const;

  /**
   * Whether the optional capability is present.
   * @return See above.
   */
  bool is_optional() const;

  /**
   * Whether the required capability is present.
   * @return See above.
   */
  bool is_required() const;

  /**
   * Wrapper shapes: whether a value is present.
   * @param addr
   *        Object.
   * @return See above.
   */
  bool wrapper_has_value(const void* addr) const;

  /**
   * Wrapper shapes: address of the present value (must be present).
   * @param addr
   *        Object.
   * @return See above.
   */
  const void* wrapped_value(const void* addr) const;

  /**
   * Wrapper shapes: makes a default-constructed value present.
   * @param addr
   *        Object.
   * @return Address of the value.
   */
  void* emplace_wrapped(void* addr) const;

  /**
   * Whether the closed-enumeration capability is present.
   * @return See above.
   */
  bool is_closed_enum() const;

  /**
   * Closed enumerations: whether the string is a declared member.
   * @param value
   *        Candidate.
   * @return See above.
   */
  bool is_closed_enum_member(const std::string& value) const;

  /**
   * Whether the copy-to capability is present.
   * @return See above.
   */
  bool has_copy_to() const;

  /**
   * Copy-to capability: whether values of `*this` can produce values of `dst_shape`.
   * @param dst_shape
   *        Destination shape.
   * @return See above.
   */
  bool can_copy_to(const Shape& dst_shape) const;

  /**
   * Copy-to capability: produce.
   *
   * @param src
   *        Source object (of `*this` shape).
   * @param dst_shape
   *        Destination shape; can_copy_to() must be `true` for it.
   * @param dst
   *        Live destination object.
   */
  void copy_to(const void* src, const Shape& dst_shape, void* dst) const;

  /**
   * Whether the type marshals itself to JSON.
   * @return See above.
   */
  bool has_marshal_json() const;

  /**
   * Invokes the custom JSON marshal hook.
   *
   * @param addr
   *        Object.
   * @param target
   *        Where to write.
   */
  void marshal_json(const void* addr, Json* target) const;

private:
  // Data.

  /// Everything.
  const Config m_config;
}; // class Shape

// Free functions.

/**
 * Prints the shape's name.
 *
 * @relatesalso Shape
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, const Shape& val);

/**
 * Prints the kind's symbolic name sans `S_`.
 *
 * @param os
 *        Stream to which to write.
 * @param val
 *        Object to serialize.
 * @return `os`.
 */
std::ostream& operator<<(std::ostream& os, Kind val);

} // namespace keyval
