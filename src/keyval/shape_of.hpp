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

#include "keyval/shape.hpp"
#include "keyval/domain.hpp"
#include "keyval/value.hpp"
#include <boost/core/demangle.hpp>
#include <boost/movelib/unique_ptr.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/make_shared.hpp>
#include <boost/optional.hpp>
#include <new>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace keyval
{

// Types.

/**
 * Describes C++ type `T` to the conversion engine: a specialization supplies
 *   - `static std::string name()`: human-readable name (logging only);
 *   - `static bool is_zero(const T&)`: whether the value is the zero value of the type;
 *   - `static Shape::Config config()`: the full description.
 *
 * Specializations exist for: arithmetic types, `enum`s (numeric kinds), `std::string`, Named_string,
 * Closed_enum, `std::vector<E>`, `boost::shared_ptr<E>`, `boost::optional<E>`, Required, #Dyn_map, the leaf domain
 * types (#Time_point, #Date, #Uuid, #Decimal, Ulid, Language_tag, #Proto_timestamp), and user record types
 * (those with `static void describe_shape(Struct_shape_builder<T>*)`; see Struct_shape_builder).  A type without
 * one cannot be used with keyval (compile error).
 *
 * @tparam T
 *         Described type.
 * @tparam Enable
 *         SFINAE hook for partial specializations.
 */
template<typename T, typename Enable = void>
struct Shape_traits;

/**
 * Collects the fields of a user record type `T` when `T`'s Shape is built.  A record type opts in by declaring
 *
 *   ~~~
 *   static void describe_shape(keyval::Struct_shape_builder<Car>* builder)
 *   {
 *     builder->field("Make", &Car::m_make, { { "json", "make" } })
 *             .field("Engine", &Car::m_engine, { { "json", "engine" } })
 *             .unexported_field("secret", &Car::m_secret);
 *   }
 *   ~~~
 *
 * in declaration order of the fields.  Field names are what copiers match between record types.  `T` must be
 * default-constructible (one prototype object is created to compute field offsets).
 *
 * @tparam T
 *         The record type.
 */
template<typename T>
class Struct_shape_builder
{
public:
  // Constructors/destructor.

  /// Creates the prototype used to compute offsets.
  Struct_shape_builder();

  // Methods.

  /**
   * Adds an exported field.
   *
   * @tparam F
   *         Field type; must have a Shape.
   * @param name
   *        Field name.
   * @param member
   *        The member.
   * @param tags
   *        Tags.
   * @return `*this`.
   */
  template<typename F>
  Struct_shape_builder& field(std::string name, F T::* member, std::vector<Field_tag> tags = {});

  /**
   * Adds an unexported field: invisible to copiers, and making `T` ineligible for shape transmutation.
   *
   * @tparam F
   *         See field().
   * @param name
   *        See field().
   * @param member
   *        See field().
   * @param tags
   *        See field().
   * @return `*this`.
   */
  template<typename F>
  Struct_shape_builder& unexported_field(std::string name, F T::* member, std::vector<Field_tag> tags = {});

  /**
   * Moves out the collected fields.
   * @return See above.
   */
  std::vector<Field> release_fields();

private:
  // Methods.

  /**
   * Byte offset of the member inside `T`.
   *
   * @tparam F
   *         See field().
   * @param member
   *        The member.
   * @return See above.
   */
  template<typename F>
  size_t offset_of(F T::* member) const;

  /**
   * Adds a field.
   *
   * @tparam F
   *         See field().
   * @param name
   *        See field().
   * @param member
   *        See field().
   * @param tags
   *        See field().
   * @param exported
   *        See Field.
   */
  template<typename F>
  void add_field(std::string name, F T::* member, std::vector<Field_tag>&& tags, bool exported);

  // Data.

  /// Default-constructed `T` whose member addresses yield offsets.
  boost::movelib::unique_ptr<T> m_prototype;

  /// Collected fields.
  std::vector<Field> m_fields;
}; // class Struct_shape_builder

// Free functions.

/**
 * The one Shape of C++ type `T`, built on first call (thread-safely) from `Shape_traits<T>` and never destroyed
 * before exit.
 *
 * @tparam T
 *         Type with a Shape_traits specialization.
 * @return See above.
 */
template<typename T>
const Shape& shape_of();

} // namespace keyval

namespace keyval::detail
{

// Types.

/// Whether `T` is a user record type.
template<typename T, typename = void>
struct Has_describe_shape : std::false_type {};

/// Whether `T` is a user record type.
template<typename T>
struct Has_describe_shape<T, std::void_t<decltype(T::describe_shape(std::declval<Struct_shape_builder<T>*>()))>> :
  std::true_type {};

/// Whether `T` marshals itself: `void marshal_json(Json*) const`.
template<typename T, typename = void>
struct Has_marshal_json : std::false_type {};

/// Whether `T` marshals itself: `void marshal_json(Json*) const`.
template<typename T>
struct Has_marshal_json<T, std::void_t<decltype(std::declval<const T&>().marshal_json(std::declval<Json*>()))>> :
  std::true_type {};

/**
 * Whether `T` has the copy-to capability: `static bool can_copy_to(const Shape&)` and
 * `void copy_to(const Shape&, void*) const`.
 */
template<typename T, typename = void>
struct Has_copy_to : std::false_type {};

/// See primary template.
template<typename T>
struct Has_copy_to<T, std::void_t<decltype(T::can_copy_to(std::declval<const Shape&>())),
                                  decltype(std::declval<const T&>().copy_to(std::declval<const Shape&>(),
                                                                            std::declval<void*>()))>> :
  std::true_type {};

// Free functions.

/**
 * Kind of an arithmetic type.
 *
 * @tparam T
 *         Arithmetic type.
 * @return See above.
 */
template<typename T>
constexpr Kind arithmetic_kind()
{
  static_assert(std::is_arithmetic_v<T>, "Arithmetic types only.");

  if constexpr (std::is_same_v<T, bool>)
  {
    return Kind::S_BOOL;
  }
  else if constexpr (std::is_floating_point_v<T>)
  {
    static_assert((sizeof(T) == 4) || (sizeof(T) == 8), "Only 32- and 64-bit floating point is supported.");
    return (sizeof(T) == 4) ? Kind::S_FLOAT32 : Kind::S_FLOAT64;
  }
  else if constexpr (std::is_signed_v<T>)
  {
    return (sizeof(T) == 1) ? Kind::S_INT8 : (sizeof(T) == 2) ? Kind::S_INT16
                                           : (sizeof(T) == 4) ? Kind::S_INT32 : Kind::S_INT64;
  }
  else
  {
    return (sizeof(T) == 1) ? Kind::S_UINT8 : (sizeof(T) == 2) ? Kind::S_UINT16
                                            : (sizeof(T) == 4) ? Kind::S_UINT32 : Kind::S_UINT64;
  }
}

/**
 * Lower-case name of a scalar kind, e.g., `"int32"`.
 *
 * @param kind
 *        Kind.
 * @return See above.
 */
const char* kind_name(Kind kind);

/**
 * Demangled name of `T`.
 *
 * @tparam T
 *         Type.
 * @return See above.
 */
template<typename T>
std::string type_name()
{
  return boost::core::demangle(typeid(T).name());
}

/**
 * The part of Shape::Config common to all C++ types: name, kind, size, alignment, lifetime operations.
 *
 * @tparam T
 *         Described type.
 * @param kind
 *        Kind.
 * @return See above.
 */
template<typename T>
Shape::Config base_config(Kind kind)
{
  Shape::Config config;
  config.m_name = Shape_traits<T>::name();
  config.m_kind = kind;
  config.m_size = sizeof(T);
  config.m_alignment = alignof(T);
  config.m_trivially_copyable = std::is_trivially_copyable_v<T>;
  config.m_lifetime.m_construct = [](void* addr) { new (addr) T(); };
  config.m_lifetime.m_destroy = [](void* addr) { static_cast<T*>(addr)->~T(); };
  config.m_lifetime.m_copy_assign = [](void* dst, const void* src)
  {
    *static_cast<T*>(dst) = *static_cast<const T*>(src);
  };
  config.m_lifetime.m_is_zero = [](const void* addr) -> bool
  {
    return Shape_traits<T>::is_zero(*static_cast<const T*>(addr));
  };
  return config;
}

/**
 * Shape::Config of a string-kind type, which must be layout-identical to `std::string`.
 *
 * @tparam T
 *         `std::string`, Named_string, or Closed_enum.
 * @return See above.
 */
template<typename T>
Shape::Config string_config()
{
  static_assert(std::is_same_v<T, std::string>
                  || (std::is_standard_layout_v<T> && (sizeof(T) == sizeof(std::string))
                      && (alignof(T) == alignof(std::string))),
                "String-kind types must be layout-identical to std::string.");
  return base_config<T>(Kind::S_STRING);
}

/**
 * Adds capabilities detected on a user record type.
 *
 * @tparam T
 *         The record type.
 * @param config
 *        Where to add them.
 */
template<typename T>
void add_record_capabilities(Shape::Config* config)
{
  if constexpr (Has_marshal_json<T>::value)
  {
    config->m_marshal_json = [](const void* addr, Json* target)
    {
      static_cast<const T*>(addr)->marshal_json(target);
    };
  }
  if constexpr (Has_copy_to<T>::value)
  {
    config->m_copy_to.m_can_copy_to = [](const Shape& dst_shape) -> bool { return T::can_copy_to(dst_shape); };
    config->m_copy_to.m_copy_to = [](const void* src, const Shape& dst_shape, void* dst)
    {
      static_cast<const T*>(src)->copy_to(dst_shape, dst);
    };
  }
}

/**
 * @internal
 * JSON marshal hooks of the leaf domain types (need the full JSON library, hence out-of-line).
 */
void marshal_time_json(const void* addr, Json* target);
/// See marshal_time_json().
void marshal_date_json(const void* addr, Json* target);
/// See marshal_time_json().
void marshal_uuid_json(const void* addr, Json* target);
/// See marshal_time_json().
void marshal_decimal_json(const void* addr, Json* target);
/// See marshal_time_json().
void marshal_ulid_json(const void* addr, Json* target);
/// See marshal_time_json().
void marshal_language_tag_json(const void* addr, Json* target);
/// See marshal_time_json().
void marshal_timestamp_json(const void* addr, Json* target);

/**
 * Config of a leaf domain type: opaque, with a custom JSON marshal hook.
 *
 * @tparam T
 *         Leaf type.
 * @param marshal_json
 *        Hook.
 * @return See above.
 */
template<typename T>
Shape::Config leaf_config(Shape::Marshal_json_func marshal_json)
{
  auto config = base_config<T>(Kind::S_OPAQUE);
  config.m_marshal_json = marshal_json;
  return config;
}

} // namespace keyval::detail

namespace keyval
{

// Types.

/// Arithmetic types.
template<typename T>
struct Shape_traits<T, std::enable_if_t<std::is_arithmetic_v<T>>>
{
  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return detail::kind_name(detail::arithmetic_kind<T>());
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const T& val)
  {
    return val == T();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    return detail::base_config<T>(detail::arithmetic_kind<T>());
  }
};

/// Enumerations: numeric kind of the underlying type; a distinct shape, so it aliases the underlying type.
template<typename T>
struct Shape_traits<T, std::enable_if_t<std::is_enum_v<T>>>
{
  /// Underlying type.
  using Underlying = std::underlying_type_t<T>;

  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return detail::type_name<T>();
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const T& val)
  {
    return Underlying(val) == Underlying();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    return detail::base_config<T>(detail::arithmetic_kind<Underlying>());
  }
};

/// The basic string.
template<>
struct Shape_traits<std::string>
{
  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return "string";
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const std::string& val)
  {
    return val.empty();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    return detail::string_config<std::string>();
  }
};

/// Named string types.
template<typename Tag>
struct Shape_traits<Named_string<Tag>>
{
  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return detail::type_name<Named_string<Tag>>();
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Named_string<Tag>& val)
  {
    return val.str().empty();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    return detail::string_config<Named_string<Tag>>();
  }
};

/// Closed enumerations.
template<typename Tag>
struct Shape_traits<Closed_enum<Tag>>
{
  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return detail::type_name<Closed_enum<Tag>>();
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Closed_enum<Tag>& val)
  {
    return val.str().empty();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    auto config = detail::string_config<Closed_enum<Tag>>();
    config.m_closed_enum_check = &Closed_enum<Tag>::is_member;
    return config;
  }
};

/// Slices.
template<typename E>
struct Shape_traits<std::vector<E>>
{
  static_assert(!std::is_same_v<E, bool>, "std::vector<bool> has no addressable elements; use uint8_t.");

  /// Described type.
  using Slice = std::vector<E>;

  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return "[]" + Shape_traits<E>::name();
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Slice& val)
  {
    return val.empty();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    auto config = detail::base_config<Slice>(Kind::S_SLICE);
    config.m_elem_getter = &shape_of<E>;
    config.m_slice.m_size = [](const void* addr) -> size_t { return static_cast<const Slice*>(addr)->size(); };
    config.m_slice.m_data = [](void* addr) -> void* { return static_cast<Slice*>(addr)->data(); };
    config.m_slice.m_const_data = [](const void* addr) -> const void*
    {
      return static_cast<const Slice*>(addr)->data();
    };
    config.m_slice.m_resize = [](void* addr, size_t n) { static_cast<Slice*>(addr)->resize(n); };
    return config;
  }
}; // struct Shape_traits<std::vector<E>>

/// Pointers.
template<typename E>
struct Shape_traits<boost::shared_ptr<E>>
{
  /// Described type.
  using Ptr = boost::shared_ptr<E>;

  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return '*' + Shape_traits<E>::name();
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Ptr& val)
  {
    return !val;
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    auto config = detail::base_config<Ptr>(Kind::S_POINTER);
    config.m_elem_getter = &shape_of<E>;
    config.m_pointer.m_get = [](const void* addr) -> const void* { return static_cast<const Ptr*>(addr)->get(); };
    config.m_pointer.m_reset_to_new = [](void* addr) -> void*
    {
      auto& ptr = *static_cast<Ptr*>(addr);
      ptr = boost::make_shared<E>();
      return ptr.get();
    };
    config.m_pointer.m_share = [](void* dst, const void* src)
    {
      *static_cast<Ptr*>(dst) = *static_cast<const Ptr*>(src);
    };
    return config;
  }
}; // struct Shape_traits<boost::shared_ptr<E>>

/// Optional capability.
template<typename E>
struct Shape_traits<boost::optional<E>>
{
  /// Described type.
  using Opt = boost::optional<E>;

  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return "optional<" + Shape_traits<E>::name() + '>';
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Opt& val)
  {
    return !val;
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    auto config = detail::base_config<Opt>(Kind::S_OPAQUE);
    config.m_elem_getter = &shape_of<E>;
    config.m_wrapper = Shape::Wrapper::S_OPTIONAL;
    config.m_wrapper_ops.m_has_value = [](const void* addr) -> bool { return bool(*static_cast<const Opt*>(addr)); };
    config.m_wrapper_ops.m_value = [](const void* addr) -> const void*
    {
      return &(**static_cast<const Opt*>(addr));
    };
    config.m_wrapper_ops.m_emplace = [](void* addr) -> void*
    {
      auto& opt = *static_cast<Opt*>(addr);
      opt.emplace();
      return &(*opt);
    };
    return config;
  }
}; // struct Shape_traits<boost::optional<E>>

/// Required capability.
template<typename E>
struct Shape_traits<Required<E>>
{
  /// Described type.
  using Req = Required<E>;

  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return "required<" + Shape_traits<E>::name() + '>';
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Req& val)
  {
    return !val.has_value();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    auto config = detail::base_config<Req>(Kind::S_OPAQUE);
    config.m_elem_getter = &shape_of<E>;
    config.m_wrapper = Shape::Wrapper::S_REQUIRED;
    config.m_wrapper_ops.m_has_value = [](const void* addr) -> bool
    {
      return static_cast<const Req*>(addr)->has_value();
    };
    config.m_wrapper_ops.m_value = [](const void* addr) -> const void*
    {
      return &(static_cast<const Req*>(addr)->value());
    };
    config.m_wrapper_ops.m_emplace = [](void* addr) -> void* { return &(static_cast<Req*>(addr)->emplace()); };
    return config;
  }
}; // struct Shape_traits<Required<E>>

/// The dynamic map.
template<>
struct Shape_traits<Dyn_map>
{
  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return "map[string]any";
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Dyn_map& val)
  {
    return val.empty();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    return detail::base_config<Dyn_map>(Kind::S_MAP);
  }
};

/// Time value leaf.
template<>
struct Shape_traits<Time_point>
{
  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return "time";
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Time_point& val)
  {
    return val.is_not_a_date_time();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    return detail::leaf_config<Time_point>(&detail::marshal_time_json);
  }
};

/// Date leaf.
template<>
struct Shape_traits<Date>
{
  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return "date";
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Date& val)
  {
    return val.is_not_a_date();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    return detail::leaf_config<Date>(&detail::marshal_date_json);
  }
};

/// UUID leaf.
template<>
struct Shape_traits<Uuid>
{
  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return "uuid";
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Uuid& val)
  {
    return val.is_nil();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    return detail::leaf_config<Uuid>(&detail::marshal_uuid_json);
  }
};

/// Decimal leaf.
template<>
struct Shape_traits<Decimal>
{
  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return "decimal";
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Decimal& val)
  {
    return val.is_zero();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    return detail::leaf_config<Decimal>(&detail::marshal_decimal_json);
  }
};

/// ULID leaf.
template<>
struct Shape_traits<Ulid>
{
  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return "ulid";
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Ulid& val)
  {
    return val.is_zero();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    return detail::leaf_config<Ulid>(&detail::marshal_ulid_json);
  }
};

/// Language tag leaf.
template<>
struct Shape_traits<Language_tag>
{
  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return "language_tag";
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Language_tag& val)
  {
    return val.is_zero();
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    return detail::leaf_config<Language_tag>(&detail::marshal_language_tag_json);
  }
};

/// Protocol timestamp leaf (normally seen as the pointee of #Proto_timestamp_ptr).
template<>
struct Shape_traits<Proto_timestamp>
{
  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return "timestamp";
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const Proto_timestamp& val)
  {
    return (val.seconds() == 0) && (val.nanos() == 0);
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    return detail::leaf_config<Proto_timestamp>(&detail::marshal_timestamp_json);
  }
};

/// User record types.
template<typename T>
struct Shape_traits<T, std::enable_if_t<detail::Has_describe_shape<T>::value>>
{
  /**
   * See Shape_traits.
   * @return See above.
   */
  static std::string name()
  {
    return detail::type_name<T>();
  }

  /**
   * See Shape_traits.
   * @param val
   *        Value.
   * @return See above.
   */
  static bool is_zero(const T& val)
  {
    return shape_of<T>().fields_are_zero(&val);
  }

  /**
   * See Shape_traits.
   * @return See above.
   */
  static Shape::Config config()
  {
    auto config = detail::base_config<T>(Kind::S_STRUCT);
    Struct_shape_builder<T> builder;
    T::describe_shape(&builder);
    config.m_fields = builder.release_fields();
    detail::add_record_capabilities<T>(&config);
    return config;
  }
}; // struct Shape_traits<T> (records)

// Template implementations.

template<typename T>
const Shape& shape_of()
{
  static const Shape s_shape(Shape_traits<T>::config());
  return s_shape;
}

template<typename T>
Struct_shape_builder<T>::Struct_shape_builder() :
  m_prototype(new T())
{
  // Done.
}

template<typename T>
template<typename F>
Struct_shape_builder<T>& Struct_shape_builder<T>::field(std::string name, F T::* member,
                                                        std::vector<Field_tag> tags)
{
  add_field(std::move(name), member, std::move(tags), true);
  return *this;
}

template<typename T>
template<typename F>
Struct_shape_builder<T>& Struct_shape_builder<T>::unexported_field(std::string name, F T::* member,
                                                                   std::vector<Field_tag> tags)
{
  add_field(std::move(name), member, std::move(tags), false);
  return *this;
}

template<typename T>
template<typename F>
void Struct_shape_builder<T>::add_field(std::string name, F T::* member, std::vector<Field_tag>&& tags,
                                        bool exported)
{
  m_fields.emplace_back(std::move(name), &shape_of<std::remove_cv_t<F>>, offset_of(member), std::move(tags),
                        exported);
}

template<typename T>
std::vector<Field> Struct_shape_builder<T>::release_fields()
{
  return std::move(m_fields);
}

template<typename T>
template<typename F>
size_t Struct_shape_builder<T>::offset_of(F T::* member) const
{
  const auto base = reinterpret_cast<const unsigned char*>(m_prototype.get());
  return size_t(reinterpret_cast<const unsigned char*>(&(m_prototype.get()->*member)) - base);
}

} // namespace keyval
