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
#include "keyval/resolver.hpp"
#include "keyval/copier_cache.hpp"
#include "keyval/shape_of.hpp"
#include <flow/error/error.hpp>
#include <boost/make_shared.hpp>
#include <algorithm>

namespace keyval
{

namespace
{

// Types.

/// One row of the domain pair table.
struct Domain_entry
{
  // Data.

  /// Destination shape.
  const Shape* m_dst;
  /// Source shape.
  const Shape* m_src;
  /// The pair.
  Converter::Domain_pair m_pair;
};

// Free functions.

/**
 * The domain pair for (dst, src), if any.
 *
 * @param dst_shape
 *        Destination shape.
 * @param src_shape
 *        Source shape.
 * @param pair
 *        Set on success.
 * @return Whether one was found.
 */
bool find_domain_pair(const Shape& dst_shape, const Shape& src_shape, Converter::Domain_pair* pair)
{
  using Domain_pair = Converter::Domain_pair;
  using Time_ptr = boost::shared_ptr<Time_point>;

  static const std::vector<Domain_entry> s_table
    {
      { &shape_of<Proto_timestamp_ptr>(), &shape_of<Time_point>(), Domain_pair::S_TIME_TO_TIMESTAMP },
      { &shape_of<Proto_timestamp_ptr>(), &shape_of<Time_ptr>(), Domain_pair::S_TIME_PTR_TO_TIMESTAMP },
      { &shape_of<Time_point>(), &shape_of<Proto_timestamp_ptr>(), Domain_pair::S_TIMESTAMP_TO_TIME },
      { &shape_of<Time_ptr>(), &shape_of<Proto_timestamp_ptr>(), Domain_pair::S_TIMESTAMP_TO_TIME_PTR },
      { &shape_of<Proto_timestamp_ptr>(), &shape_of<boost::optional<Time_point>>(),
        Domain_pair::S_OPTIONAL_TIME_TO_TIMESTAMP },
      { &shape_of<boost::optional<Time_point>>(), &shape_of<Proto_timestamp_ptr>(),
        Domain_pair::S_TIMESTAMP_TO_OPTIONAL_TIME },
      { &shape_of<Date>(), &shape_of<Proto_timestamp_ptr>(), Domain_pair::S_TIMESTAMP_TO_DATE },
      { &shape_of<Proto_timestamp_ptr>(), &shape_of<Date>(), Domain_pair::S_DATE_TO_TIMESTAMP },
      { &shape_of<std::string>(), &shape_of<Uuid>(), Domain_pair::S_UUID_TO_STRING },
      { &shape_of<Uuid>(), &shape_of<std::string>(), Domain_pair::S_STRING_TO_UUID },
      { &shape_of<std::string>(), &shape_of<Ulid>(), Domain_pair::S_ULID_TO_STRING },
      { &shape_of<Ulid>(), &shape_of<std::string>(), Domain_pair::S_STRING_TO_ULID },
      { &shape_of<std::string>(), &shape_of<Decimal>(), Domain_pair::S_DECIMAL_TO_STRING },
      { &shape_of<Decimal>(), &shape_of<std::string>(), Domain_pair::S_STRING_TO_DECIMAL },
      { &shape_of<std::string>(), &shape_of<Language_tag>(), Domain_pair::S_LANGUAGE_TAG_TO_STRING },
      { &shape_of<Language_tag>(), &shape_of<std::string>(), Domain_pair::S_STRING_TO_LANGUAGE_TAG }
    };

  const auto it = std::find_if(s_table.begin(), s_table.end(), [&](const Domain_entry& entry)
  {
    return (entry.m_dst == &dst_shape) && (entry.m_src == &src_shape);
  });
  if (it == s_table.end())
  {
    return false;
  }
  *pair = it->m_pair;
  return true;
}

/**
 * Whether the name is in the list.
 *
 * @param names
 *        List.
 * @param name
 *        Name.
 * @return See above.
 */
bool contains(const std::vector<std::string>& names, const std::string& name)
{
  return std::find(names.begin(), names.end(), name) != names.end();
}

/**
 * Whether a struct field takes part in copying and map conversion: exported and not tagged `kv:"-"`.
 *
 * @param field
 *        Field.
 * @return See above.
 */
bool field_is_copyable(const Field& field)
{
  if (!field.exported())
  {
    return false;
  }
  const auto kv_tag = field.tag_or_null("kv");
  return (!kv_tag) || (*kv_tag != "-");
}

} // namespace (anon)

// Implementations.

Conversion_resolver::Conversion_resolver(flow::log::Logger* logger_ptr, Copier_cache* cache_or_null) :
  flow::log::Log_context(logger_ptr, Log_component::S_COPIER),
  m_cache_or_null(cache_or_null)
{
  // Done.
}

Converter::Ptr Conversion_resolver::resolve(const Shape& dst_shape, const Shape& src_shape,
                                            Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Converter::Ptr, resolve, dst_shape, src_shape, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  Pair_stack in_progress;
  auto converter = resolve_impl(dst_shape, src_shape, &in_progress, err_code);
  if (converter)
  {
    err_code->clear();
  }
  return converter;
}

Struct_copier::Ptr Conversion_resolver::compile_struct(const Shape& dst_shape, const Shape& src_shape,
                                                       const Copier_options& options, Error_code* err_code) const
{
  FLOW_ERROR_EXEC_AND_THROW_ON_ERROR(Struct_copier::Ptr, compile_struct, dst_shape, src_shape, options, _1);
  // ^-- Call ourselves and return if err_code is null.  If got to present line, err_code is not null.

  Pair_stack in_progress;
  return compile_struct_impl(dst_shape, src_shape, options, &in_progress, err_code);
}

Converter::Ptr Conversion_resolver::resolve_impl(const Shape& dst_shape, const Shape& src_shape,
                                                 Pair_stack* in_progress, Error_code* err_code) const
{
  using Op = Converter::Op;

  const auto dst_kind = dst_shape.kind();
  const auto src_kind = src_shape.kind();

  // Rule 1.
  if (&dst_shape == &src_shape)
  {
    return make_converter(dst_shape.trivially_copyable() ? Op::S_RAW_COPY : Op::S_COPY_ASSIGN,
                          dst_shape, src_shape);
  }
  // Rule 2.
  if ((dst_kind == Kind::S_STRING) && (src_kind == Kind::S_STRING) && dst_shape.is_closed_enum())
  {
    return make_converter(Op::S_CLOSED_ENUM, dst_shape, src_shape);
  }
  // Rule 3.
  if (dst_shape.same_representation(src_shape))
  {
    return make_converter(Op::S_ALIAS_COPY, dst_shape, src_shape);
  }
  // Rule 4.
  if (dst_shape.is_numeric() && src_shape.is_numeric())
  {
    return make_converter(Op::S_NUMERIC_CONVERT, dst_shape, src_shape);
  }
  const auto& bytes_shape = shape_of<std::vector<uint8_t>>();
  if ((&dst_shape == &bytes_shape) && (src_kind == Kind::S_STRING))
  {
    return make_converter(Op::S_STRING_TO_BYTES, dst_shape, src_shape);
  }
  if ((dst_kind == Kind::S_STRING) && (&src_shape == &bytes_shape))
  {
    return make_converter(Op::S_BYTES_TO_STRING, dst_shape, src_shape);
  }
  // Rule 5.
  {
    Converter::Operands operands;
    if (find_domain_pair(dst_shape, src_shape, &operands.m_domain))
    {
      return make_converter(Op::S_DOMAIN, dst_shape, src_shape, std::move(operands));
    }
  }
  // Rule 6.
  if (src_shape.has_copy_to())
  {
    if (!src_shape.can_copy_to(dst_shape))
    {
      FLOW_LOG_WARNING("Resolver: source [" << src_shape << "] has the copy-to capability but refuses "
                       "destination [" << dst_shape << "].");
      *err_code = error::Code::S_COPY_TO_TARGET_UNSUPPORTED;
      return Converter::Ptr();
    }
    return make_converter(Op::S_COPY_TO, dst_shape, src_shape);
  }
  // Rule 7.
  if ((dst_kind == Kind::S_POINTER) && (src_kind == Kind::S_POINTER))
  {
    if (&dst_shape.elem() == &src_shape.elem())
    {
      return make_converter(Op::S_POINTER_SHARE, dst_shape, src_shape);
    }
    return make_nesting_converter(Op::S_POINTER_DEEP, dst_shape, src_shape, dst_shape.elem(), src_shape.elem(),
                                  in_progress, err_code);
  }
  // Rule 8.
  if ((dst_kind == Kind::S_SLICE) && (src_kind == Kind::S_SLICE))
  {
    return make_nesting_converter(Op::S_SLICE, dst_shape, src_shape, dst_shape.elem(), src_shape.elem(),
                                  in_progress, err_code);
  }
  // Rule 9.
  if (src_shape.is_optional() && (dst_kind == Kind::S_POINTER))
  {
    return make_nesting_converter(Op::S_OPTIONAL_TO_POINTER, dst_shape, src_shape,
                                  dst_shape.elem(), src_shape.elem(), in_progress, err_code);
  }
  // Rule 10.
  if (dst_shape.is_optional() && (src_kind == Kind::S_POINTER))
  {
    return make_nesting_converter(Op::S_POINTER_TO_OPTIONAL, dst_shape, src_shape,
                                  dst_shape.elem(), src_shape.elem(), in_progress, err_code);
  }
  // Rule 11.
  if (dst_shape.is_optional())
  {
    return make_nesting_converter(Op::S_VALUE_TO_OPTIONAL, dst_shape, src_shape,
                                  dst_shape.elem(), src_shape, in_progress, err_code);
  }
  // Rule 12.
  if (src_shape.is_required())
  {
    return make_nesting_converter(Op::S_REQUIRED_UNWRAP, dst_shape, src_shape,
                                  dst_shape, src_shape.elem(), in_progress, err_code);
  }
  // Rule 13.
  if (dst_kind == Kind::S_POINTER)
  {
    return make_nesting_converter(Op::S_BOX_INTO_POINTER, dst_shape, src_shape,
                                  dst_shape.elem(), src_shape, in_progress, err_code);
  }
  // Rule 14.
  if (src_kind == Kind::S_POINTER)
  {
    return make_nesting_converter(Op::S_DEREF_POINTER, dst_shape, src_shape,
                                  dst_shape, src_shape.elem(), in_progress, err_code);
  }
  // Rule 15.
  if ((dst_kind == Kind::S_STRUCT) && (src_kind == Kind::S_STRUCT))
  {
    Converter::Operands operands;
    operands.m_struct_copier = nested_struct_copier(dst_shape, src_shape, in_progress, err_code);
    if (!operands.m_struct_copier)
    {
      return Converter::Ptr();
    }
    return make_converter(Op::S_STRUCT, dst_shape, src_shape, std::move(operands));
  }
  // Rule 16.
  if ((dst_kind == Kind::S_MAP) && (src_kind == Kind::S_STRUCT))
  {
    Converter::Operands operands;
    operands.m_map_keys = map_keys(src_shape);
    return make_converter(Op::S_STRUCT_TO_MAP, dst_shape, src_shape, std::move(operands));
  }
  // Rule 17.
  if ((src_kind == Kind::S_MAP) && (dst_kind == Kind::S_STRUCT))
  {
    Converter::Operands operands;
    operands.m_map_keys = map_keys(dst_shape);
    return make_converter(Op::S_MAP_TO_STRUCT, dst_shape, src_shape, std::move(operands));
  }

  FLOW_LOG_WARNING("Resolver: no conversion rule applies to [" << dst_shape << "] (kind [" << dst_kind << "]) <- "
                   "[" << src_shape << "] (kind [" << src_kind << "]).");
  *err_code = error::Code::S_UNSUPPORTED_TYPE_PAIR;
  return Converter::Ptr();
} // Conversion_resolver::resolve_impl()

Struct_copier::Ptr Conversion_resolver::compile_struct_impl(const Shape& dst_shape, const Shape& src_shape,
                                                            const Copier_options& options, Pair_stack* in_progress,
                                                            Error_code* err_code) const
{
  if ((dst_shape.kind() != Kind::S_STRUCT) || (src_shape.kind() != Kind::S_STRUCT))
  {
    FLOW_LOG_WARNING("Resolver: cannot compile struct copier [" << dst_shape << "] <- [" << src_shape << "]: "
                     "kinds are [" << dst_shape.kind() << "] <- [" << src_shape.kind() << "].");
    *err_code = error::Code::S_TYPE_NOT_STRUCT;
    return Struct_copier::Ptr();
  }
  // else

  FLOW_LOG_TRACE("Resolver: compiling struct copier [" << dst_shape << "] <- [" << src_shape << "] "
                 "(nesting depth [" << in_progress->size() << "]).");

  in_progress->push_back(Type_pair{ &dst_shape, &src_shape });
  std::vector<Struct_copier::Field_converter> field_converters;
  field_converters.reserve(src_shape.fields().size());
  bool ok = true;
  for (const auto& src_field : src_shape.fields())
  {
    const auto& name = src_field.name();
    if ((!field_is_copyable(src_field))
        || contains(options.m_fields_to_exclude, name)
        || (options.m_fields_to_include && (!contains(*options.m_fields_to_include, name))))
    {
      FLOW_LOG_TRACE("Resolver: skipping source field [" << name << "].");
      continue;
    }
    // else

    const auto dst_field = dst_shape.field_or_null(name);
    if ((!dst_field) || (!dst_field->exported()))
    {
      if (options.m_omit_unmatched_fields)
      {
        FLOW_LOG_TRACE("Resolver: source field [" << name << "] has no destination counterpart; omitting.");
        continue;
      }
      // else
      FLOW_LOG_WARNING("Resolver: source field [" << name << "] of [" << src_shape << "] has no same-named "
                       "field in [" << dst_shape << "].");
      *err_code = error::Code::S_FIELD_NOT_FOUND;
      ok = false;
      break;
    }
    // else

    auto converter = resolve_impl(dst_field->shape(), src_field.shape(), in_progress, err_code);
    if (!converter)
    {
      FLOW_LOG_WARNING("Resolver: field [" << name << "] of [" << dst_shape << "] <- [" << src_shape << "] "
                       "cannot be converted ([" << *err_code << "] [" << err_code->message() << "]).");
      ok = false;
      break;
    }
    // else
    field_converters.push_back({ std::move(converter), dst_field->offset(), src_field.offset(), name });
  } // for (src_field)
  in_progress->pop_back();

  if (!ok)
  {
    return Struct_copier::Ptr();
  }
  // else

  err_code->clear();
  return boost::make_shared<Struct_copier>(get_logger(), dst_shape, src_shape, std::move(field_converters));
} // Conversion_resolver::compile_struct_impl()

Struct_copier::Ptr Conversion_resolver::nested_struct_copier(const Shape& dst_shape, const Shape& src_shape,
                                                             Pair_stack* in_progress, Error_code* err_code) const
{
  const Type_pair key{ &dst_shape, &src_shape };
  if (std::find(in_progress->begin(), in_progress->end(), key) != in_progress->end())
  {
    FLOW_LOG_WARNING("Resolver: struct pair " << key << " refers to itself (directly or through nesting); "
                     "refusing to compile it.");
    *err_code = error::Code::S_CIRCULAR_TYPE_REFERENCE;
    return Struct_copier::Ptr();
  }
  // else

  const auto compile_func = [&](Error_code* actual_err_code) -> Struct_copier::Ptr
  {
    return compile_struct_impl(dst_shape, src_shape, Copier_options(), in_progress, actual_err_code);
  };
  return m_cache_or_null ? m_cache_or_null->get_or_compile(key, compile_func, err_code)
                         : compile_func(err_code);
}

Converter::Ptr Conversion_resolver::make_converter(Converter::Op op, const Shape& dst_shape, const Shape& src_shape,
                                                   Converter::Operands&& operands) const
{
  FLOW_LOG_TRACE("Resolver: [" << dst_shape << "] <- [" << src_shape << "]: operation [" << op << "].");
  return boost::make_shared<Converter>(get_logger(), op, dst_shape, src_shape, std::move(operands));
}

Converter::Ptr Conversion_resolver::make_nesting_converter(Converter::Op op,
                                                           const Shape& dst_shape, const Shape& src_shape,
                                                           const Shape& dst_elem_shape, const Shape& src_elem_shape,
                                                           Pair_stack* in_progress, Error_code* err_code) const
{
  Converter::Operands operands;
  operands.m_elem = resolve_impl(dst_elem_shape, src_elem_shape, in_progress, err_code);
  if (!operands.m_elem)
  {
    return Converter::Ptr();
  }
  return make_converter(op, dst_shape, src_shape, std::move(operands));
}

std::vector<Converter::Map_key> Conversion_resolver::map_keys(const Shape& struct_shape) // Static.
{
  std::vector<Converter::Map_key> keys;
  for (const auto& field : struct_shape.fields())
  {
    if (field_is_copyable(field))
    {
      const auto key_tag = field.tag_or_null("key");
      keys.push_back({ key_tag ? *key_tag : field.name(), &field });
    }
  }
  return keys;
}

} // namespace keyval
