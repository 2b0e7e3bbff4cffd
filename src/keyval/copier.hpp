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

#include "keyval/resolver.hpp"
#include "keyval/copier_cache.hpp"
#include "keyval/conversion_registry.hpp"
#include "keyval/shape_of.hpp"
#include <boost/make_shared.hpp>
#include <vector>

namespace keyval
{

// Types.

/**
 * Typed wrapper around a Converter for values of `S` into values of `D`; obtained from
 * Copier::build_value_copier().  Immutable; methods may be invoked concurrently.
 *
 * @tparam D
 *         Destination type.
 * @tparam S
 *         Source type.
 */
template<typename D, typename S>
class Value_copier
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to immutable `*this`.
  using Ptr = boost::shared_ptr<const Value_copier>;

  // Constructors/destructor.

  /**
   * Wraps the converter.
   * @param converter
   *        Converter `D` <- `S`.
   */
  explicit Value_copier(Converter::Ptr converter);

  // Methods.

  /**
   * Converts `src` into `*dst`.
   *
   * @param dst
   *        Destination.
   * @param src
   *        Source.
   * @param err_code
   *        See Converter::convert().
   * @return See Converter::convert().
   */
  bool copy(D* dst, const S& src, Error_code* err_code = 0) const;

  /**
   * Converts `src` into a new `D`.
   *
   * @param src
   *        Source.
   * @param err_code
   *        See Converter::convert().
   * @return The result; on failure its contents are unspecified.
   */
  D copy_value(const S& src, Error_code* err_code = 0) const;

  /**
   * Converts `src` into a newly allocated `D`.
   *
   * @param src
   *        Source.
   * @param err_code
   *        See Converter::convert().
   * @return The result; null if and only if `*err_code` is set to truthy.
   */
  boost::shared_ptr<D> copy_ptr(const S& src, Error_code* err_code = 0) const;

private:
  // Data.

  /// The converter.
  const Converter::Ptr m_converter;
}; // class Value_copier

/**
 * Element-wise conversion of `std::vector<S>` into `std::vector<D>`; the first failing element aborts the whole
 * conversion.  Obtained from Copier::build_slice_copier().
 *
 * @tparam D
 *         Destination element type.
 * @tparam S
 *         Source element type.
 */
template<typename D, typename S>
class Slice_copier
{
public:
  // Types.

  /// Short-hand for ref-counted pointer to immutable `*this`.
  using Ptr = boost::shared_ptr<const Slice_copier>;

  // Constructors/destructor.

  /**
   * Wraps the element converter.
   * @param converter
   *        Converter `D` <- `S`.
   */
  explicit Slice_copier(Converter::Ptr converter);

  // Methods.

  /**
   * Converts each element; `*dst` is replaced only on success.
   *
   * @param dst
   *        Destination.
   * @param src
   *        Source.
   * @param err_code
   *        See Converter::convert().
   * @return See Converter::convert().
   */
  bool copy(std::vector<D>* dst, const std::vector<S>& src, Error_code* err_code = 0) const;

private:
  // Data.

  /// Element converter.
  const Converter::Ptr m_converter;
}; // class Slice_copier

/**
 * The entry point of the conversion engine: owns the type-pair Copier_cache, the Conversion_resolver compiling
 * into it, and the Conversion_registry of application-supplied conversions.  Construct one per program (or per
 * independent subsystem) and pass it to whatever needs to convert.
 *
 * ### Caching ###
 * Struct copiers compiled with default Copier_options are cached by (destination shape, source shape) and
 * reused by every later request, including nested struct pairs inside other conversions.  Those compiled with
 * non-default options are not cached (the cache key does not include options).  Failed compilations are never
 * cached.
 *
 * ### Thread safety ###
 * All methods may be invoked concurrently.
 */
class Copier :
  public flow::log::Log_context
{
public:
  // Constructors/destructor.

  /**
   * Constructs the engine with an empty cache and registry.
   *
   * @param logger_ptr
   *        Logger to use for logging subsequently.  May be null.
   */
  explicit Copier(flow::log::Logger* logger_ptr);

  // Methods.

  /**
   * Returns the struct copier for the pair, compiling (and, for default options, caching) it if needed.
   *
   * @param dst_shape
   *        Destination struct shape.
   * @param src_shape
   *        Source struct shape.
   * @param options
   *        Options.
   * @param err_code
   *        See Conversion_resolver::compile_struct().
   * @return See Conversion_resolver::compile_struct().
   */
  Struct_copier::Ptr build_struct_copier(const Shape& dst_shape, const Shape& src_shape,
                                         const Copier_options& options = Copier_options(),
                                         Error_code* err_code = 0);

  /**
   * Copies `*src` into `*dst`: a conversion registered for exactly this pair wins; else the (cached) struct copier
   * for the pair is applied.
   *
   * @param dst_shape
   *        Shape of `*dst`.
   * @param dst
   *        Destination.
   * @param src_shape
   *        Shape of `*src`.
   * @param src
   *        Source.
   * @param err_code
   *        See `flow::Error_code` docs for error reporting semantics.  error::Code generated:
   *        anything Conversion_resolver::compile_struct() or Struct_copier::copy() emits; whatever the registered
   *        conversion emits.
   * @return `true` on success; `false` if and only if `*err_code` is set to truthy.
   */
  bool copy(const Shape& dst_shape, void* dst, const Shape& src_shape, const void* src, Error_code* err_code = 0);

  /**
   * Typed copy().
   *
   * @tparam D
   *         Destination type.
   * @tparam S
   *         Source type.
   * @param dst
   *        Destination.
   * @param src
   *        Source.
   * @param err_code
   *        See untyped copy().
   * @return See untyped copy().
   */
  template<typename D, typename S>
  bool copy(D* dst, const S& src, Error_code* err_code = 0);

  /**
   * Applies copy() to each element of `src`; the first failure aborts.  `*dst` is replaced only on success.
   *
   * @tparam D
   *         Destination element type.
   * @tparam S
   *         Source element type.
   * @param dst
   *        Destination.
   * @param src
   *        Source.
   * @param err_code
   *        See untyped copy().
   * @return See untyped copy().
   */
  template<typename D, typename S>
  bool copy_list(std::vector<D>* dst, const std::vector<S>& src, Error_code* err_code = 0);

  /**
   * Compiles a typed converter for any supported pair (not only structs).
   *
   * @tparam D
   *         Destination type.
   * @tparam S
   *         Source type.
   * @param err_code
   *        See Conversion_resolver::resolve().
   * @return Null if and only if `*err_code` is set to truthy.
   */
  template<typename D, typename S>
  typename Value_copier<D, S>::Ptr build_value_copier(Error_code* err_code = 0) const;

  /**
   * Compiles an element-wise slice converter.
   *
   * @tparam D
   *         Destination element type.
   * @tparam S
   *         Source element type.
   * @param err_code
   *        See Conversion_resolver::resolve().
   * @return Null if and only if `*err_code` is set to truthy.
   */
  template<typename D, typename S>
  typename Slice_copier<D, S>::Ptr build_slice_copier(Error_code* err_code = 0) const;

  /**
   * Application-supplied conversions consulted by copy().
   * @return See above.
   */
  Conversion_registry* registry();

  /**
   * The resolver.
   * @return See above.
   */
  const Conversion_resolver& resolver() const;

  /**
   * The cache.
   * @return See above.
   */
  const Copier_cache& cache() const;

private:
  // Data.

  /// Cached struct copiers.
  Copier_cache m_cache;

  /// Compiles into #m_cache.
  Conversion_resolver m_resolver;

  /// See registry().
  Conversion_registry m_registry;
}; // class Copier

// Template implementations.

template<typename D, typename S>
Value_copier<D, S>::Value_copier(Converter::Ptr converter) :
  m_converter(std::move(converter))
{
  // Done.
}

template<typename D, typename S>
bool Value_copier<D, S>::copy(D* dst, const S& src, Error_code* err_code) const
{
  return m_converter->convert(dst, &src, err_code);
}

template<typename D, typename S>
D Value_copier<D, S>::copy_value(const S& src, Error_code* err_code) const
{
  D dst;
  m_converter->convert(&dst, &src, err_code);
  return dst;
}

template<typename D, typename S>
boost::shared_ptr<D> Value_copier<D, S>::copy_ptr(const S& src, Error_code* err_code) const
{
  auto dst = boost::make_shared<D>();
  if (!m_converter->convert(dst.get(), &src, err_code))
  {
    dst.reset();
  }
  return dst;
}

template<typename D, typename S>
Slice_copier<D, S>::Slice_copier(Converter::Ptr converter) :
  m_converter(std::move(converter))
{
  // Done.
}

template<typename D, typename S>
bool Slice_copier<D, S>::copy(std::vector<D>* dst, const std::vector<S>& src, Error_code* err_code) const
{
  std::vector<D> result(src.size());
  for (size_t idx = 0; idx != src.size(); ++idx)
  {
    if (!m_converter->convert(&result[idx], &src[idx], err_code))
    {
      return false;
    }
  }
  *dst = std::move(result);
  if (err_code)
  {
    err_code->clear();
  }
  return true;
}

template<typename D, typename S>
bool Copier::copy(D* dst, const S& src, Error_code* err_code)
{
  return copy(shape_of<D>(), dst, shape_of<S>(), &src, err_code);
}

template<typename D, typename S>
bool Copier::copy_list(std::vector<D>* dst, const std::vector<S>& src, Error_code* err_code)
{
  std::vector<D> result(src.size());
  for (size_t idx = 0; idx != src.size(); ++idx)
  {
    if (!copy(&result[idx], src[idx], err_code))
    {
      return false;
    }
  }
  *dst = std::move(result);
  if (err_code)
  {
    err_code->clear();
  }
  return true;
}

template<typename D, typename S>
typename Value_copier<D, S>::Ptr Copier::build_value_copier(Error_code* err_code) const
{
  auto converter = m_resolver.resolve(shape_of<D>(), shape_of<S>(), err_code);
  return converter ? boost::make_shared<const Value_copier<D, S>>(std::move(converter))
                   : typename Value_copier<D, S>::Ptr();
}

template<typename D, typename S>
typename Slice_copier<D, S>::Ptr Copier::build_slice_copier(Error_code* err_code) const
{
  auto converter = m_resolver.resolve(shape_of<D>(), shape_of<S>(), err_code);
  return converter ? boost::make_shared<const Slice_copier<D, S>>(std::move(converter))
                   : typename Slice_copier<D, S>::Ptr();
}

} // namespace keyval
