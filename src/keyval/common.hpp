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

#include <flow/common.hpp>
#include <flow/log/log.hpp>
#include <flow/util/util_fwd.hpp>
#include <flow/util/string_view.hpp>
#include <boost/unordered_map.hpp>
#include <string>

/**
 * Keyval: compiled conversion of values between independently-described record shapes, plus zero-copy
 * re-keying of record shapes for serialization.
 *
 * The big daddy for copying is keyval::Copier; for serialization re-keying it is keyval::Shape_transmuter together
 * with keyval::Reinterpreter.  Everything is driven by keyval::Shape descriptors, one per C++ type, obtainable
 * via keyval::shape_of().
 */
namespace keyval
{

// Types.

/// Short-hand for Flow's (in turn boost.system's) error code type; all our fallible APIs emit these.
using Error_code = flow::Error_code;

/**
 * The `flow::log::Component` payload `enum` for all logging done by this library.  To make logging from this
 * library appear properly one should call `flow::log::Config::init_component_names()` with
 * #S_KEYVAL_LOG_COMPONENT_NAME_MAP (and `init_component_to_union_idx_mapping()` beforehand), as with any
 * Flow-style library.
 */
enum class Log_component
{
  /// Uncategorized; used by free functions and tests mostly.
  S_UNCAT = 0,

  /// Conversion rule resolution, struct copier compilation, type-pair cache, conversion execution.
  S_COPIER,

  /// Shape transmutation (serialization re-keying) and reinterpretation.
  S_TRANSMUTE,

  /// Shape-driven serialization (Json_writer).
  S_SERIALIZE,

  /// SENTINEL: Not a component.  Must be last.
  S_END_SENTINEL
}; // enum class Log_component

// Constants.

/// Mapping from each #Log_component to its name as it would appear in log output.
extern const boost::unordered_multimap<Log_component, std::string> S_KEYVAL_LOG_COMPONENT_NAME_MAP;

} // namespace keyval

/// Small utilities used throughout keyval; mostly aliases into Flow's util.
namespace keyval::util
{

// Types.

/// Short-hand for Flow's `string_view` (used in our APIs for names and tag namespaces).
using String_view = flow::util::String_view;

/// Short-hand for a reader-writer mutex (reads are the common case in our registries).
using Mutex_shared = flow::util::Mutex_shared_non_recursive;

/// Short-hand for a shared (reader) lock of #Mutex_shared.
using Lock_guard_shared = flow::util::Lock_guard_shared_non_recursive_sh;

/// Short-hand for an exclusive (writer) lock of #Mutex_shared.
using Lock_guard_exclusive = flow::util::Lock_guard_shared_non_recursive_ex;

/// Short-hand for a plain mutex.
using Mutex = flow::util::Mutex_non_recursive;

/// Short-hand for #Mutex lock.
using Lock_guard = flow::util::Lock_guard<Mutex>;

} // namespace keyval::util
