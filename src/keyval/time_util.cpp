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
#include "keyval/time_util.hpp"
#include <google/protobuf/util/time_util.h>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/make_shared.hpp>

namespace keyval::time_util
{

namespace
{

// Types.

using boost::posix_time::time_duration;

// Constants.

/// Nanoseconds per second.
constexpr int64_t S_NS_PER_SEC = 1000000000;

// Free functions.

/**
 * The Unix epoch.
 * @return See above.
 */
const Time_point& epoch()
{
  static const Time_point s_epoch(Date(1970, 1, 1));
  return s_epoch;
}

/**
 * Earliest timestamp seconds representable as a Time_point (start of the earliest supported Gregorian year).
 * @return See above.
 */
int64_t min_representable_seconds()
{
  static const int64_t s_min = (Time_point(Date(boost::gregorian::min_date_time)) - epoch()).total_seconds();
  return s_min;
}

/**
 * Nanoseconds per Time_point tick.
 * @return See above.
 */
int64_t ns_per_tick()
{
  return S_NS_PER_SEC / time_duration::ticks_per_second();
}

} // namespace (anon)

// Implementations.

bool timestamp_is_valid(const Proto_timestamp* timestamp)
{
  using google::protobuf::util::TimeUtil;

  return timestamp
         && (timestamp->seconds() >= TimeUtil::kTimestampMinSeconds)
         && (timestamp->seconds() <= TimeUtil::kTimestampMaxSeconds)
         && (timestamp->seconds() >= min_representable_seconds())
         && (timestamp->nanos() >= 0) && (timestamp->nanos() < S_NS_PER_SEC);
}

Proto_timestamp_ptr time_to_timestamp(const Time_point& time)
{
  if (time.is_special())
  {
    return Proto_timestamp_ptr();
  }

  const int64_t ticks_per_sec = time_duration::ticks_per_second();
  const int64_t ticks = (time - epoch()).ticks();
  // Floor division: the nanos part of a timestamp is never negative.
  int64_t secs = ticks / ticks_per_sec;
  int64_t rem_ticks = ticks % ticks_per_sec;
  if (rem_ticks < 0)
  {
    --secs;
    rem_ticks += ticks_per_sec;
  }

  auto timestamp = boost::make_shared<Proto_timestamp>();
  timestamp->set_seconds(secs);
  timestamp->set_nanos(int32_t(rem_ticks * ns_per_tick()));
  return timestamp;
}

Time_point timestamp_to_time(const Proto_timestamp& timestamp)
{
  return epoch() + boost::posix_time::seconds(long(timestamp.seconds()))
                 + time_duration(0, 0, 0, timestamp.nanos() / ns_per_tick());
}

Proto_timestamp_ptr date_to_timestamp(const Date& date)
{
  if (date.is_special())
  {
    return Proto_timestamp_ptr();
  }
  return time_to_timestamp(Time_point(date));
}

Date timestamp_to_date(const Proto_timestamp& timestamp)
{
  return timestamp_to_time(timestamp).date();
}

std::string time_to_rfc3339(const Time_point& time)
{
  if (time.is_special())
  {
    return "0001-01-01T00:00:00Z";
  }

  auto str = boost::posix_time::to_iso_extended_string(time);
  const auto dot_pos = str.find('.');
  if (dot_pos != std::string::npos)
  {
    const auto last_digit_pos = str.find_last_not_of('0');
    str.erase((last_digit_pos == dot_pos) ? dot_pos : (last_digit_pos + 1));
  }
  return str + 'Z';
}

} // namespace keyval::time_util
