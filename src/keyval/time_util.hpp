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

#include "keyval/domain.hpp"

/**
 * Conversions between the time-related leaf types (keyval::Time_point, keyval::Date) and the protocol timestamp
 * (keyval::Proto_timestamp).  All are UTC.
 */
namespace keyval::time_util
{

// Free functions.

/**
 * Whether the protocol timestamp is non-null, within the protocol's valid range (years 1 to 9999, nanoseconds in
 * `[0, 1e9)`), and within the range representable by keyval::Time_point.
 *
 * @param timestamp
 *        Timestamp or null.
 * @return See above.
 */
bool timestamp_is_valid(const Proto_timestamp* timestamp);

/**
 * Converts a time value to a newly allocated protocol timestamp; sub-tick precision is not representable by
 * keyval::Time_point so none is lost.
 *
 * @param time
 *        Time value.
 * @return The timestamp; null if `time` is a special value (e.g., not-a-date-time).
 */
Proto_timestamp_ptr time_to_timestamp(const Time_point& time);

/**
 * Converts a valid (see timestamp_is_valid()) protocol timestamp to a time value.
 *
 * @param timestamp
 *        Timestamp.
 * @return See above.
 */
Time_point timestamp_to_time(const Proto_timestamp& timestamp);

/**
 * Converts a date to a newly allocated protocol timestamp at UTC midnight of that date.
 *
 * @param date
 *        Date.
 * @return The timestamp; null if `date` is a special value.
 */
Proto_timestamp_ptr date_to_timestamp(const Date& date);

/**
 * Converts a valid (see timestamp_is_valid()) protocol timestamp to the UTC date it falls on.
 *
 * @param timestamp
 *        Timestamp.
 * @return See above.
 */
Date timestamp_to_date(const Proto_timestamp& timestamp);

/**
 * RFC 3339 representation of a time value in UTC (`Z` suffix), fractional seconds shown only if non-zero and
 * without trailing zeros.  Not-a-date-time is shown as the zero time `0001-01-01T00:00:00Z`.
 *
 * @param time
 *        Time value.
 * @return See above.
 */
std::string time_to_rfc3339(const Time_point& time);

} // namespace keyval::time_util
