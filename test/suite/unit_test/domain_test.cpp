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
#include "test_types.hpp"
#include "keyval/time_util.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace keyval::test
{

TEST(Ulid, Parses_and_prints)
{
  const std::string STR = "01ARZ3NDEKTSV4RRFFQ69G5FAV";

  Ulid ulid;
  EXPECT_TRUE(ulid.is_zero());
  ASSERT_TRUE(Ulid::from_string(STR, &ulid));
  EXPECT_FALSE(ulid.is_zero());
  EXPECT_EQ(ulid.to_string(), STR);
  // 48-bit millisecond timestamp leads.
  EXPECT_EQ(ulid.bytes()[0], 0x01);
  EXPECT_EQ(ulid.bytes()[1], 0x56);

  Ulid lower;
  ASSERT_TRUE(Ulid::from_string("01arz3ndektsv4rrffq69g5fav", &lower));
  EXPECT_EQ(lower, ulid);

  std::ostringstream os;
  os << ulid;
  EXPECT_EQ(os.str(), STR);

  EXPECT_EQ(Ulid().to_string(), std::string(Ulid::S_STRING_SIZE, '0'));
}

TEST(Ulid, Rejects_malformed)
{
  Ulid ulid;
  EXPECT_FALSE(Ulid::from_string("", &ulid));
  EXPECT_FALSE(Ulid::from_string("01ARZ3NDEKTSV4RRFFQ69G5FA", &ulid)); // Too short.
  EXPECT_FALSE(Ulid::from_string("01ARZ3NDEKTSV4RRFFQ69G5FAVV", &ulid)); // Too long.
  EXPECT_FALSE(Ulid::from_string("01ARZ3NDEKTSV4RRFFQ69G5FAU", &ulid)); // 'U' is not in the alphabet.
  EXPECT_FALSE(Ulid::from_string("81ARZ3NDEKTSV4RRFFQ69G5FAV", &ulid)); // Overflows 128 bits.
  EXPECT_TRUE(ulid.is_zero());
}

TEST(Language_tag, Canonicalizes)
{
  Language_tag tag;
  EXPECT_TRUE(tag.is_zero());
  EXPECT_EQ(tag.to_string(), "und");

  ASSERT_TRUE(Language_tag::from_string("en-us", &tag));
  EXPECT_EQ(tag.to_string(), "en-US");
  EXPECT_FALSE(tag.is_zero());

  Language_tag other;
  ASSERT_TRUE(Language_tag::from_string("EN-US", &other));
  EXPECT_EQ(other, tag);
}

TEST(Language_tag, Rejects_malformed)
{
  Language_tag tag;
  EXPECT_FALSE(Language_tag::from_string("", &tag));
  EXPECT_FALSE(Language_tag::from_string("not a tag!", &tag));
  EXPECT_TRUE(tag.is_zero());
}

TEST(Decimal, Strings)
{
  EXPECT_EQ(decimal_to_string(Decimal(10000)), "10000");
  EXPECT_EQ(decimal_to_string(Decimal()), "0");
  EXPECT_EQ(decimal_to_string(Decimal(-1) / 4), "-0.25");
  EXPECT_EQ(decimal_to_string(Decimal("0.00001")), "0.00001");
  EXPECT_EQ(decimal_to_string(Decimal("1e25")), "10000000000000000000000000");
  EXPECT_EQ(decimal_to_string(Decimal("21000.50")), "21000.5");

  Decimal val;
  ASSERT_TRUE(decimal_from_string("12.5", &val));
  EXPECT_EQ(val, Decimal(25) / 2);
  ASSERT_TRUE(decimal_from_string("-3", &val));
  EXPECT_EQ(val, Decimal(-3));
  EXPECT_FALSE(decimal_from_string("abc", &val));
  EXPECT_FALSE(decimal_from_string("1.2.3", &val));

  // Non-finite values are rejected and leave the target untouched.
  EXPECT_FALSE(decimal_from_string("nan", &val));
  EXPECT_FALSE(decimal_from_string("inf", &val));
  EXPECT_FALSE(decimal_from_string("-inf", &val));
  EXPECT_EQ(val, Decimal(-3));

  ASSERT_TRUE(decimal_from_string("1e-5", &val));
  EXPECT_EQ(decimal_to_string(val), "0.00001");
}

TEST(Time_util, Time_to_timestamp)
{
  using boost::posix_time::time_duration;
  using boost::posix_time::milliseconds;

  const auto timestamp = time_util::time_to_timestamp(Time_point(Date(1982, 1, 1)));
  ASSERT_TRUE(timestamp);
  EXPECT_EQ(timestamp->seconds(), 378691200);
  EXPECT_EQ(timestamp->nanos(), 0);
  EXPECT_EQ(time_util::timestamp_to_time(*timestamp), Time_point(Date(1982, 1, 1)));

  // Half a second before the epoch: seconds floor toward negative infinity, nanos stay non-negative.
  const Time_point before_epoch(Date(1969, 12, 31), time_duration(23, 59, 59) + milliseconds(500));
  const auto negative = time_util::time_to_timestamp(before_epoch);
  ASSERT_TRUE(negative);
  EXPECT_EQ(negative->seconds(), -1);
  EXPECT_EQ(negative->nanos(), 500000000);
  EXPECT_EQ(time_util::timestamp_to_time(*negative), before_epoch);

  EXPECT_FALSE(time_util::time_to_timestamp(Time_point()));
}

TEST(Time_util, Validity)
{
  EXPECT_FALSE(time_util::timestamp_is_valid(nullptr));

  Proto_timestamp timestamp;
  timestamp.set_seconds(10);
  EXPECT_TRUE(time_util::timestamp_is_valid(&timestamp));
  timestamp.set_nanos(-1);
  EXPECT_FALSE(time_util::timestamp_is_valid(&timestamp));
  timestamp.set_nanos(1000000000);
  EXPECT_FALSE(time_util::timestamp_is_valid(&timestamp));
}

TEST(Time_util, Dates)
{
  const auto timestamp = time_util::date_to_timestamp(Date(2000, 2, 29));
  ASSERT_TRUE(timestamp);
  EXPECT_EQ(timestamp->seconds() % 86400, 0);
  EXPECT_EQ(time_util::timestamp_to_date(*timestamp), Date(2000, 2, 29));
  EXPECT_FALSE(time_util::date_to_timestamp(Date()));
}

TEST(Time_util, Rfc3339)
{
  using boost::posix_time::time_duration;
  using boost::posix_time::milliseconds;

  EXPECT_EQ(time_util::time_to_rfc3339(Time_point(Date(1982, 1, 1))), "1982-01-01T00:00:00Z");
  EXPECT_EQ(time_util::time_to_rfc3339(Time_point(Date(2020, 2, 3), time_duration(4, 5, 6) + milliseconds(120))),
            "2020-02-03T04:05:06.12Z");
  EXPECT_EQ(time_util::time_to_rfc3339(Time_point()), "0001-01-01T00:00:00Z");
}

TEST(Error, Codes_print_and_parse)
{
  const Error_code err_code = error::Code::S_FIELD_NOT_FOUND;
  EXPECT_STREQ(err_code.category().name(), "keyval");
  EXPECT_FALSE(err_code.message().empty());

  std::ostringstream os;
  os << error::Code::S_CIRCULAR_TYPE_REFERENCE;
  EXPECT_EQ(os.str(), "CIRCULAR_TYPE_REFERENCE");

  std::istringstream is("MAP_KEY_MISSING");
  error::Code code = error::Code::S_END_SENTINEL;
  is >> code;
  EXPECT_EQ(code, error::Code::S_MAP_KEY_MISSING);
}

} // namespace keyval::test
