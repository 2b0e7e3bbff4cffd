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
#include <gtest/gtest.h>
#include <flow/error/error.hpp>
#include <boost/uuid/string_generator.hpp>
#include <cmath>
#include <limits>

namespace keyval::test
{

namespace
{

using Op = Converter::Op;

/// Has the copy-to capability toward `double` (degrees Fahrenheit) only.
struct Temperature
{
  double m_celsius = 0;

  static void describe_shape(Struct_shape_builder<Temperature>* builder)
  {
    builder->field("Celsius", &Temperature::m_celsius);
  }

  static bool can_copy_to(const Shape& dst_shape)
  {
    return &dst_shape == &shape_of<double>();
  }

  void copy_to(const Shape&, void* dst) const
  {
    *static_cast<double*>(dst) = (m_celsius * 9 / 5) + 32;
  }
};

class Resolver_test : public ::testing::Test
{
protected:
  Resolver_test() :
    m_copier(m_log.logger())
  {
    // Done.
  }

  template<typename D, typename S>
  Converter::Ptr resolve(Error_code* err_code)
  {
    return m_copier.resolver().resolve(shape_of<D>(), shape_of<S>(), err_code);
  }

  template<typename D, typename S>
  Op op()
  {
    Error_code err_code;
    const auto converter = resolve<D, S>(&err_code);
    EXPECT_TRUE(converter) << err_code.message();
    return converter ? converter->op() : Op::S_RAW_COPY;
  }

  template<typename D, typename S>
  typename Value_copier<D, S>::Ptr value_copier()
  {
    return m_copier.build_value_copier<D, S>();
  }

  Captured_log m_log;
  Copier m_copier;
}; // class Resolver_test

} // namespace (anonymous)

TEST_F(Resolver_test, Identical_shapes)
{
  EXPECT_EQ((op<int64_t, int64_t>()), Op::S_RAW_COPY);
  EXPECT_EQ((op<Color, Color>()), Op::S_COPY_ASSIGN);
  EXPECT_EQ((op<std::string, std::string>()), Op::S_COPY_ASSIGN);

  const auto car = make_car();
  const auto copy = value_copier<Car, Car>()->copy_value(car);
  EXPECT_EQ(copy.m_make, car.m_make);
  EXPECT_EQ(copy.m_engine, car.m_engine); // Same pointee: pointers are copied, not cloned.
  EXPECT_EQ(copy.m_available_colors.size(), 2u);
  EXPECT_EQ(copy.m_since, car.m_since);
  EXPECT_EQ(copy.m_price, car.m_price);
}

TEST_F(Resolver_test, Closed_enum)
{
  EXPECT_EQ((op<Color_code, std::string>()), Op::S_CLOSED_ENUM);
  EXPECT_EQ((op<Color_code, Person_name>()), Op::S_CLOSED_ENUM);

  const auto copier = value_copier<Color_code, std::string>();
  Color_code code;
  Error_code err_code;
  const auto members = Color_code_tag::members();
  ASSERT_FALSE(members.empty());
  for (const auto& member : members)
  {
    EXPECT_TRUE(copier->copy(&code, member, &err_code)) << member;
    EXPECT_EQ(code.str(), member);
  }

  EXPECT_TRUE(copier->copy(&code, "b2", &err_code));

  EXPECT_FALSE(copier->copy(&code, "zz", &err_code));
  EXPECT_EQ(err_code, error::Code::S_CLOSED_ENUM_BAD_VALUE);
  EXPECT_EQ(code.str(), "b2");
  EXPECT_NE(m_log.text().find("zz"), std::string::npos);
}

TEST_F(Resolver_test, Same_representation)
{
  EXPECT_EQ((op<Person_name, std::string>()), Op::S_ALIAS_COPY);
  EXPECT_EQ((op<std::string, Color_code>()), Op::S_ALIAS_COPY);
  EXPECT_EQ((value_copier<Person_name, std::string>()->copy_value("Ann").str()), "Ann");
}

TEST_F(Resolver_test, Numeric)
{
  EXPECT_EQ((op<double, int32_t>()), Op::S_NUMERIC_CONVERT);
  EXPECT_EQ((value_copier<double, int32_t>()->copy_value(7)), 7.0);
  EXPECT_EQ((value_copier<int32_t, double>()->copy_value(3.7)), 3);
  EXPECT_EQ((value_copier<uint16_t, int64_t>()->copy_value(65537)), 1);

  Error_code err_code;
  EXPECT_FALSE((resolve<bool, int32_t>(&err_code)));
  EXPECT_EQ(err_code, error::Code::S_UNSUPPORTED_TYPE_PAIR);
}

TEST_F(Resolver_test, Numeric_out_of_range)
{
  const auto to_int32 = value_copier<int32_t, double>();
  int32_t int32 = 5;
  Error_code err_code;
  EXPECT_FALSE(to_int32->copy(&int32, 1e20, &err_code));
  EXPECT_EQ(err_code, error::Code::S_NUMERIC_OUT_OF_RANGE);
  EXPECT_EQ(int32, 5);
  EXPECT_NE(m_log.text().find("outside the range"), std::string::npos);

  EXPECT_FALSE(to_int32->copy(&int32, std::numeric_limits<double>::quiet_NaN(), &err_code));
  EXPECT_EQ(err_code, error::Code::S_NUMERIC_OUT_OF_RANGE);
  EXPECT_TRUE(to_int32->copy(&int32, -2147483648.9, &err_code));
  EXPECT_EQ(int32, std::numeric_limits<int32_t>::lowest());
  EXPECT_TRUE(to_int32->copy(&int32, 2147483647.9, &err_code));
  EXPECT_EQ(int32, std::numeric_limits<int32_t>::max());
  EXPECT_FALSE(to_int32->copy(&int32, 2147483648.0, &err_code));

  uint32_t uint32 = 9;
  EXPECT_FALSE((value_copier<uint32_t, float>()->copy(&uint32, -1.0f, &err_code)));
  EXPECT_EQ(err_code, error::Code::S_NUMERIC_OUT_OF_RANGE);
  EXPECT_EQ(uint32, 9u);
  EXPECT_TRUE((value_copier<uint32_t, float>()->copy(&uint32, -0.5f, &err_code)));
  EXPECT_EQ(uint32, 0u);

  float flt = 1;
  EXPECT_FALSE((value_copier<float, double>()->copy(&flt, 1e300, &err_code)));
  EXPECT_EQ(err_code, error::Code::S_NUMERIC_OUT_OF_RANGE);
  EXPECT_TRUE((value_copier<float, double>()->copy(&flt, std::numeric_limits<double>::infinity(), &err_code)));
  EXPECT_TRUE(std::isinf(flt));

  // Without an error code the failure throws.
  EXPECT_THROW(to_int32->copy_value(-1e300), flow::error::Runtime_error);
}

TEST_F(Resolver_test, Bytes)
{
  using Bytes = std::vector<uint8_t>;
  EXPECT_EQ((op<Bytes, std::string>()), Op::S_STRING_TO_BYTES);
  EXPECT_EQ((op<Person_name, Bytes>()), Op::S_BYTES_TO_STRING);

  const auto bytes = value_copier<Bytes, std::string>()->copy_value("hi");
  EXPECT_EQ(bytes, (Bytes{ 'h', 'i' }));
  EXPECT_EQ((value_copier<std::string, Bytes>()->copy_value(bytes)), "hi");
}

TEST_F(Resolver_test, Domain_uuid)
{
  const std::string STR = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";
  EXPECT_EQ((op<Uuid, std::string>()), Op::S_DOMAIN);

  const auto uuid = value_copier<Uuid, std::string>()->copy_value(STR);
  EXPECT_EQ(uuid, boost::uuids::string_generator()(STR));
  EXPECT_EQ((value_copier<std::string, Uuid>()->copy_value(uuid)), STR);

  Uuid target;
  Error_code err_code;
  EXPECT_FALSE((value_copier<Uuid, std::string>()->copy(&target, "not-a-uuid", &err_code)));
  EXPECT_EQ(err_code, error::Code::S_UUID_PARSE_FAILED);
}

TEST_F(Resolver_test, Domain_ulid_decimal_language)
{
  const std::string ULID = "01ARZ3NDEKTSV4RRFFQ69G5FAV";
  EXPECT_EQ((value_copier<std::string, Ulid>()->copy_value(value_copier<Ulid, std::string>()->copy_value(ULID))),
            ULID);

  Ulid ulid;
  Error_code err_code;
  EXPECT_FALSE((value_copier<Ulid, std::string>()->copy(&ulid, "bogus", &err_code)));
  EXPECT_EQ(err_code, error::Code::S_ULID_PARSE_FAILED);

  EXPECT_EQ((value_copier<std::string, Decimal>()->copy_value(Decimal(10000))), "10000");
  Decimal decimal(5);
  EXPECT_TRUE((value_copier<Decimal, std::string>()->copy(&decimal, "", &err_code)));
  EXPECT_TRUE(decimal.is_zero());
  EXPECT_FALSE((value_copier<Decimal, std::string>()->copy(&decimal, "abc", &err_code)));
  EXPECT_EQ(err_code, error::Code::S_DECIMAL_PARSE_FAILED);
  EXPECT_FALSE((value_copier<Decimal, std::string>()->copy(&decimal, "nan", &err_code)));
  EXPECT_EQ(err_code, error::Code::S_DECIMAL_PARSE_FAILED);
  EXPECT_EQ((value_copier<std::string, Decimal>()->copy_value(Decimal("0.00001"))), "0.00001");

  EXPECT_EQ((value_copier<Language_tag, std::string>()->copy_value("fr-ca").to_string()), "fr-CA");
  Language_tag tag;
  EXPECT_FALSE((value_copier<Language_tag, std::string>()->copy(&tag, "", &err_code)));
  EXPECT_EQ(err_code, error::Code::S_LANGUAGE_TAG_PARSE_FAILED);
}

TEST_F(Resolver_test, Domain_time)
{
  const Time_point time(Date(1982, 1, 1));
  EXPECT_EQ((op<Proto_timestamp_ptr, Time_point>()), Op::S_DOMAIN);

  const auto timestamp = value_copier<Proto_timestamp_ptr, Time_point>()->copy_value(time);
  ASSERT_TRUE(timestamp);
  EXPECT_EQ(timestamp->seconds(), 378691200);
  EXPECT_EQ((value_copier<Time_point, Proto_timestamp_ptr>()->copy_value(timestamp)), time);
  EXPECT_EQ((value_copier<Date, Proto_timestamp_ptr>()->copy_value(timestamp)), Date(1982, 1, 1));

  const auto opt_time = value_copier<boost::optional<Time_point>, Proto_timestamp_ptr>()->copy_value(timestamp);
  ASSERT_TRUE(opt_time);
  EXPECT_EQ(*opt_time, time);

  // Null (or invalid) timestamp: destination untouched.
  EXPECT_FALSE((value_copier<boost::optional<Time_point>, Proto_timestamp_ptr>()
                  ->copy_value(Proto_timestamp_ptr())));
  EXPECT_TRUE((value_copier<Time_point, Proto_timestamp_ptr>()->copy_value(Proto_timestamp_ptr()))
                .is_not_a_date_time());
}

TEST_F(Resolver_test, Copy_to_capability)
{
  EXPECT_EQ((op<double, Temperature>()), Op::S_COPY_TO);
  Temperature boiling;
  boiling.m_celsius = 100;
  EXPECT_EQ((value_copier<double, Temperature>()->copy_value(boiling)), 212.0);

  Error_code err_code;
  EXPECT_FALSE((resolve<std::string, Temperature>(&err_code)));
  EXPECT_EQ(err_code, error::Code::S_COPY_TO_TARGET_UNSUPPORTED);
}

TEST_F(Resolver_test, Pointers)
{
  using Engine_ptr = boost::shared_ptr<Engine>;
  EXPECT_EQ((op<Engine_ptr, Engine_ptr>()), Op::S_COPY_ASSIGN);

  const auto src = boost::make_shared<int32_t>(5);
  EXPECT_EQ((op<boost::shared_ptr<int64_t>, boost::shared_ptr<int32_t>>()), Op::S_POINTER_DEEP);
  const auto deep = value_copier<boost::shared_ptr<int64_t>, boost::shared_ptr<int32_t>>()->copy_value(src);
  ASSERT_TRUE(deep);
  EXPECT_EQ(*deep, 5);
  EXPECT_FALSE((value_copier<boost::shared_ptr<int64_t>, boost::shared_ptr<int32_t>>()
                  ->copy_value(boost::shared_ptr<int32_t>())));

  EXPECT_EQ((op<boost::shared_ptr<int64_t>, int32_t>()), Op::S_BOX_INTO_POINTER);
  const auto boxed = value_copier<boost::shared_ptr<int64_t>, int32_t>()->copy_value(0);
  ASSERT_TRUE(boxed); // Even a zero value is boxed.
  EXPECT_EQ(*boxed, 0);

  EXPECT_EQ((op<int64_t, boost::shared_ptr<int32_t>>()), Op::S_DEREF_POINTER);
  int64_t target = 9;
  EXPECT_TRUE((value_copier<int64_t, boost::shared_ptr<int32_t>>()->copy(&target, boost::shared_ptr<int32_t>())));
  EXPECT_EQ(target, 9);
  EXPECT_TRUE((value_copier<int64_t, boost::shared_ptr<int32_t>>()->copy(&target, src)));
  EXPECT_EQ(target, 5);
}

TEST_F(Resolver_test, Optional_pointer_symmetry)
{
  using Opt = boost::optional<std::string>;
  using Ptr = boost::shared_ptr<std::string>;
  EXPECT_EQ((op<Ptr, Opt>()), Op::S_OPTIONAL_TO_POINTER);
  EXPECT_EQ((op<Opt, Ptr>()), Op::S_POINTER_TO_OPTIONAL);

  const auto to_ptr = value_copier<Ptr, Opt>();
  const auto to_opt = value_copier<Opt, Ptr>();

  const auto present = to_ptr->copy_value(Opt(std::string("x")));
  ASSERT_TRUE(present);
  EXPECT_EQ(*present, "x");
  const auto back = to_opt->copy_value(present);
  ASSERT_TRUE(back);
  EXPECT_EQ(*back, "x");

  EXPECT_FALSE(to_ptr->copy_value(Opt()));
  EXPECT_FALSE(to_opt->copy_value(Ptr()));
}

TEST_F(Resolver_test, Value_into_optional)
{
  EXPECT_EQ((op<boost::optional<int64_t>, int32_t>()), Op::S_VALUE_TO_OPTIONAL);
  const auto copier = value_copier<boost::optional<int64_t>, int32_t>();
  EXPECT_FALSE(copier->copy_value(0));
  const auto present = copier->copy_value(42);
  ASSERT_TRUE(present);
  EXPECT_EQ(*present, 42);

  boost::optional<int64_t> target(3);
  EXPECT_TRUE(copier->copy(&target, 0));
  ASSERT_TRUE(target); // Zero source: untouched.
  EXPECT_EQ(*target, 3);
}

TEST_F(Resolver_test, Required_unwrap)
{
  EXPECT_EQ((op<std::string, Required<std::string>>()), Op::S_REQUIRED_UNWRAP);
  const auto copier = value_copier<std::string, Required<std::string>>();
  EXPECT_EQ(copier->copy_value(Required<std::string>("y")), "y");

  std::string target;
  Error_code err_code;
  EXPECT_FALSE(copier->copy(&target, Required<std::string>(), &err_code));
  EXPECT_EQ(err_code, error::Code::S_REQUIRED_VALUE_MISSING);
}

TEST_F(Resolver_test, Slices)
{
  using Strings = std::vector<std::string>;
  using Uuids = std::vector<Uuid>;
  EXPECT_EQ((op<Uuids, Strings>()), Op::S_SLICE);

  const auto copier = value_copier<Uuids, Strings>();
  const Strings strs{ "6ba7b810-9dad-11d1-80b4-00c04fd430c8", "6ba7b811-9dad-11d1-80b4-00c04fd430c8" };
  const auto uuids = copier->copy_value(strs);
  ASSERT_EQ(uuids.size(), 2u);
  EXPECT_EQ(uuids[1], boost::uuids::string_generator()(strs[1]));

  // Empty source: destination emptied, the same as an element-wise slice copier does.
  auto target = uuids;
  EXPECT_TRUE(copier->copy(&target, Strings()));
  EXPECT_TRUE(target.empty());
  auto listed = uuids;
  EXPECT_TRUE((m_copier.build_slice_copier<Uuid, std::string>()->copy(&listed, Strings())));
  EXPECT_EQ(listed, target);

  // Non-empty source: destination replaced, not appended to.
  target = uuids;
  EXPECT_TRUE(copier->copy(&target, Strings{ strs[0] }));
  ASSERT_EQ(target.size(), 1u);
  EXPECT_EQ(target[0], uuids[0]);

  Error_code err_code;
  EXPECT_FALSE(copier->copy(&target, Strings{ strs[0], "oops" }, &err_code));
  EXPECT_EQ(err_code, error::Code::S_UUID_PARSE_FAILED);
}

TEST_F(Resolver_test, Circular_struct_pair)
{
  Error_code err_code;
  EXPECT_FALSE((resolve<Employee_b, Employee_a>(&err_code)));
  EXPECT_EQ(err_code, error::Code::S_CIRCULAR_TYPE_REFERENCE);

  // Identical self-referential shapes are fine: that is plain copy-assignment.
  EXPECT_EQ((op<Employee_a, Employee_a>()), Op::S_COPY_ASSIGN);
}

TEST_F(Resolver_test, Throws_without_error_code)
{
  EXPECT_THROW((m_copier.resolver().resolve(shape_of<Uuid>(), shape_of<bool>())), flow::error::Runtime_error);
  EXPECT_THROW((value_copier<Uuid, std::string>()->copy_value("nope")), flow::error::Runtime_error);
}

} // namespace keyval::test
