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
#include <boost/lexical_cast.hpp>
#include <boost/uuid/string_generator.hpp>
#include <thread>

namespace keyval::test
{

namespace
{

const std::string S_UUID_1 = "6ba7b810-9dad-11d1-80b4-00c04fd430c8";
const std::string S_UUID_2 = "6ba7b811-9dad-11d1-80b4-00c04fd430c8";

struct Person_in
{
  std::string m_name;
  int32_t m_age = 0;
  Required<std::string> m_ssn;
  boost::optional<std::string> m_nickname;
  std::string m_color;
  std::vector<std::string> m_ids;
  std::string m_secret;
  std::string m_internal;

  static void describe_shape(Struct_shape_builder<Person_in>* builder)
  {
    builder->field("Name", &Person_in::m_name)
            .field("Age", &Person_in::m_age)
            .field("Ssn", &Person_in::m_ssn)
            .field("Nickname", &Person_in::m_nickname)
            .field("Color", &Person_in::m_color)
            .field("Ids", &Person_in::m_ids)
            .unexported_field("secret", &Person_in::m_secret)
            .field("Internal", &Person_in::m_internal, { { "kv", "-" } });
  }
};

struct Person_out
{
  Person_name m_name;
  int64_t m_age = 0;
  std::string m_ssn;
  boost::shared_ptr<std::string> m_nickname;
  Color_code m_color;
  std::vector<Uuid> m_ids;

  static void describe_shape(Struct_shape_builder<Person_out>* builder)
  {
    builder->field("Name", &Person_out::m_name)
            .field("Age", &Person_out::m_age)
            .field("Ssn", &Person_out::m_ssn)
            .field("Nickname", &Person_out::m_nickname)
            .field("Color", &Person_out::m_color)
            .field("Ids", &Person_out::m_ids);
  }
};

struct Person_short
{
  Person_name m_name;
  int64_t m_age = 0;

  static void describe_shape(Struct_shape_builder<Person_short>* builder)
  {
    builder->field("Name", &Person_short::m_name).field("Age", &Person_short::m_age);
  }
};

struct Point
{
  int32_t m_x = 0;
  int32_t m_y = 0;
  std::string m_label;

  static void describe_shape(Struct_shape_builder<Point>* builder)
  {
    builder->field("X", &Point::m_x, { { "key", "x" } })
            .field("Y", &Point::m_y)
            .field("Label", &Point::m_label, { { "kv", "-" } });
  }
};

struct Engine_out
{
  int64_t m_hp = 0;
  std::string m_fuel;

  static void describe_shape(Struct_shape_builder<Engine_out>* builder)
  {
    builder->field("Hp", &Engine_out::m_hp).field("Fuel", &Engine_out::m_fuel);
  }
};

struct Engine_holder
{
  Engine_out m_engine;

  static void describe_shape(Struct_shape_builder<Engine_holder>* builder)
  {
    builder->field("Engine", &Engine_holder::m_engine);
  }
};

struct Engine_ptr_holder
{
  boost::shared_ptr<Engine> m_engine;

  static void describe_shape(Struct_shape_builder<Engine_ptr_holder>* builder)
  {
    builder->field("Engine", &Engine_ptr_holder::m_engine);
  }
};

Person_in make_person()
{
  Person_in person;
  person.m_name = "Ann";
  person.m_age = 37;
  person.m_ssn = Required<std::string>("123-45-6789");
  person.m_nickname = std::string("Annie");
  person.m_color = "c3";
  person.m_ids = { S_UUID_1, S_UUID_2 };
  person.m_secret = "s";
  person.m_internal = "i";
  return person;
}

class Copier_test : public ::testing::Test
{
protected:
  Copier_test() :
    m_copier(m_log.logger())
  {
    // Done.
  }

  Captured_log m_log;
  Copier m_copier;
}; // class Copier_test

} // namespace (anonymous)

TEST_F(Copier_test, Struct_copy)
{
  const auto person = make_person();
  Person_out out;
  Error_code err_code;
  ASSERT_TRUE(m_copier.copy(&out, person, &err_code)) << err_code.message();
  EXPECT_FALSE(err_code);

  EXPECT_EQ(out.m_name.str(), "Ann");
  EXPECT_EQ(out.m_age, 37);
  EXPECT_EQ(out.m_ssn, "123-45-6789");
  ASSERT_TRUE(out.m_nickname);
  EXPECT_EQ(*out.m_nickname, "Annie");
  EXPECT_EQ(out.m_color.str(), "c3");
  ASSERT_EQ(out.m_ids.size(), 2u);
  EXPECT_EQ(out.m_ids[0], boost::uuids::string_generator()(S_UUID_1));
}

TEST_F(Copier_test, Identity_round_trip)
{
  const auto person = make_person();
  Person_in copy;
  ASSERT_TRUE(m_copier.copy(&copy, person));

  EXPECT_EQ(copy.m_name, person.m_name);
  EXPECT_EQ(copy.m_age, person.m_age);
  EXPECT_EQ(copy.m_ssn, person.m_ssn);
  EXPECT_EQ(copy.m_nickname, person.m_nickname);
  EXPECT_EQ(copy.m_ids, person.m_ids);
  // Not copied: unexported, and excluded by tag.
  EXPECT_TRUE(copy.m_secret.empty());
  EXPECT_TRUE(copy.m_internal.empty());
}

TEST_F(Copier_test, Closed_enum_field_rejected)
{
  auto person = make_person();
  person.m_color = "e5";
  Person_out out;
  Error_code err_code;
  EXPECT_FALSE(m_copier.copy(&out, person, &err_code));
  EXPECT_EQ(err_code, error::Code::S_CLOSED_ENUM_BAD_VALUE);
  EXPECT_NE(m_log.text().find("[Color]"), std::string::npos);
}

TEST_F(Copier_test, Missing_required_names_field)
{
  auto person = make_person();
  person.m_ssn.reset();
  Person_out out;
  Error_code err_code;
  EXPECT_FALSE(m_copier.copy(&out, person, &err_code));
  EXPECT_EQ(err_code, error::Code::S_REQUIRED_VALUE_MISSING);
  EXPECT_NE(m_log.text().find("[Ssn]"), std::string::npos);

  EXPECT_THROW(m_copier.copy(&out, person), flow::error::Runtime_error);
}

TEST_F(Copier_test, Compile_errors)
{
  Error_code err_code;
  EXPECT_FALSE(m_copier.build_struct_copier(shape_of<Person_short>(), shape_of<Person_in>(),
                                            Copier_options(), &err_code));
  EXPECT_EQ(err_code, error::Code::S_FIELD_NOT_FOUND);

  EXPECT_FALSE(m_copier.build_struct_copier(shape_of<int32_t>(), shape_of<int32_t>(), Copier_options(), &err_code));
  EXPECT_EQ(err_code, error::Code::S_TYPE_NOT_STRUCT);

  Employee_b employee_b;
  EXPECT_FALSE(m_copier.copy(&employee_b, Employee_a(), &err_code));
  EXPECT_EQ(err_code, error::Code::S_CIRCULAR_TYPE_REFERENCE);

  // Failures are not cached.
  EXPECT_EQ(m_copier.cache().size(), 0u);
}

TEST_F(Copier_test, Options)
{
  const auto person = make_person();

  Copier_options omit;
  omit.m_omit_unmatched_fields = true;
  const auto omitting = m_copier.build_struct_copier(shape_of<Person_short>(), shape_of<Person_in>(), omit);
  Person_short out;
  ASSERT_TRUE(omitting->copy(&out, &person));
  EXPECT_EQ(out.m_name.str(), "Ann");
  EXPECT_EQ(out.m_age, 37);

  Copier_options include;
  include.m_fields_to_include = std::vector<std::string>{ "Name" };
  const auto including = m_copier.build_struct_copier(shape_of<Person_short>(), shape_of<Person_in>(), include);
  Person_short only_name;
  ASSERT_TRUE(including->copy(&only_name, &person));
  EXPECT_EQ(only_name.m_name.str(), "Ann");
  EXPECT_EQ(only_name.m_age, 0);

  Copier_options exclude;
  exclude.m_omit_unmatched_fields = true;
  exclude.m_fields_to_exclude = { "Name" };
  EXPECT_FALSE(exclude.is_default());
  const auto excluding = m_copier.build_struct_copier(shape_of<Person_short>(), shape_of<Person_in>(), exclude);
  Person_short no_name;
  ASSERT_TRUE(excluding->copy(&no_name, &person));
  EXPECT_TRUE(no_name.m_name.str().empty());
  EXPECT_EQ(no_name.m_age, 37);

  // None of these went into the cache: the key has no room for options.
  EXPECT_EQ(m_copier.cache().size(), 0u);
  EXPECT_NE(m_copier.build_struct_copier(shape_of<Person_short>(), shape_of<Person_in>(), omit), omitting);
}

TEST_F(Copier_test, Cache_reuse)
{
  EXPECT_TRUE(Copier_options().is_default());
  const auto first = m_copier.build_struct_copier(shape_of<Person_out>(), shape_of<Person_in>());
  const auto second = m_copier.build_struct_copier(shape_of<Person_out>(), shape_of<Person_in>());
  ASSERT_TRUE(first);
  EXPECT_EQ(first, second);
  EXPECT_EQ(m_copier.cache().size(), 1u);
  EXPECT_EQ(m_copier.cache().find(Type_pair{ &shape_of<Person_out>(), &shape_of<Person_in>() }), first);
  EXPECT_FALSE(m_copier.cache().find(Type_pair{ &shape_of<Person_in>(), &shape_of<Person_out>() }));
  EXPECT_NE(m_log.text().find("hit"), std::string::npos);
}

TEST_F(Copier_test, Nested_pairs_share_the_cache)
{
  Engine_ptr_holder src;
  src.m_engine = boost::make_shared<Engine>();
  src.m_engine->m_hp = 130;
  Engine_holder dst;
  ASSERT_TRUE(m_copier.copy(&dst, src));
  EXPECT_EQ(dst.m_engine.m_hp, 130);

  // Outer pair and the nested (Engine_out, Engine) pair.
  EXPECT_EQ(m_copier.cache().size(), 2u);
  EXPECT_TRUE(m_copier.cache().find(Type_pair{ &shape_of<Engine_out>(), &shape_of<Engine>() }));
}

TEST_F(Copier_test, Concurrent_compilation)
{
  std::vector<Struct_copier::Ptr> results(8);
  std::vector<std::thread> threads;
  for (size_t idx = 0; idx != results.size(); ++idx)
  {
    threads.emplace_back([&, idx]()
    {
      results[idx] = m_copier.build_struct_copier(shape_of<Person_out>(), shape_of<Person_in>());
    });
  }
  for (auto& thread : threads)
  {
    thread.join();
  }

  for (const auto& result : results)
  {
    ASSERT_TRUE(result);
    EXPECT_EQ(result, results.front()); // One copier per pair, even when compiled concurrently.
  }
  EXPECT_EQ(m_copier.cache().size(), 1u);
}

TEST_F(Copier_test, Registry_wins)
{
  EXPECT_EQ(m_copier.registry()->size(), 0u);
  m_copier.registry()->register_conversion<std::string, int32_t>
    ([](std::string* dst, const int32_t& src, Error_code*) -> bool
  {
    *dst = "#" + boost::lexical_cast<std::string>(src);
    return true;
  });
  EXPECT_EQ(m_copier.registry()->size(), 1u);

  std::string str;
  Error_code err_code;
  EXPECT_TRUE(m_copier.copy(&str, int32_t(7), &err_code));
  EXPECT_EQ(str, "#7");

  // Registered conversions apply to whole values only; other non-struct pairs still fail.
  int64_t num = 0;
  EXPECT_FALSE(m_copier.copy(&num, int32_t(7), &err_code));
  EXPECT_EQ(err_code, error::Code::S_TYPE_NOT_STRUCT);

  m_copier.registry()->register_conversion<Person_short, Person_in>
    ([](Person_short* dst, const Person_in& src, Error_code* actual_err_code) -> bool
  {
    if (src.m_name.empty())
    {
      *actual_err_code = error::Code::S_REQUIRED_VALUE_MISSING;
      return false;
    }
    *dst = Person_short();
    dst->m_name = Person_name("Registered " + src.m_name);
    return true;
  });

  Person_short out;
  EXPECT_TRUE(m_copier.copy(&out, make_person(), &err_code));
  EXPECT_EQ(out.m_name.str(), "Registered Ann");
  EXPECT_EQ(out.m_age, 0);
  EXPECT_FALSE(m_copier.copy(&out, Person_in(), &err_code));
  EXPECT_EQ(err_code, error::Code::S_REQUIRED_VALUE_MISSING);
}

TEST_F(Copier_test, Lists)
{
  std::vector<Person_in> people{ make_person(), make_person() };
  people[1].m_name = "Bob";

  std::vector<Person_out> out;
  ASSERT_TRUE(m_copier.copy_list(&out, people));
  ASSERT_EQ(out.size(), 2u);
  EXPECT_EQ(out[1].m_name.str(), "Bob");

  const auto slice_copier = m_copier.build_slice_copier<Person_out, Person_in>();
  ASSERT_TRUE(slice_copier);
  std::vector<Person_out> copied;
  ASSERT_TRUE(slice_copier->copy(&copied, people));
  ASSERT_EQ(copied.size(), 2u);
  EXPECT_EQ(copied[0].m_name.str(), "Ann");

  // Elements are converted with default options: Person_short cannot take all of Person_in's fields.
  Error_code err_code;
  EXPECT_FALSE((m_copier.build_slice_copier<Person_short, Person_in>(&err_code)));
  EXPECT_EQ(err_code, error::Code::S_FIELD_NOT_FOUND);

  people[1].m_color = "nope";
  std::vector<Person_out> untouched(1);
  EXPECT_FALSE(m_copier.copy_list(&untouched, people, &err_code));
  EXPECT_EQ(err_code, error::Code::S_CLOSED_ENUM_BAD_VALUE);
  EXPECT_EQ(untouched.size(), 1u);
}

TEST_F(Copier_test, Value_copier_pointer_result)
{
  const auto copier = m_copier.build_value_copier<Person_out, Person_in>();
  ASSERT_TRUE(copier);
  const auto out = copier->copy_ptr(make_person());
  ASSERT_TRUE(out);
  EXPECT_EQ(out->m_age, 37);

  auto bad = make_person();
  bad.m_ssn.reset();
  Error_code err_code;
  EXPECT_FALSE(copier->copy_ptr(bad, &err_code));
  EXPECT_EQ(err_code, error::Code::S_REQUIRED_VALUE_MISSING);
}

TEST_F(Copier_test, Struct_map_bidirectional)
{
  Point point;
  point.m_x = 3;
  point.m_y = -4;
  point.m_label = "origin-ish";

  Dyn_map map;
  ASSERT_TRUE(m_copier.build_value_copier<Dyn_map, Point>()->copy(&map, point));
  ASSERT_EQ(map.size(), 2u);
  ASSERT_TRUE(map.at("x").get<int32_t>());
  EXPECT_EQ(*map.at("x").get<int32_t>(), 3);
  EXPECT_EQ(*map.at("Y").get<int32_t>(), -4);
  EXPECT_EQ(map.count("Label"), 0u);

  const auto to_point = m_copier.build_value_copier<Point, Dyn_map>();
  Point back;
  ASSERT_TRUE(to_point->copy(&back, map));
  EXPECT_EQ(back.m_x, 3);
  EXPECT_EQ(back.m_y, -4);
  EXPECT_TRUE(back.m_label.empty());

  Error_code err_code;
  map["Y"] = Value::of(int64_t(-4));
  EXPECT_FALSE(to_point->copy(&back, map, &err_code));
  EXPECT_EQ(err_code, error::Code::S_MAP_VALUE_TYPE_MISMATCH);

  map.erase("x");
  EXPECT_FALSE(to_point->copy(&back, map, &err_code));
  EXPECT_EQ(err_code, error::Code::S_MAP_KEY_MISSING);
  EXPECT_NE(m_log.text().find("[x]"), std::string::npos);
}

} // namespace keyval::test
