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


#include <keyval/copier.hpp>
#include <keyval/transmute.hpp>
#include <keyval/reinterpret.hpp>
#include <keyval/json_writer.hpp>
#include <flow/log/simple_ostream_logger.hpp>
#include <flow/log/async_file_logger.hpp>

namespace link_test
{

struct Engine_in
{
  int32_t m_hp = 0;
  std::string m_fuel;

  static void describe_shape(keyval::Struct_shape_builder<Engine_in>* builder)
  {
    builder->field("Hp", &Engine_in::m_hp, { { "json", "hp" } })
            .field("Fuel", &Engine_in::m_fuel, { { "json", "fuel" } });
  }
};

struct Car_in
{
  std::string m_make;
  Engine_in m_engine;
  keyval::Time_point m_since;
  keyval::Decimal m_price;

  static void describe_shape(keyval::Struct_shape_builder<Car_in>* builder)
  {
    builder->field("Make", &Car_in::m_make, { { "json", "make" } })
            .field("Engine", &Car_in::m_engine, { { "json", "engine" } })
            .field("Since", &Car_in::m_since, { { "json", "since" } })
            .field("Price", &Car_in::m_price, { { "json", "price" } });
  }
};

struct Engine_out
{
  int64_t m_hp = 0;
  std::string m_fuel;

  static void describe_shape(keyval::Struct_shape_builder<Engine_out>* builder)
  {
    builder->field("Hp", &Engine_out::m_hp).field("Fuel", &Engine_out::m_fuel);
  }
};

struct Car_out
{
  std::string m_make;
  boost::shared_ptr<Engine_out> m_engine;
  keyval::Proto_timestamp_ptr m_since;
  std::string m_price;

  static void describe_shape(keyval::Struct_shape_builder<Car_out>* builder)
  {
    builder->field("Make", &Car_out::m_make)
            .field("Engine", &Car_out::m_engine)
            .field("Since", &Car_out::m_since)
            .field("Price", &Car_out::m_price);
  }
};

} // namespace link_test

/* This little thing is *not* a unit-test; it is built to ensure the proper stuff links through our
 * build process.  We try to use a compiled thing or two; and a template (header-only) thing or two;
 * not so much for correctness testing but to see it build successfully and run without barfing. */
int main()
{
  using link_test::Car_in;
  using link_test::Car_out;
  using keyval::Copier;
  using keyval::Shape_transmuter;
  using keyval::Reinterpreter;
  using keyval::Json_writer;
  using keyval::Value;
  using keyval::Log_component;

  using flow::log::Simple_ostream_logger;
  using flow::log::Async_file_logger;
  using flow::log::Config;
  using flow::log::Sev;
  using flow::Flow_log_component;

  using std::string;
  using std::exception;

  const string LOG_FILE = "keyval_link_test.log";
  const int BAD_EXIT = 1;

  /* Set up logging within this function.  We could easily just use `cout` and `cerr` instead, but this
   * Flow stuff will give us time stamps and such for free, so why not? */
  Config std_log_config;
  std_log_config.init_component_to_union_idx_mapping<Flow_log_component>(1000, 999);
  std_log_config.init_component_to_union_idx_mapping<Log_component>(2000, 999);
  std_log_config.init_component_names<Flow_log_component>(flow::S_FLOW_LOG_COMPONENT_NAME_MAP, false, "link_test-");
  std_log_config.init_component_names<Log_component>(keyval::S_KEYVAL_LOG_COMPONENT_NAME_MAP, false, "keyval-");

  Simple_ostream_logger std_logger(&std_log_config);
  FLOW_LOG_SET_CONTEXT(&std_logger, Flow_log_component::S_UNCAT);

  // This is separate: the keyval/Flow logging will go into this file.
  FLOW_LOG_INFO("Opening log file [" << LOG_FILE << "] for keyval/Flow logs only.");
  Config log_config = std_log_config;
  log_config.configure_default_verbosity(Sev::S_TRACE, true);
  Async_file_logger log_logger(nullptr, &log_config, LOG_FILE, false /* No rotation; we're no serious business. */);

  try
  {
    Car_in car;
    car.m_make = "Chevrolet";
    car.m_engine.m_hp = 130;
    car.m_engine.m_fuel = "gasoline";
    car.m_since = keyval::Time_point(keyval::Date(1982, 1, 1));
    car.m_price = keyval::Decimal(10000);

    // Compiled struct copier (through the cache), nested struct into pointer, time into timestamp, etc.
    Copier copier(&log_logger);
    Car_out out;
    copier.copy(&out, car); // Throws on error.

    if ((out.m_make != car.m_make) || (!out.m_engine) || (out.m_engine->m_hp != 130) || (!out.m_since)
        || (out.m_price != "10000"))
    {
      FLOW_LOG_WARNING("Copied value is not what was expected.");
      return BAD_EXIT;
    }
    FLOW_LOG_INFO("Copied [" << keyval::shape_of<Car_out>() << "] <- [" << keyval::shape_of<Car_in>() << "]; "
                  "cache now holds [" << copier.cache().size() << "] struct copiers.");

    // Transmute, reinterpret (descriptor swap), and serialize both ways.
    Shape_transmuter transmuter(&log_logger);
    const auto json_car_shape = transmuter.derive<Car_in>("json");
    const auto reinterpret = Reinterpreter::create(&log_logger, *json_car_shape, Reinterpreter::Mode::S_ZERO_COPY);

    const Json_writer writer(&log_logger);
    const auto direct = writer.dump(car);
    const auto fast = writer.dump((*reinterpret)(Value::of(car)));
    FLOW_LOG_INFO("Direct: [" << direct << "]; zero-copy: [" << fast << "].");
    if (direct != fast)
    {
      FLOW_LOG_WARNING("Serializations differ.");
      return BAD_EXIT;
    }

    FLOW_LOG_INFO("Looks good.  Exiting.");
  } // try
  catch (const exception& exc)
  {
    FLOW_LOG_WARNING("Caught exception: [" << exc.what() << "].");
    return BAD_EXIT;
  }

  return 0;
} // main()
