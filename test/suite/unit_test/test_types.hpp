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

#include "keyval/copier.hpp"
#include <flow/log/simple_ostream_logger.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/optional.hpp>
#include <sstream>
#include <string>
#include <vector>

namespace keyval::test
{

// Types.

/// Members of #Color_code.
struct Color_code_tag
{
  static std::vector<std::string> members()
  {
    return { "a1", "b2", "c3", "d4" };
  }
};

/// Closed enumeration used throughout.
using Color_code = Closed_enum<Color_code_tag>;

/// Tag of #Person_name.
struct Person_name_tag {};

/// Named string type.
using Person_name = Named_string<Person_name_tag>;

struct Engine
{
  int32_t m_hp = 0;
  std::string m_fuel;

  static void describe_shape(Struct_shape_builder<Engine>* builder)
  {
    builder->field("Hp", &Engine::m_hp, { { "json", "hp" }, { "out", "HP" } })
            .field("Fuel", &Engine::m_fuel, { { "json", "fuel" }, { "out", "FUEL" } });
  }
};

struct Color
{
  std::string m_base;
  bool m_metallic = false;

  static void describe_shape(Struct_shape_builder<Color>* builder)
  {
    builder->field("Base", &Color::m_base, { { "json", "base" }, { "out", "BASE" } })
            .field("Metallic", &Color::m_metallic, { { "json", "metallic" }, { "out", "METALLIC" } });
  }
};

struct Car
{
  std::string m_make;
  std::string m_model;
  boost::shared_ptr<Engine> m_engine;
  std::vector<Color> m_available_colors;
  std::vector<boost::shared_ptr<Color>> m_preferred_colors;
  Time_point m_since;
  Decimal m_price;

  static void describe_shape(Struct_shape_builder<Car>* builder)
  {
    builder->field("Make", &Car::m_make, { { "json", "make" }, { "out", "MAKE" } })
            .field("Model", &Car::m_model, { { "json", "model" }, { "out", "MODEL" } })
            .field("Engine", &Car::m_engine, { { "json", "engine" }, { "out", "ENGINE" } })
            .field("AvailableColors", &Car::m_available_colors,
                   { { "json", "available_colors" }, { "out", "AVAILABLE_COLORS" } })
            .field("PreferredColors", &Car::m_preferred_colors,
                   { { "json", "preferred_colors" }, { "out", "PREFERRED_COLORS" } })
            .field("Since", &Car::m_since, { { "json", "since" }, { "out", "SINCE" } })
            .field("Price", &Car::m_price, { { "json", "price" }, { "out", "PRICE" } });
  }
};

/// Self-referential record.
struct Employee_a
{
  std::string m_name;
  std::vector<Employee_a> m_reports;

  static void describe_shape(Struct_shape_builder<Employee_a>* builder)
  {
    builder->field("Name", &Employee_a::m_name, { { "json", "name" } })
            .field("Reports", &Employee_a::m_reports, { { "json", "reports" } });
  }
};

/// Self-referential record, same field names as Employee_a.
struct Employee_b
{
  std::string m_name;
  std::vector<Employee_b> m_reports;

  static void describe_shape(Struct_shape_builder<Employee_b>* builder)
  {
    builder->field("Name", &Employee_b::m_name).field("Reports", &Employee_b::m_reports);
  }
};

/**
 * Captures everything a Flow logger writes into a string, so that tests can check what was logged.
 * Verbosity is TRACE so that rule selection and cache activity are visible as well.
 */
class Captured_log
{
public:
  Captured_log() :
    m_logger(&m_config, m_os, m_os)
  {
    m_config.init_component_to_union_idx_mapping<Log_component>(1000, 999);
    m_config.init_component_names<Log_component>(S_KEYVAL_LOG_COMPONENT_NAME_MAP, false, "keyval-");
    m_config.configure_default_verbosity(flow::log::Sev::S_TRACE, true);
  }

  flow::log::Logger* logger()
  {
    return &m_logger;
  }

  std::string text() const
  {
    return m_os.str();
  }

private:
  flow::log::Config m_config;
  std::ostringstream m_os;
  flow::log::Simple_ostream_logger m_logger;
}; // class Captured_log

// Free functions.

/// The car used by serialization tests: `{"make":"Chevrolet","model":"Celebrity",...}`.
inline Car make_car()
{
  Car car;
  car.m_make = "Chevrolet";
  car.m_model = "Celebrity";
  car.m_engine = boost::make_shared<Engine>();
  car.m_engine->m_hp = 130;
  car.m_engine->m_fuel = "gasoline";

  Color red;
  red.m_base = "red";
  red.m_metallic = true;
  Color blue;
  blue.m_base = "blue";
  car.m_available_colors = { red, blue };
  car.m_preferred_colors = { boost::make_shared<Color>(red) };

  car.m_since = Time_point(Date(1982, 1, 1));
  car.m_price = Decimal(10000);
  return car;
}

} // namespace keyval::test
