//  SPDX-License-Identifier: GPL-3.0-or-later
//
//  Copyright (c) 2024-2026 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
//
//  This file is part of statefulscenes.
//
//  statefulscenes is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  statefulscenes is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with statefulscenes. If not, see <http://www.gnu.org/licenses/>.
//
#include <catch2/catch.hpp>

#include "valuecomparator.hpp"
#include "testentityhost.hpp"

using namespace sscenes;


TEST_CASE("ValueComparator - reflexive at zero tolerance", "[comparator]")
{
  const char *shapes[] = {
    "\"on\"", "true", "false", "0", "42.5", "[]", "[1,2,3]", "[[1,2],[3]]",
    "{}", "{\"a\":1,\"b\":\"x\"}", "{\"m\":{\"n\":[1,{\"o\":true}]}}"
  };
  for (size_t i=0; i<sizeof(shapes)/sizeof(shapes[0]); i++) {
    AttributeValuePtr v = attr(shapes[i]);
    INFO(shapes[i]);
    REQUIRE(v);
    CHECK(ValueComparator::equal(v, v, 0));
    CHECK(ValueComparator::equal(v, attr(shapes[i]), 0));
  }
  CHECK(ValueComparator::equal(AttributeValuePtr(), AttributeValuePtr(), 0));
}


TEST_CASE("ValueComparator - numbers use an inclusive tolerance", "[comparator]")
{
  SECTION("within tolerance") {
    CHECK(ValueComparator::equal(AttributeValue::newNumber(5), AttributeValue::newNumber(8), 3));
    CHECK(ValueComparator::equal(AttributeValue::newNumber(8), AttributeValue::newNumber(5), 3));
  }
  SECTION("just outside tolerance") {
    CHECK_FALSE(ValueComparator::equal(AttributeValue::newNumber(5), AttributeValue::newNumber(8.001), 3));
  }
  SECTION("zero tolerance is exact") {
    CHECK(ValueComparator::equal(AttributeValue::newNumber(100), AttributeValue::newNumber(100), 0));
    CHECK_FALSE(ValueComparator::equal(AttributeValue::newNumber(100), AttributeValue::newNumber(100.5), 0));
  }
}


TEST_CASE("ValueComparator - scalars compare structurally", "[comparator]")
{
  CHECK(ValueComparator::equal(attr("\"on\""), attr("\"on\""), 5));
  CHECK_FALSE(ValueComparator::equal(attr("\"on\""), attr("\"off\""), 5));
  CHECK_FALSE(ValueComparator::equal(attr("true"), attr("false"), 5));
  // no coercion between kinds
  CHECK_FALSE(ValueComparator::equal(attr("\"1\""), attr("1"), 5));
  CHECK_FALSE(ValueComparator::equal(attr("true"), attr("1"), 5));
}


TEST_CASE("ValueComparator - mappings check one-directional containment", "[comparator]")
{
  AttributeValuePtr small = attr("{\"a\":1}");
  AttributeValuePtr large = attr("{\"a\":1,\"b\":2}");
  CHECK(ValueComparator::equal(small, large, 0));
  CHECK_FALSE(ValueComparator::equal(large, small, 0));
  CHECK(ValueComparator::equal(attr("{\"a\":10}"), attr("{\"a\":12,\"c\":\"x\"}"), 2));
  CHECK_FALSE(ValueComparator::equal(attr("{\"a\":10}"), attr("{\"a\":13}"), 2));
}


TEST_CASE("ValueComparator - sequences compare the common prefix only", "[comparator]")
{
  CHECK(ValueComparator::equal(attr("[1,2,3]"), attr("[1,2]"), 0));
  CHECK(ValueComparator::equal(attr("[1,2]"), attr("[1,2,3]"), 0));
  CHECK(ValueComparator::equal(attr("[]"), attr("[7]"), 0));
  CHECK_FALSE(ValueComparator::equal(attr("[1,5,3]"), attr("[1,2]"), 0));
}


TEST_CASE("ValueComparator - mismatched shapes are not equal", "[comparator]")
{
  CHECK_FALSE(ValueComparator::equal(attr("\"on\""), attr("{\"state\":\"on\"}"), 0));
  CHECK_FALSE(ValueComparator::equal(attr("[1]"), attr("1"), 0));
  CHECK_FALSE(ValueComparator::equal(attr("{}"), attr("[]"), 0));
  CHECK_FALSE(ValueComparator::equal(attr("1"), AttributeValuePtr(), 100));
  CHECK_FALSE(ValueComparator::equal(AttributeValuePtr(), attr("1"), 100));
}


TEST_CASE("ValueComparator - colors", "[comparator][color]")
{
  SECTION("presence") {
    CHECK(ValueComparator::equalColor(AttributeValuePtr(), AttributeValuePtr(), 0, false));
    CHECK_FALSE(ValueComparator::equalColor(attr("[1,2,3]"), AttributeValuePtr(), 0, false));
    CHECK_FALSE(ValueComparator::equalColor(AttributeValuePtr(), attr("[1,2,3]"), 0, false));
  }
  SECTION("non-sequences never match") {
    CHECK_FALSE(ValueComparator::equalColor(attr("\"red\""), attr("\"red\""), 0, false));
    CHECK_FALSE(ValueComparator::equalColor(attr("[1,2]"), attr("{\"r\":1}"), 0, false));
  }
  SECTION("xy components are scaled by 100") {
    CHECK(ValueComparator::equalColor(attr("[0.5,0.5]"), attr("[0.5,0.5]"), 0, true));
    CHECK(ValueComparator::equalColor(attr("[0,0]"), attr("[0.02,0]"), 3, true));
    CHECK_FALSE(ValueComparator::equalColor(attr("[0,0]"), attr("[0.05,0]"), 3, true));
  }
  SECTION("other encodings compare unscaled") {
    CHECK(ValueComparator::equalColor(attr("[255,0,0]"), attr("[253,2,0]"), 3, false));
    CHECK_FALSE(ValueComparator::equalColor(attr("[255,0,0]"), attr("[250,0,0]"), 3, false));
    // prefix policy like generic sequences
    CHECK(ValueComparator::equalColor(attr("[30,80]"), attr("[30,80,99]"), 0, false));
  }
  SECTION("attribute name dispatch") {
    CHECK(ValueComparator::isColorAttribute("rgb_color"));
    CHECK(ValueComparator::isColorAttribute("xy_color"));
    CHECK_FALSE(ValueComparator::isColorAttribute("color_temp"));
    CHECK(ValueComparator::isXYColorAttribute("xy_color"));
    CHECK_FALSE(ValueComparator::isXYColorAttribute("hs_color"));
    // same values, xy scaling makes the difference
    CHECK(ValueComparator::equalAttribute("hs_color", attr("[0.1,0.1]"), attr("[0.15,0.1]"), 3));
    CHECK_FALSE(ValueComparator::equalAttribute("xy_color", attr("[0.1,0.1]"), attr("[0.15,0.1]"), 3));
    CHECK(ValueComparator::equalAttribute("brightness", attr("100"), attr("102"), 3));
  }
}
