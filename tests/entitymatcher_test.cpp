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

#include "entitymatcher.hpp"
#include "testentityhost.hpp"

using namespace sscenes;


static EntitySpecPtr lightSpec(const char *aRecordJson)
{
  return EntitySpec::fromRecord("light.desk", attr(aRecordJson), DomainAttributes::defaultAttributes());
}


TEST_CASE("EntityStateMatcher - check", "[matcher]")
{
  EntityStateMatcher matcher;
  EntitySpecPtr spec = lightSpec("{\"state\":\"on\",\"brightness\":100,\"rgb_color\":[255,0,0]}");
  REQUIRE(spec);

  SECTION("missing entity does not match") {
    CHECK(matcher.check(spec, EntityObservationPtr(), 5, false)==entity_mismatched);
    CHECK(matcher.check(spec, EntityObservationPtr(), 5, true)==entity_mismatched);
  }
  SECTION("unavailable entity") {
    EntityObservationPtr obs = observation("light.desk", "unavailable");
    CHECK(matcher.check(spec, obs, 5, true)==entity_unknown);
    CHECK(matcher.check(spec, obs, 5, false)==entity_mismatched);
  }
  SECTION("state and attributes within tolerance") {
    CHECK(matcher.check(spec, observation("light.desk", "on", "{\"brightness\":104,\"rgb_color\":[251,3,0]}"), 5, false)==entity_matched);
  }
  SECTION("state mismatch") {
    CHECK(matcher.check(spec, observation("light.desk", "off", "{\"brightness\":100}"), 5, false)==entity_mismatched);
  }
  SECTION("attribute mismatch") {
    CHECK(matcher.check(spec, observation("light.desk", "on", "{\"brightness\":120}"), 5, false)==entity_mismatched);
    CHECK(matcher.check(spec, observation("light.desk", "on", "{\"rgb_color\":[0,0,255]}"), 5, false)==entity_mismatched);
  }
  SECTION("attributes missing on either side are skipped") {
    CHECK(matcher.check(spec, observation("light.desk", "on"), 5, false)==entity_matched);
    CHECK(matcher.check(spec, observation("light.desk", "on", "{\"color_temp\":300}"), 5, false)==entity_matched);
  }
  SECTION("attributes outside the allow-list are never compared") {
    CHECK(matcher.check(spec, observation("light.desk", "on", "{\"friendly_name\":\"Desk\",\"min_mireds\":1}"), 5, false)==entity_matched);
  }
}


TEST_CASE("EntityStateMatcher - spec attributes are reduced to the allow-list", "[matcher]")
{
  EntitySpecPtr spec = lightSpec("{\"state\":\"on\",\"brightness\":80,\"friendly_name\":\"Desk\"}");
  REQUIRE(spec);
  CHECK(spec->targetAttributes()->has("brightness"));
  CHECK_FALSE(spec->targetAttributes()->has("friendly_name"));
  CHECK_FALSE(spec->targetAttributes()->has("state"));
  CHECK_FALSE(EntitySpec::fromRecord("light.desk", attr("{\"brightness\":80}"), DomainAttributes::defaultAttributes()));
}


TEST_CASE("EntityStateMatcher - custom domain attributes", "[matcher]")
{
  DomainAttributesPtr da = DomainAttributesPtr(new DomainAttributes);
  da->setAttributes("fan", AttributeNameList(1, "percentage"));
  EntityStateMatcher matcher(da);
  EntitySpecPtr spec = EntitySpec::fromRecord("fan.ceiling", attr("{\"state\":\"on\",\"percentage\":50}"), da);
  REQUIRE(spec);
  CHECK(matcher.check(spec, observation("fan.ceiling", "on", "{\"percentage\":52}"), 3, false)==entity_matched);
  CHECK(matcher.check(spec, observation("fan.ceiling", "on", "{\"percentage\":60}"), 3, false)==entity_mismatched);
}


TEST_CASE("EntityStateMatcher - isInteresting", "[matcher]")
{
  EntityStateMatcher matcher;
  EntityObservationPtr obs = observation("light.desk", "on", "{\"brightness\":100,\"friendly_name\":\"Desk\"}");

  CHECK(matcher.isInteresting(EntityObservationPtr(), obs, 3));
  CHECK(matcher.isInteresting(EntityObservationPtr(), observation("switch.x", "off"), 3));
  CHECK(matcher.isInteresting(obs, observation("light.desk", "off", "{\"brightness\":100}"), 3));
  CHECK(matcher.isInteresting(obs, observation("light.desk", "on", "{\"brightness\":110}"), 3));
  CHECK_FALSE(matcher.isInteresting(obs, observation("light.desk", "on", "{\"brightness\":102}"), 3));
  // attributes outside the allow-list do not count
  CHECK_FALSE(matcher.isInteresting(obs, observation("light.desk", "on", "{\"brightness\":100,\"friendly_name\":\"Lamp\"}"), 3));
  CHECK(matcher.isInteresting(
    observation("light.desk", "on", "{\"xy_color\":[0.3,0.3]}"),
    observation("light.desk", "on", "{\"xy_color\":[0.35,0.3]}"),
    3
  ));
}
