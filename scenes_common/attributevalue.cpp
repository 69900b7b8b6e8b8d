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
#include "attributevalue.hpp"

using namespace sscenes;


AttributeValue::AttributeValue(AttributeKind aKind) :
  mKind(aKind),
  mBoolValue(false),
  mNumberValue(0)
{
}


AttributeValuePtr AttributeValue::newString(const string &aString)
{
  AttributeValuePtr v = AttributeValuePtr(new AttributeValue(attr_string));
  v->mStringValue = aString;
  return v;
}


AttributeValuePtr AttributeValue::newBool(bool aBool)
{
  AttributeValuePtr v = AttributeValuePtr(new AttributeValue(attr_bool));
  v->mBoolValue = aBool;
  return v;
}


AttributeValuePtr AttributeValue::newNumber(double aNumber)
{
  AttributeValuePtr v = AttributeValuePtr(new AttributeValue(attr_number));
  v->mNumberValue = aNumber;
  return v;
}


AttributeValuePtr AttributeValue::newSequence()
{
  return AttributeValuePtr(new AttributeValue(attr_sequence));
}


AttributeValuePtr AttributeValue::newMapping()
{
  return AttributeValuePtr(new AttributeValue(attr_mapping));
}


AttributeValuePtr AttributeValue::fromJson(JsonObjectPtr aJson)
{
  if (!aJson) return AttributeValuePtr(); // JSON null
  switch (aJson->type()) {
    case json_type_boolean:
      return newBool(aJson->boolValue());
    case json_type_int:
    case json_type_double:
      return newNumber(aJson->doubleValue());
    case json_type_array: {
      AttributeValuePtr seq = newSequence();
      for (int i=0; i<aJson->arrayLength(); i++) {
        seq->append(fromJson(aJson->arrayGet(i)));
      }
      return seq;
    }
    case json_type_object: {
      AttributeValuePtr map = newMapping();
      string key;
      JsonObjectPtr member;
      aJson->resetKeyIteration();
      while (aJson->nextKeyValue(key, member)) {
        map->set(key, fromJson(member));
      }
      return map;
    }
    case json_type_string:
      return newString(aJson->stringValue());
    default:
      break;
  }
  return AttributeValuePtr();
}


JsonObjectPtr AttributeValue::toJson() const
{
  switch (mKind) {
    case attr_string:
      return JsonObject::newString(mStringValue);
    case attr_bool:
      return JsonObject::newBool(mBoolValue);
    case attr_number:
      return JsonObject::newDouble(mNumberValue);
    case attr_sequence: {
      JsonObjectPtr arr = JsonObject::newArray();
      for (AttributeSequence::const_iterator pos = mSequence.begin(); pos!=mSequence.end(); ++pos) {
        arr->arrayAppend(*pos ? (*pos)->toJson() : JsonObjectPtr());
      }
      return arr;
    }
    case attr_mapping: {
      JsonObjectPtr obj = JsonObject::newObj();
      for (AttributeMapping::const_iterator pos = mMapping.begin(); pos!=mMapping.end(); ++pos) {
        obj->add(pos->first.c_str(), pos->second ? pos->second->toJson() : JsonObjectPtr());
      }
      return obj;
    }
  }
  return JsonObjectPtr();
}


string AttributeValue::stringValue() const
{
  if (mKind==attr_string) return mStringValue;
  return toJson()->json_str();
}


void AttributeValue::append(AttributeValuePtr aValue)
{
  mSequence.push_back(aValue);
}


bool AttributeValue::get(const string &aKey, AttributeValuePtr &aValue) const
{
  for (AttributeMapping::const_iterator pos = mMapping.begin(); pos!=mMapping.end(); ++pos) {
    if (pos->first==aKey) {
      aValue = pos->second;
      return true;
    }
  }
  return false;
}


AttributeValuePtr AttributeValue::get(const string &aKey) const
{
  AttributeValuePtr v;
  get(aKey, v);
  return v;
}


bool AttributeValue::has(const string &aKey) const
{
  AttributeValuePtr dummy;
  return get(aKey, dummy);
}


void AttributeValue::set(const string &aKey, AttributeValuePtr aValue)
{
  for (AttributeMapping::iterator pos = mMapping.begin(); pos!=mMapping.end(); ++pos) {
    if (pos->first==aKey) {
      pos->second = aValue;
      return;
    }
  }
  mMapping.push_back(make_pair(aKey, aValue));
}


size_t AttributeValue::size() const
{
  if (mKind==attr_sequence) return mSequence.size();
  if (mKind==attr_mapping) return mMapping.size();
  return 0;
}


string sscenes::attrDesc(AttributeValuePtr aValue)
{
  if (!aValue) return "null";
  return aValue->toJson()->json_str();
}
