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
#include "domainattributes.hpp"

#include <algorithm>

using namespace sscenes;


typedef struct {
  const char *domain;
  const char *attributes[8];
} DomainAttributesEntry;

static const DomainAttributesEntry defaultDomainAttributes[] = {
  { "light", { "brightness", "color_temp", "rgb_color", "xy_color", "hs_color", "effect", NULL } },
  { "climate", { "temperature", "hvac_mode", NULL } },
  { "switch", { NULL } },
  { "cover", { "current_position", NULL } },
  { "media_player", { "volume_level", "source", NULL } },
  { NULL, { NULL } }
};


DomainAttributes::DomainAttributes()
{
  setDefaults();
}


DomainAttributesPtr DomainAttributes::defaultAttributes()
{
  return DomainAttributesPtr(new DomainAttributes);
}


void DomainAttributes::setDefaults()
{
  mDomains.clear();
  for (const DomainAttributesEntry *de = defaultDomainAttributes; de->domain; de++) {
    AttributeNameList attrs;
    for (const char * const *ap = de->attributes; *ap; ap++) {
      attrs.push_back(*ap);
    }
    mDomains[de->domain] = attrs;
  }
}


void DomainAttributes::setAttributes(const string &aDomain, const AttributeNameList &aAttributes)
{
  mDomains[aDomain] = aAttributes;
}


void DomainAttributes::removeDomain(const string &aDomain)
{
  mDomains.erase(aDomain);
}


bool DomainAttributes::hasDomain(const string &aDomain) const
{
  return mDomains.find(aDomain)!=mDomains.end();
}


const AttributeNameList &DomainAttributes::attributesFor(const string &aDomain) const
{
  static const AttributeNameList noAttributes;
  DomainMap::const_iterator pos = mDomains.find(aDomain);
  if (pos==mDomains.end()) return noAttributes;
  return pos->second;
}


bool DomainAttributes::isAllowed(const string &aDomain, const string &aAttribute) const
{
  const AttributeNameList &attrs = attributesFor(aDomain);
  return find(attrs.begin(), attrs.end(), aAttribute)!=attrs.end();
}


ErrorPtr DomainAttributes::configureFromJSON(JsonObjectPtr aConfig)
{
  if (!aConfig || !aConfig->isType(json_type_object)) {
    return TextError::err("domain attributes must be a JSON object");
  }
  string domain;
  JsonObjectPtr attrs;
  aConfig->resetKeyIteration();
  while (aConfig->nextKeyValue(domain, attrs)) {
    if (!attrs) {
      removeDomain(domain);
      continue;
    }
    if (!attrs->isType(json_type_array)) {
      return TextError::err("attributes for domain '%s' must be an array", domain.c_str());
    }
    AttributeNameList names;
    for (int i=0; i<attrs->arrayLength(); i++) {
      JsonObjectPtr a = attrs->arrayGet(i);
      if (!a || !a->isType(json_type_string)) {
        return TextError::err("attribute #%d for domain '%s' is not a string", i, domain.c_str());
      }
      names.push_back(a->stringValue());
    }
    setAttributes(domain, names);
  }
  return ErrorPtr();
}


JsonObjectPtr DomainAttributes::toJSON() const
{
  JsonObjectPtr cfg = JsonObject::newObj();
  for (DomainMap::const_iterator pos = mDomains.begin(); pos!=mDomains.end(); ++pos) {
    JsonObjectPtr attrs = JsonObject::newArray();
    for (AttributeNameList::const_iterator apos = pos->second.begin(); apos!=pos->second.end(); ++apos) {
      attrs->arrayAppend(JsonObject::newString(*apos));
    }
    cfg->add(pos->first.c_str(), attrs);
  }
  return cfg;
}


string sscenes::domainOfEntityId(const string &aEntityId)
{
  size_t i = aEntityId.find('.');
  if (i==string::npos) return aEntityId;
  return aEntityId.substr(0, i);
}
