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
#include "valuecomparator.hpp"

#include <math.h>

using namespace sscenes;


bool ValueComparator::equal(AttributeValuePtr aA, AttributeValuePtr aB, double aTolerance)
{
  if (!aA || !aB) return !aA && !aB; // absent only matches absent
  switch (aA->kind()) {
    case attr_number:
      if (!aB->isKind(attr_number)) return false;
      return fabs(aA->numberValue()-aB->numberValue())<=aTolerance;
    case attr_string:
      return aB->isKind(attr_string) && aA->stringValue()==aB->stringValue();
    case attr_bool:
      return aB->isKind(attr_bool) && aA->boolValue()==aB->boolValue();
    case attr_sequence: {
      if (!aB->isKind(attr_sequence)) return false;
      const AttributeSequence &sa = aA->sequence();
      const AttributeSequence &sb = aB->sequence();
      // only the common prefix counts
      for (size_t i=0; i<sa.size() && i<sb.size(); i++) {
        if (!equal(sa[i], sb[i], aTolerance)) return false;
      }
      return true;
    }
    case attr_mapping: {
      if (!aB->isKind(attr_mapping)) return false;
      // containment of aA in aB
      const AttributeMapping &ma = aA->mapping();
      for (AttributeMapping::const_iterator pos = ma.begin(); pos!=ma.end(); ++pos) {
        AttributeValuePtr other;
        if (!aB->get(pos->first, other)) return false;
        if (!equal(pos->second, other, aTolerance)) return false;
      }
      return true;
    }
  }
  return false;
}


bool ValueComparator::equalColor(AttributeValuePtr aA, AttributeValuePtr aB, double aTolerance, bool aIsXY)
{
  if (!aA && !aB) return true;
  if (!aA || !aB) return false;
  if (!aA->isKind(attr_sequence) || !aB->isKind(attr_sequence)) {
    LOG(LOG_DEBUG, "Colors are not sequences: %s:%s", attrDesc(aA).c_str(), attrDesc(aB).c_str());
    return false;
  }
  // xy components are in -1..1, scaling by 100 brings them into a range comparable with aTolerance
  double factor = aIsXY ? 100 : 1;
  const AttributeSequence &ca = aA->sequence();
  const AttributeSequence &cb = aB->sequence();
  for (size_t i=0; i<ca.size() && i<cb.size(); i++) {
    if (!ca[i] || !cb[i] || !ca[i]->isKind(attr_number) || !cb[i]->isKind(attr_number)) return false;
    if (fabs(ca[i]->numberValue()-cb[i]->numberValue())*factor > aTolerance) return false;
  }
  return true;
}


bool ValueComparator::isColorAttribute(const string &aAttributeName)
{
  static const string colorSuffix = "_color";
  return
    aAttributeName.size()>=colorSuffix.size() &&
    aAttributeName.compare(aAttributeName.size()-colorSuffix.size(), colorSuffix.size(), colorSuffix)==0;
}


bool ValueComparator::equalAttribute(const string &aAttributeName, AttributeValuePtr aA, AttributeValuePtr aB, double aTolerance)
{
  if (isColorAttribute(aAttributeName)) {
    bool match = equalColor(aA, aB, aTolerance, isXYColorAttribute(aAttributeName));
    LOG(LOG_DEBUG, "Key '[%s]': compare colors - %sMATCHED", aAttributeName.c_str(), match ? "" : "NOT ");
    return match;
  }
  return equal(aA, aB, aTolerance);
}
