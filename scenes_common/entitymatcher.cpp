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
// File scope debugging options
// - Set ALWAYS_DEBUG to 1 to enable DBGLOG output even in non-DEBUG builds of this file
#define ALWAYS_DEBUG 0
// - set FOCUSLOGLEVEL to non-zero log level (usually, 5,6, or 7==LOG_DEBUG) to get focus (extensive logging) for this file
//   Note: must be before including "logger.hpp" (or anything that includes "logger.hpp")
#define FOCUSLOGLEVEL 0

#include "entitymatcher.hpp"

using namespace sscenes;


const char *sscenes::matchResultText(MatchResult aResult)
{
  switch (aResult) {
    case entity_matched: return "matched";
    case entity_mismatched: return "mismatched";
    case entity_unknown: return "unknown";
  }
  return "?";
}


EntityStateMatcher::EntityStateMatcher(DomainAttributesPtr aDomainAttributes) :
  mDomainAttributes(aDomainAttributes)
{
  if (!mDomainAttributes) mDomainAttributes = DomainAttributes::defaultAttributes();
}


MatchResult EntityStateMatcher::check(EntitySpecPtr aSpec, EntityObservationPtr aObserved, double aTolerance, bool aIgnoreUnavailable) const
{
  if (!aObserved) {
    LOG(LOG_WARNING, "Entity not found: %s", aSpec->entityId().c_str());
    return entity_mismatched;
  }
  if (aIgnoreUnavailable && aObserved->isUnavailable()) {
    FOCUSLOG("%s is unavailable -> ignored", aSpec->entityId().c_str());
    return entity_unknown;
  }
  // state
  if (!ValueComparator::equal(aSpec->targetState(), aObserved->state(), aTolerance)) {
    LOG(LOG_DEBUG,
      "%s: state not matching: wanted=%s got=%s",
      aSpec->entityId().c_str(),
      attrDesc(aSpec->targetState()).c_str(),
      attrDesc(aObserved->state()).c_str()
    );
    return entity_mismatched;
  }
  // attributes
  if (!attributesMatch(aObserved->domain(), aSpec->targetAttributes(), aObserved->attributes(), aTolerance, aSpec->entityId())) {
    return entity_mismatched;
  }
  FOCUSLOG("%s matches", aSpec->entityId().c_str());
  return entity_matched;
}


bool EntityStateMatcher::isInteresting(EntityObservationPtr aOld, EntityObservationPtr aNew, double aTolerance) const
{
  if (!aOld) return true; // first observation
  if (!ValueComparator::equal(aOld->state(), aNew->state(), aTolerance)) return true;
  return !attributesMatch(aNew->domain(), aOld->attributes(), aNew->attributes(), aTolerance, aNew->entityId());
}


bool EntityStateMatcher::attributesMatch(const string &aDomain, AttributeValuePtr aExpected, AttributeValuePtr aActual, double aTolerance, const string &aEntityId) const
{
  const AttributeNameList &attrs = mDomainAttributes->attributesFor(aDomain);
  for (AttributeNameList::const_iterator pos = attrs.begin(); pos!=attrs.end(); ++pos) {
    AttributeValuePtr expected, actual;
    if (!aExpected->get(*pos, expected) || !aActual->get(*pos, actual)) continue; // only compare where both have it
    if (!ValueComparator::equalAttribute(*pos, expected, actual, aTolerance)) {
      LOG(LOG_DEBUG,
        "%s: attribute '%s' not matching: wanted=%s got=%s",
        aEntityId.c_str(), pos->c_str(),
        attrDesc(expected).c_str(),
        attrDesc(actual).c_str()
      );
      return false;
    }
  }
  return true;
}
