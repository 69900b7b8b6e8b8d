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
#ifndef __sscenes__entitymatcher__
#define __sscenes__entitymatcher__

#include "scenespec.hpp"
#include "valuecomparator.hpp"

using namespace std;

namespace sscenes {

  /// result of comparing an observed entity with its target
  typedef enum {
    entity_mismatched, ///< entity is missing or differs from its target
    entity_matched, ///< entity state and all compared attributes match the target
    entity_unknown ///< entity is unavailable and unavailable entities are ignored
  } MatchResult;

  /// @return "matched", "mismatched" or "unknown"
  const char *matchResultText(MatchResult aResult);


  /// compares observations of single entities with their target states
  class EntityStateMatcher
  {
    DomainAttributesPtr mDomainAttributes;

  public:

    /// @param aDomainAttributes the attributes to compare per domain, NULL for defaults
    EntityStateMatcher(DomainAttributesPtr aDomainAttributes = DomainAttributesPtr());

    DomainAttributesPtr domainAttributes() const { return mDomainAttributes; };

    /// compare an observed entity against its target
    /// @param aSpec the target
    /// @param aObserved the observation, NULL if the host does not know the entity
    /// @param aTolerance number tolerance
    /// @param aIgnoreUnavailable if set, unavailable entities yield entity_unknown
    /// @return match result
    /// @note attributes are only compared when allowed for the domain and present in both target and observation
    MatchResult check(EntitySpecPtr aSpec, EntityObservationPtr aObserved, double aTolerance, bool aIgnoreUnavailable) const;

    /// check if a change of an entity is relevant enough to re-evaluate its scene
    /// @param aOld the previous observation, NULL if none
    /// @param aNew the new observation
    /// @param aTolerance number tolerance
    /// @return true if state or any allowed attribute present in both differs, or there was no previous observation
    bool isInteresting(EntityObservationPtr aOld, EntityObservationPtr aNew, double aTolerance) const;

  private:

    bool attributesMatch(const string &aDomain, AttributeValuePtr aExpected, AttributeValuePtr aActual, double aTolerance, const string &aEntityId) const;

  };

} // namespace sscenes

#endif /* defined(__sscenes__entitymatcher__) */
