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
#ifndef __sscenes__sceneaggregator__
#define __sscenes__sceneaggregator__

#include "entitymatcher.hpp"

using namespace std;

namespace sscenes {

  /// callback to fetch the current observation of an entity
  /// @param aEntityId the entity
  /// @return the observation, NULL if the entity is not known
  typedef boost::function<EntityObservationPtr (const string &aEntityId)> ObservationFetchCB;


  /// runtime information per scene entity
  class EntityRuntime
  {
  public:
    EntityRuntime() : mLastMatch(entity_mismatched) {};
    MatchResult mLastMatch; ///< most recent comparison result
    EntityObservationPtr mLastObservation; ///< most recently recorded observation, used for restore only
  };


  /// aggregates the per-entity comparison results of a scene into the scene's on/off state,
  /// and keeps the observations needed for restoring entities
  class SceneAggregator
  {
    typedef map<string, EntityRuntime> RuntimeMap;

    SceneSpecPtr mSceneSpec;
    EntityStateMatcher mMatcher;
    RuntimeMap mRuntime;

    bool mRestoreOnDeactivate;
    bool mIgnoreUnavailable;
    double mNumberTolerance;

  public:

    /// @param aSceneSpec the scene (is not modified)
    /// @param aDomainAttributes attributes to compare per domain, NULL for defaults
    SceneAggregator(SceneSpecPtr aSceneSpec, DomainAttributesPtr aDomainAttributes = DomainAttributesPtr());

    SceneSpecPtr sceneSpec() const { return mSceneSpec; };
    const EntityStateMatcher &matcher() const { return mMatcher; };

    /// @name policies
    /// @{
    bool restoreOnDeactivate() const { return mRestoreOnDeactivate; };
    void setRestoreOnDeactivate(bool aRestore) { mRestoreOnDeactivate = aRestore; };
    bool ignoreUnavailable() const { return mIgnoreUnavailable; };
    void setIgnoreUnavailable(bool aIgnore) { mIgnoreUnavailable = aIgnore; };
    double numberTolerance() const { return mNumberTolerance; };
    void setNumberTolerance(double aTolerance) { mNumberTolerance = aTolerance; };
    /// @}

    /// record a match result together with the observation it was derived from
    /// @param aEntityId the entity, ignored when not part of the scene
    /// @param aResult the match result
    /// @param aObservation the raw observation, stored for restore even when not matching
    void observe(const string &aEntityId, MatchResult aResult, EntityObservationPtr aObservation);

    /// compare all entities with their targets and derive the scene state
    /// @param aFetch callback to get the current observation of an entity
    /// @return true if the scene is on
    /// @note when restoreOnDeactivate is not set, the scan stops at the first entity that is not matched
    ///   and returns false. Cached results of the entities not scanned remain from earlier passes.
    bool recomputeAll(ObservationFetchCB aFetch);

    /// derive the scene state from the cached results
    /// @return true if at least one entity is not unknown and all non-unknown entities are matched
    bool verdict() const;

    /// @return the last match result for the entity (entity_mismatched if never checked or not in the scene)
    MatchResult lastMatch(const string &aEntityId) const;

    /// @return the last recorded observation for the entity, NULL if none
    EntityObservationPtr lastObservation(const string &aEntityId) const;

    /// build the restore payload from the recorded observations
    /// @return mapping entity_id -> { "state":..., <allowed attributes>... }, entities never observed are omitted
    AttributeValuePtr restorePayload() const;

  };

} // namespace sscenes

#endif /* defined(__sscenes__sceneaggregator__) */
