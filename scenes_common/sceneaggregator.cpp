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
#include "sceneaggregator.hpp"

using namespace sscenes;


SceneAggregator::SceneAggregator(SceneSpecPtr aSceneSpec, DomainAttributesPtr aDomainAttributes) :
  mSceneSpec(aSceneSpec),
  mMatcher(aDomainAttributes),
  mRestoreOnDeactivate(true),
  mIgnoreUnavailable(false),
  mNumberTolerance(aSceneSpec->getNumberTolerance())
{
  const EntitySpecVector &entities = mSceneSpec->entities();
  for (EntitySpecVector::const_iterator pos = entities.begin(); pos!=entities.end(); ++pos) {
    mRuntime[(*pos)->entityId()] = EntityRuntime();
  }
}


void SceneAggregator::observe(const string &aEntityId, MatchResult aResult, EntityObservationPtr aObservation)
{
  RuntimeMap::iterator pos = mRuntime.find(aEntityId);
  if (pos==mRuntime.end()) return;
  pos->second.mLastObservation = aObservation;
  pos->second.mLastMatch = aResult;
}


bool SceneAggregator::recomputeAll(ObservationFetchCB aFetch)
{
  const EntitySpecVector &entities = mSceneSpec->entities();
  for (EntitySpecVector::const_iterator pos = entities.begin(); pos!=entities.end(); ++pos) {
    EntityObservationPtr obs = aFetch((*pos)->entityId());
    MatchResult res = mMatcher.check(*pos, obs, mNumberTolerance, mIgnoreUnavailable);
    mRuntime[(*pos)->entityId()].mLastMatch = res;
    // without restore, the first non-matching entity proves the scene is off
    if (!mRestoreOnDeactivate && res!=entity_matched) {
      return false;
    }
  }
  return verdict();
}


bool SceneAggregator::verdict() const
{
  bool anyKnown = false;
  for (RuntimeMap::const_iterator pos = mRuntime.begin(); pos!=mRuntime.end(); ++pos) {
    switch (pos->second.mLastMatch) {
      case entity_unknown:
        break;
      case entity_mismatched:
        return false;
      case entity_matched:
        anyKnown = true;
        break;
    }
  }
  return anyKnown;
}


MatchResult SceneAggregator::lastMatch(const string &aEntityId) const
{
  RuntimeMap::const_iterator pos = mRuntime.find(aEntityId);
  if (pos==mRuntime.end()) return entity_mismatched;
  return pos->second.mLastMatch;
}


EntityObservationPtr SceneAggregator::lastObservation(const string &aEntityId) const
{
  RuntimeMap::const_iterator pos = mRuntime.find(aEntityId);
  if (pos==mRuntime.end()) return EntityObservationPtr();
  return pos->second.mLastObservation;
}


AttributeValuePtr SceneAggregator::restorePayload() const
{
  AttributeValuePtr payload = AttributeValue::newMapping();
  const EntitySpecVector &entities = mSceneSpec->entities();
  for (EntitySpecVector::const_iterator pos = entities.begin(); pos!=entities.end(); ++pos) {
    EntityObservationPtr obs = lastObservation((*pos)->entityId());
    if (!obs) continue; // never observed
    AttributeValuePtr entityState = AttributeValue::newMapping();
    entityState->set("state", obs->state());
    const AttributeNameList &attrs = mMatcher.domainAttributes()->attributesFor(obs->domain());
    for (AttributeNameList::const_iterator apos = attrs.begin(); apos!=attrs.end(); ++apos) {
      AttributeValuePtr v;
      if (obs->attributes()->get(*apos, v)) entityState->set(*apos, v);
    }
    payload->set((*pos)->entityId(), entityState);
  }
  return payload;
}
