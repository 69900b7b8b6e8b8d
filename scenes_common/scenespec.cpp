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
#include "scenespec.hpp"

using namespace sscenes;


// MARK: - EntityObservation

EntityObservation::EntityObservation(const string &aEntityId, AttributeValuePtr aState, AttributeValuePtr aAttributes, MLMicroSeconds aTimestamp) :
  mEntityId(aEntityId),
  mState(aState),
  mAttributes(aAttributes),
  mTimestamp(aTimestamp)
{
  if (!mAttributes || !mAttributes->isKind(attr_mapping)) mAttributes = AttributeValue::newMapping();
  if (mTimestamp==Never) mTimestamp = MainLoop::now();
}


bool EntityObservation::isUnavailable() const
{
  return mState && mState->isKind(attr_string) && mState->stringValue()==UNAVAILABLE_STATE;
}


AttributeValuePtr EntityObservation::asStateMapping() const
{
  AttributeValuePtr m = AttributeValue::newMapping();
  m->set("state", mState);
  const AttributeMapping &attrs = mAttributes->mapping();
  for (AttributeMapping::const_iterator pos = attrs.begin(); pos!=attrs.end(); ++pos) {
    m->set(pos->first, pos->second);
  }
  return m;
}


string EntityObservation::description() const
{
  return string_format("%s: state=%s attributes=%s", mEntityId.c_str(), attrDesc(mState).c_str(), attrDesc(mAttributes).c_str());
}


// MARK: - EntitySpec

EntitySpec::EntitySpec(const string &aEntityId, AttributeValuePtr aTargetState, AttributeValuePtr aTargetAttributes) :
  mEntityId(aEntityId),
  mTargetState(aTargetState),
  mTargetAttributes(aTargetAttributes)
{
  if (!mTargetAttributes || !mTargetAttributes->isKind(attr_mapping)) mTargetAttributes = AttributeValue::newMapping();
}


EntitySpecPtr EntitySpec::fromRecord(const string &aEntityId, AttributeValuePtr aRecord, DomainAttributesPtr aDomainAttributes)
{
  AttributeValuePtr state;
  if (!aRecord || !aRecord->isKind(attr_mapping) || !aRecord->get("state", state)) {
    return EntitySpecPtr();
  }
  string domain = domainOfEntityId(aEntityId);
  AttributeValuePtr attrs = AttributeValue::newMapping();
  const AttributeMapping &members = aRecord->mapping();
  for (AttributeMapping::const_iterator pos = members.begin(); pos!=members.end(); ++pos) {
    if (pos->first=="state") continue;
    if (aDomainAttributes && !aDomainAttributes->isAllowed(domain, pos->first)) continue;
    attrs->set(pos->first, pos->second);
  }
  return EntitySpecPtr(new EntitySpec(aEntityId, state, attrs));
}


// MARK: - SceneSpec

SceneSpec::SceneSpec(const string &aId, const string &aName) :
  mId(aId),
  mName(aName),
  mLearn(false),
  mNumberTolerance(DEFAULT_NUMBER_TOLERANCE)
{
}


string SceneSpec::getId() const
{
  if (mLearn) return mId + LEARNED_SCENE_ID_SUFFIX;
  return mId;
}


void SceneSpec::addEntity(EntitySpecPtr aEntitySpec)
{
  if (!aEntitySpec) return;
  for (EntitySpecVector::iterator pos = mEntities.begin(); pos!=mEntities.end(); ++pos) {
    if ((*pos)->entityId()==aEntitySpec->entityId()) {
      *pos = aEntitySpec;
      return;
    }
  }
  mEntities.push_back(aEntitySpec);
}


EntitySpecPtr SceneSpec::getEntity(const string &aEntityId) const
{
  for (EntitySpecVector::const_iterator pos = mEntities.begin(); pos!=mEntities.end(); ++pos) {
    if ((*pos)->entityId()==aEntityId) return *pos;
  }
  return EntitySpecPtr();
}


vector<string> SceneSpec::entityIds() const
{
  vector<string> ids;
  for (EntitySpecVector::const_iterator pos = mEntities.begin(); pos!=mEntities.end(); ++pos) {
    ids.push_back((*pos)->entityId());
  }
  return ids;
}


string SceneSpec::description() const
{
  string s = string_format("scene '%s' (id=%s", mName.c_str(), getId().c_str());
  if (!mEntityId.empty()) string_format_append(s, ", entity=%s", mEntityId.c_str());
  if (!mArea.empty()) string_format_append(s, ", area=%s", mArea.c_str());
  string_format_append(s, ", tolerance=%g%s)", mNumberTolerance, mLearn ? ", learn" : "");
  for (EntitySpecVector::const_iterator pos = mEntities.begin(); pos!=mEntities.end(); ++pos) {
    string_format_append(s, "\n- %s: state=%s attributes=%s", (*pos)->entityId().c_str(), attrDesc((*pos)->targetState()).c_str(), attrDesc((*pos)->targetAttributes()).c_str());
  }
  return s;
}
