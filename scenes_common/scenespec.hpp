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
#ifndef __sscenes__scenespec__
#define __sscenes__scenespec__

#include "attributevalue.hpp"
#include "domainattributes.hpp"

using namespace std;

namespace sscenes {

  class EntityObservation;
  typedef boost::intrusive_ptr<EntityObservation> EntityObservationPtr;

  /// snapshot of the state and attributes of an entity, as observed from the host
  class EntityObservation : public P44Obj
  {
    typedef P44Obj inherited;

    string mEntityId;
    AttributeValuePtr mState;
    AttributeValuePtr mAttributes;
    MLMicroSeconds mTimestamp;

  public:

    /// @param aEntityId the observed entity
    /// @param aState the state (usually a string)
    /// @param aAttributes attribute mapping, NULL means no attributes
    /// @param aTimestamp when the observation was made, Never to use MainLoop::now()
    EntityObservation(const string &aEntityId, AttributeValuePtr aState, AttributeValuePtr aAttributes = AttributeValuePtr(), MLMicroSeconds aTimestamp = Never);

    const string &entityId() const { return mEntityId; };
    string domain() const { return domainOfEntityId(mEntityId); };
    AttributeValuePtr state() const { return mState; };
    /// @return attribute mapping, never NULL
    AttributeValuePtr attributes() const { return mAttributes; };
    MLMicroSeconds timestamp() const { return mTimestamp; };

    /// @return true if the state is the host's unavailable marker
    bool isUnavailable() const;

    /// @return {state, ...attributes} mapping, as used for learning scenes
    AttributeValuePtr asStateMapping() const;

    string description() const;

  };


  class EntitySpec;
  typedef boost::intrusive_ptr<EntitySpec> EntitySpecPtr;

  /// target state of one entity within a scene
  class EntitySpec : public P44Obj
  {
    typedef P44Obj inherited;

    string mEntityId;
    AttributeValuePtr mTargetState;
    AttributeValuePtr mTargetAttributes;

  public:

    /// @param aEntityId the entity
    /// @param aTargetState the state the entity must have
    /// @param aTargetAttributes attribute mapping the entity must match, NULL for none
    EntitySpec(const string &aEntityId, AttributeValuePtr aTargetState, AttributeValuePtr aTargetAttributes = AttributeValuePtr());

    const string &entityId() const { return mEntityId; };
    string domain() const { return domainOfEntityId(mEntityId); };
    AttributeValuePtr targetState() const { return mTargetState; };
    /// @return target attribute mapping, never NULL
    AttributeValuePtr targetAttributes() const { return mTargetAttributes; };

    /// create from a scene definition entity record
    /// @param aEntityId the entity
    /// @param aRecord mapping containing "state" plus attributes
    /// @param aDomainAttributes if not NULL, only attributes allowed for the entity's domain are kept
    /// @return new spec, NULL if aRecord has no "state"
    static EntitySpecPtr fromRecord(const string &aEntityId, AttributeValuePtr aRecord, DomainAttributesPtr aDomainAttributes);

  };

  typedef vector<EntitySpecPtr> EntitySpecVector;


  class SceneSpec;
  typedef boost::intrusive_ptr<SceneSpec> SceneSpecPtr;

  /// immutable definition of a scene
  class SceneSpec : public P44Obj
  {
    typedef P44Obj inherited;
    friend class SceneHub;

    string mId;
    string mName;
    string mIcon;
    string mArea;
    string mEntityId; ///< the host's entity representing the scene itself, can be empty
    bool mLearn;
    double mNumberTolerance;
    EntitySpecVector mEntities; ///< in declaration order

  public:

    SceneSpec(const string &aId, const string &aName);

    /// @return the id, with LEARNED_SCENE_ID_SUFFIX appended for learn scenes
    string getId() const;
    /// @return the id as defined
    const string &getDefinedId() const { return mId; };
    const string &getName() const { return mName; };
    const string &getIcon() const { return mIcon; };
    const string &getArea() const { return mArea; };
    const string &getEntityId() const { return mEntityId; };
    bool isLearn() const { return mLearn; };
    double getNumberTolerance() const { return mNumberTolerance; };

    void setIcon(const string &aIcon) { mIcon = aIcon; };
    void setArea(const string &aArea) { mArea = aArea; };
    void setEntityId(const string &aEntityId) { mEntityId = aEntityId; };
    void setLearn(bool aLearn) { mLearn = aLearn; };
    void setNumberTolerance(double aTolerance) { mNumberTolerance = aTolerance; };

    /// add an entity
    /// @note replaces an earlier spec for the same entity
    void addEntity(EntitySpecPtr aEntitySpec);

    const EntitySpecVector &entities() const { return mEntities; };
    size_t numEntities() const { return mEntities.size(); };

    /// @return spec for the entity, NULL if the entity is not part of the scene
    EntitySpecPtr getEntity(const string &aEntityId) const;

    /// @return ids of all entities, in declaration order
    vector<string> entityIds() const;

    string description() const;

  };

} // namespace sscenes

#endif /* defined(__sscenes__scenespec__) */
