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
#ifndef __sscenes__entityhost__
#define __sscenes__entityhost__

#include "scenespec.hpp"

using namespace std;

namespace sscenes {

  typedef vector<string> EntityIdList;

  /// callback for entity changes
  /// @param aEntityId the entity that changed
  /// @param aOld the observation before the change, NULL if none
  /// @param aNew the observation after the change
  typedef boost::function<void (const string &aEntityId, EntityObservationPtr aOld, EntityObservationPtr aNew)> EntityChangeCB;

  /// callback to end a change subscription
  typedef boost::function<void ()> UnsubscribeCB;


  class EntityHost;
  typedef boost::intrusive_ptr<EntityHost> EntityHostPtr;

  /// the platform hosting the entities: state lookup, registry and service calls
  class EntityHost : public P44Obj
  {
    typedef P44Obj inherited;

  public:

    virtual ~EntityHost() {};

    /// @name state and registry lookup
    /// @{

    /// get the current observation of an entity
    /// @param aEntityId the entity
    /// @return current state and attributes, NULL if the entity is not known
    virtual EntityObservationPtr getObservation(const string &aEntityId) = 0;

    /// find the scene entity which has the given scene id
    /// @param aSceneId the id of the scene as defined
    /// @return entity_id, empty if none
    virtual string entityIdForSceneId(const string &aSceneId) = 0;

    /// @return the id of the scene represented by a scene entity, empty if none
    virtual string sceneIdForEntity(const string &aEntityId) { return ""; };

    /// @return the friendly name of an entity, empty if none
    virtual string nameForEntity(const string &aEntityId) { return ""; };

    /// @return the icon of an entity, empty if none
    virtual string iconForEntity(const string &aEntityId) { return ""; };

    /// @return the name of the area an entity is assigned to, empty if none
    virtual string areaForEntity(const string &aEntityId) { return ""; };

    /// @}

    /// @name actions
    /// @{

    /// activate a scene entity, i.e. apply its target states
    /// @param aSceneEntityId the scene entity
    /// @param aTransitionTime transition time
    /// @return ok or error
    virtual ErrorPtr applyTarget(const string &aSceneEntityId, MLMicroSeconds aTransitionTime) = 0;

    /// apply states to entities
    /// @param aPayload mapping entity_id -> { "state":..., <attributes>... }
    /// @param aTransitionTime transition time
    /// @return ok or error
    virtual ErrorPtr applyRestore(AttributeValuePtr aPayload, MLMicroSeconds aTransitionTime) = 0;

    /// turn entities off
    /// @param aEntityIds the entities
    /// @return ok or error
    virtual ErrorPtr turnOff(const EntityIdList &aEntityIds) = 0;

    /// @}

    /// subscribe to changes of entities
    /// @param aEntityIds the entities to watch
    /// @param aChangeCB called for every change of one of the entities
    /// @return callback which ends the subscription
    virtual UnsubscribeCB subscribeChanges(const EntityIdList &aEntityIds, EntityChangeCB aChangeCB) = 0;

  };

} // namespace sscenes

#endif /* defined(__sscenes__entityhost__) */
