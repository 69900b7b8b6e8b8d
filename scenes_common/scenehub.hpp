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
#ifndef __sscenes__scenehub__
#define __sscenes__scenehub__

#include "scenecontroller.hpp"

#include "jsonobject.hpp"

using namespace std;

namespace sscenes {

  typedef vector<SceneControllerPtr> ScenesVector;

  class SceneHub;
  typedef boost::intrusive_ptr<SceneHub> SceneHubPtr;

  /// loads scene definitions and manages the resulting scenes
  class SceneHub : public P44LoggingObj
  {
    typedef P44LoggingObj inherited;

    EntityHostPtr mHost;
    string mConfigDir;
    double mNumberTolerance; ///< default tolerance for scenes not specifying their own
    DomainAttributesPtr mDomainAttributes;
    SceneParamStore mParamStore;
    bool mPersistenceReady;
    ScenesVector mScenes;

  public:

    /// @param aHost the host providing entity states and services
    /// @param aConfigDir directory to look for additional configuration files, empty for none
    /// @param aNumberTolerance default number tolerance
    SceneHub(EntityHostPtr aHost, const string &aConfigDir = "", double aNumberTolerance = DEFAULT_NUMBER_TOLERANCE);
    virtual ~SceneHub();

    EntityHostPtr getHost() const { return mHost; };
    DomainAttributesPtr getDomainAttributes() const { return mDomainAttributes; };
    double getNumberTolerance() const { return mNumberTolerance; };

    /// open (or create) the scene settings database
    /// @param aDatabasePath path of the SQLite3 file
    /// @param aFactoryReset if set, existing settings are discarded
    /// @return ok or error
    /// @note must be called before scenes are loaded to have their settings persisted
    ErrorPtr initializePersistence(const string &aDatabasePath, bool aFactoryReset = false);

    /// load domain attribute overrides from domainattributes.json in the config dir
    /// @return ok (also when there is no such file) or error
    ErrorPtr loadDomainAttributes();

    /// load scenes from a definition file
    /// @param aPath path to the JSON definition file (array of scene records)
    /// @return ok, DefinitionNotFound, DefinitionInvalid for the file as a whole,
    ///   or the last DefinitionInvalid error of scene records which were skipped
    ErrorPtr loadDefinitions(const string &aPath);

    /// load scenes from parsed definitions
    /// @param aDefinitions array of scene records
    /// @param aSourceName name of the source for messages
    /// @return see loadDefinitions()
    ErrorPtr loadDefinitionsFromJSON(JsonObjectPtr aDefinitions, const string &aSourceName);

    /// check a scene record for completeness
    /// @param aSceneRecord the record
    /// @return ok or DefinitionInvalid
    static ErrorPtr validateSceneRecord(JsonObjectPtr aSceneRecord);

    /// create a scene spec from a validated scene record
    /// @param aSceneRecord the record
    /// @return the scene spec
    SceneSpecPtr extractSceneSpec(JsonObjectPtr aSceneRecord);

    /// add a scene defined by a scene entity of the host
    /// @param aSceneEntityId the scene entity
    /// @param aEntities mapping entity_id -> { "state":..., <attributes>... }
    /// @return the new scene, NULL if aEntities contains no valid entity
    SceneControllerPtr addExternalScene(const string &aSceneEntityId, AttributeValuePtr aEntities);

    /// sample current states
    /// @param aHost the host to get states from
    /// @param aEntityIds the entities to sample
    /// @return mapping entity_id -> { "state":..., <all attributes>... }; unknown entities are omitted
    static AttributeValuePtr learnSceneStates(EntityHostPtr aHost, const EntityIdList &aEntityIds);

    /// @return all scenes in load order
    const ScenesVector &scenes() const { return mScenes; };

    /// @param aSceneId scene id
    /// @return the scene, NULL if not found
    SceneControllerPtr getScene(const string &aSceneId) const;

    /// subscribe all scenes to entity changes and evaluate their initial state
    /// @return ok or the first error
    ErrorPtr registerCallbacks();

    /// unsubscribe all scenes
    void unregisterCallbacks();

    virtual string logContextPrefix() P44_OVERRIDE { return "SceneHub"; };
    virtual string contextType() const P44_OVERRIDE { return "hub"; };

  private:

    SceneControllerPtr addScene(SceneSpecPtr aSceneSpec);

  };

} // namespace sscenes

#endif /* defined(__sscenes__scenehub__) */
