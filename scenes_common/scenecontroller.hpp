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
#ifndef __sscenes__scenecontroller__
#define __sscenes__scenecontroller__

#include "sceneaggregator.hpp"
#include "entityhost.hpp"
#include "scenesettings.hpp"
#include "sceneerror.hpp"

using namespace std;

namespace sscenes {

  /// scene state as seen from outside
  typedef enum {
    scene_unknown, ///< not activated or evaluated yet
    scene_on, ///< all (known) entities match the scene targets
    scene_off ///< at least one entity does not match
  } SceneState;

  class SceneController;
  typedef boost::intrusive_ptr<SceneController> SceneControllerPtr;

  /// callback for scene state (re-)evaluations
  /// @param aScene the scene that was evaluated
  typedef boost::function<void (SceneController &aScene)> SceneStateChangedCB;


  /// a stateful scene: activates/deactivates its entities and tracks whether it is on
  class SceneController : public P44LoggingObj
  {
    typedef P44LoggingObj inherited;
    friend class SceneSettings;

    EntityHostPtr mHost;
    SceneAggregator mAggregator;
    SceneState mState;

    MLMicroSeconds mTransitionTime; ///< transition time for activation and restore
    MLMicroSeconds mDebounceTime; ///< delay between an interesting change and re-evaluation

    MLTicket mDebounceTicket;
    bool mReEvaluationPending;
    UnsubscribeCB mUnsubscribe;
    SceneStateChangedCB mStateChangedCB;
    SceneSettingsPtr mSettings;

  public:

    /// @param aSceneSpec the scene definition
    /// @param aHost the host to fetch states from and to call services on
    /// @param aDomainAttributes attributes to compare per domain, NULL for defaults
    /// @param aParamStore if not NULL, runtime settings are loaded from and saved to this store
    SceneController(SceneSpecPtr aSceneSpec, EntityHostPtr aHost, DomainAttributesPtr aDomainAttributes = DomainAttributesPtr(), ParamStore *aParamStore = NULL);
    virtual ~SceneController();

    SceneSpecPtr sceneSpec() const { return mAggregator.sceneSpec(); };
    const SceneAggregator &aggregator() const { return mAggregator; };

    /// @return scene id (with learn suffix for learn scenes)
    string getSceneId() const { return sceneSpec()->getId(); };
    const string &getName() const { return sceneSpec()->getName(); };

    SceneState getState() const { return mState; };
    bool isOn() const { return mState==scene_on; };

    /// @name activation
    /// @{

    /// activate the scene via its scene entity
    /// @return ok, NoResolvableEntity if there is no scene entity, or the host's error
    ErrorPtr turnOn();

    /// deactivate the scene: restore recorded states or turn off all entities
    /// @return ok or the host's error
    /// @note does nothing unless the scene is on
    ErrorPtr turnOff();

    /// @}

    /// compare all entities with their targets and update the scene state
    /// @return true if the scene is on
    /// @note learn scenes only sample states, their state is not changed by comparison
    bool checkAllStates();

    /// @return the payload for restoring the recorded states
    AttributeValuePtr restorePayload() const { return mAggregator.restorePayload(); };

    /// @name settings
    /// @{
    MLMicroSeconds getTransitionTime() const { return mTransitionTime; };
    void setTransitionTime(MLMicroSeconds aTransitionTime);
    MLMicroSeconds getDebounceTime() const { return mDebounceTime; };
    void setDebounceTime(MLMicroSeconds aDebounceTime);
    double getNumberTolerance() const { return mAggregator.numberTolerance(); };
    void setNumberTolerance(double aTolerance);
    bool getRestoreOnDeactivate() const { return mAggregator.restoreOnDeactivate(); };
    /// @note enabling re-evaluates all entities immediately, as results cached while not restoring may be incomplete
    void setRestoreOnDeactivate(bool aRestoreOnDeactivate);
    bool getIgnoreUnavailable() const { return mAggregator.ignoreUnavailable(); };
    void setIgnoreUnavailable(bool aIgnoreUnavailable);
    /// @}

    /// @name change tracking
    /// @{

    /// subscribe to changes of all scene entities
    /// @return ok or NoCallbacks error if there is no host
    ErrorPtr registerCallbacks();

    /// end subscription
    void unregisterCallbacks();

    /// @return true if subscribed to entity changes
    bool callbacksRegistered() const { return !mUnsubscribe.empty(); };

    /// set handler called after every re-evaluation and activation/deactivation
    void setStateChangedCB(SceneStateChangedCB aStateChangedCB) { mStateChangedCB = aStateChangedCB; };

    /// process a change of an entity
    /// @param aEntityId the entity
    /// @param aOld observation before the change, NULL if none
    /// @param aNew observation after the change
    void entityChanged(const string &aEntityId, EntityObservationPtr aOld, EntityObservationPtr aNew);

    /// @return true if a debounced re-evaluation is pending
    bool reEvaluationPending() const { return mReEvaluationPending; };

    /// @}

    /// @name P44LoggingObj
    /// @{
    virtual string logContextPrefix() P44_OVERRIDE;
    virtual string contextName() const P44_OVERRIDE { return getName(); };
    virtual string contextType() const P44_OVERRIDE { return "scene"; };
    virtual string contextId() const P44_OVERRIDE { return getSceneId(); };
    /// @}

    string description();

  private:

    EntityObservationPtr fetchObservation(const string &aEntityId);
    void scheduleReEvaluation();
    void reEvaluate();
    void settingsChanged();
    void notifyStateChanged();

  };

} // namespace sscenes

#endif /* defined(__sscenes__scenecontroller__) */
