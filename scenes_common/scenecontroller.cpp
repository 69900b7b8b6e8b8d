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

#include "scenecontroller.hpp"

using namespace sscenes;


SceneController::SceneController(SceneSpecPtr aSceneSpec, EntityHostPtr aHost, DomainAttributesPtr aDomainAttributes, ParamStore *aParamStore) :
  mHost(aHost),
  mAggregator(aSceneSpec, aDomainAttributes),
  mState(scene_unknown),
  mTransitionTime(0),
  mDebounceTime(0),
  mReEvaluationPending(false)
{
  #if ENABLE_SCENE_SETTINGS_PERSISTENCE
  if (aParamStore) {
    mSettings = SceneSettingsPtr(new SceneSettings(*this, *aParamStore));
    mSettings->load();
  }
  #endif
}


SceneController::~SceneController()
{
  mDebounceTicket.cancel();
  unregisterCallbacks();
}


string SceneController::logContextPrefix()
{
  return string_format("scene '%s'", getName().c_str());
}


string SceneController::description()
{
  return string_format(
    "%s\n- state: %s, transition: %.3fS, debounce: %.3fS, restore: %s, ignore unavailable: %s",
    sceneSpec()->description().c_str(),
    mState==scene_on ? "on" : (mState==scene_off ? "off" : "unknown"),
    (double)mTransitionTime/Second,
    (double)mDebounceTime/Second,
    getRestoreOnDeactivate() ? "yes" : "no",
    getIgnoreUnavailable() ? "yes" : "no"
  );
}


// MARK: - activation

ErrorPtr SceneController::turnOn()
{
  string entityId = sceneSpec()->getEntityId();
  if (entityId.empty() && mHost) {
    entityId = mHost->entityIdForSceneId(sceneSpec()->getDefinedId());
  }
  if (entityId.empty()) {
    return Error::err<SceneError>(SceneError::NoResolvableEntity, "Cannot find entity_id for: %s", getName().c_str());
  }
  if (!mHost) {
    return TextError::err("no host to activate %s", entityId.c_str());
  }
  OLOG(LOG_NOTICE, "activating via %s, transition %.3fS", entityId.c_str(), (double)mTransitionTime/Second);
  ErrorPtr err = mHost->applyTarget(entityId, mTransitionTime);
  if (Error::notOK(err)) {
    OLOG(LOG_ERR, "activation failed: %s", err->text());
    return err;
  }
  mState = scene_on;
  notifyStateChanged();
  return err;
}


ErrorPtr SceneController::turnOff()
{
  if (mState!=scene_on) return ErrorPtr(); // already off
  ErrorPtr err;
  if (mHost) {
    if (getRestoreOnDeactivate()) {
      AttributeValuePtr payload = restorePayload();
      OLOG(LOG_NOTICE, "deactivating: restoring %zu entities", payload->size());
      err = mHost->applyRestore(payload, mTransitionTime);
    }
    else {
      OLOG(LOG_NOTICE, "deactivating: turning off %zu entities", sceneSpec()->numEntities());
      err = mHost->turnOff(sceneSpec()->entityIds());
    }
    if (Error::notOK(err)) OLOG(LOG_ERR, "deactivation failed: %s", err->text());
  }
  mState = scene_off;
  notifyStateChanged();
  return err;
}


// MARK: - evaluation

EntityObservationPtr SceneController::fetchObservation(const string &aEntityId)
{
  if (!mHost) return EntityObservationPtr();
  return mHost->getObservation(aEntityId);
}


bool SceneController::checkAllStates()
{
  if (sceneSpec()->isLearn()) {
    FOCUSLOG("learn scene, not evaluated");
    return isOn();
  }
  bool on = mAggregator.recomputeAll(boost::bind(&SceneController::fetchObservation, this, _1));
  SceneState newState = on ? scene_on : scene_off;
  if (newState!=mState) {
    OLOG(LOG_INFO, "is now %s", on ? "ON" : "OFF");
  }
  mState = newState;
  return on;
}


void SceneController::entityChanged(const string &aEntityId, EntityObservationPtr aOld, EntityObservationPtr aNew)
{
  EntitySpecPtr spec = sceneSpec()->getEntity(aEntityId);
  if (!spec || !aNew) return;
  // the state before the change is what deactivation restores
  MatchResult oldMatch = aOld ? mAggregator.matcher().check(spec, aOld, getNumberTolerance(), getIgnoreUnavailable()) : entity_mismatched;
  mAggregator.observe(aEntityId, oldMatch, aOld);
  if (mAggregator.matcher().isInteresting(aOld, aNew, getNumberTolerance())) {
    FOCUSLOG("interesting change of %s", aEntityId.c_str());
    scheduleReEvaluation();
  }
}


void SceneController::scheduleReEvaluation()
{
  // a newer change supersedes a pending wait
  mDebounceTicket.cancel();
  if (mDebounceTime<=0) {
    mReEvaluationPending = false;
    reEvaluate();
    return;
  }
  mReEvaluationPending = true;
  mDebounceTicket.executeOnce(boost::bind(&SceneController::reEvaluate, this), mDebounceTime);
}


void SceneController::reEvaluate()
{
  mReEvaluationPending = false;
  checkAllStates();
  notifyStateChanged();
}


void SceneController::notifyStateChanged()
{
  if (mStateChangedCB) mStateChangedCB(*this);
}


// MARK: - change subscription

ErrorPtr SceneController::registerCallbacks()
{
  if (!mHost) {
    return Error::err<SceneError>(SceneError::NoCallbacks, "No host to register callbacks with for scene %s", getName().c_str());
  }
  unregisterCallbacks();
  mUnsubscribe = mHost->subscribeChanges(sceneSpec()->entityIds(), boost::bind(&SceneController::entityChanged, this, _1, _2, _3));
  return ErrorPtr();
}


void SceneController::unregisterCallbacks()
{
  if (mUnsubscribe) {
    UnsubscribeCB unsubscribe = mUnsubscribe;
    mUnsubscribe.clear();
    unsubscribe();
  }
}


// MARK: - settings

void SceneController::setTransitionTime(MLMicroSeconds aTransitionTime)
{
  if (aTransitionTime<0) aTransitionTime = 0;
  if (aTransitionTime!=mTransitionTime) {
    mTransitionTime = aTransitionTime;
    settingsChanged();
  }
}


void SceneController::setDebounceTime(MLMicroSeconds aDebounceTime)
{
  if (aDebounceTime<0) aDebounceTime = 0;
  if (aDebounceTime!=mDebounceTime) {
    mDebounceTime = aDebounceTime;
    settingsChanged();
  }
}


void SceneController::setNumberTolerance(double aTolerance)
{
  if (aTolerance<0) aTolerance = 0;
  if (aTolerance!=getNumberTolerance()) {
    mAggregator.setNumberTolerance(aTolerance);
    settingsChanged();
  }
}


void SceneController::setRestoreOnDeactivate(bool aRestoreOnDeactivate)
{
  bool runUpdate = !getRestoreOnDeactivate() && aRestoreOnDeactivate;
  if (aRestoreOnDeactivate!=getRestoreOnDeactivate()) {
    mAggregator.setRestoreOnDeactivate(aRestoreOnDeactivate);
    settingsChanged();
  }
  if (runUpdate) {
    // results cached while not restoring may stem from partial scans
    checkAllStates();
  }
}


void SceneController::setIgnoreUnavailable(bool aIgnoreUnavailable)
{
  if (aIgnoreUnavailable!=getIgnoreUnavailable()) {
    mAggregator.setIgnoreUnavailable(aIgnoreUnavailable);
    settingsChanged();
  }
}


void SceneController::settingsChanged()
{
  if (mSettings) {
    mSettings->markDirty();
    mSettings->save();
  }
}
