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
#include <catch2/catch.hpp>

#include "scenecontroller.hpp"
#include "testentityhost.hpp"

#include <stdlib.h>

using namespace sscenes;


static SceneSpecPtr twoLightsScene(double aTolerance = 5)
{
  DomainAttributesPtr da = DomainAttributes::defaultAttributes();
  SceneSpecPtr spec = SceneSpecPtr(new SceneSpec("reading", "Reading"));
  spec->addEntity(EntitySpec::fromRecord("light.desk", attr("{\"state\":\"on\",\"brightness\":100}"), da));
  spec->addEntity(EntitySpec::fromRecord("light.shelf", attr("{\"state\":\"on\",\"rgb_color\":[255,0,0]}"), da));
  spec->setNumberTolerance(aTolerance);
  return spec;
}


class StateCounter
{
public:
  int mCalls;
  bool mLastOn;
  StateCounter() : mCalls(0), mLastOn(false) {};
  void stateChanged(SceneController &aScene) { mCalls++; mLastOn = aScene.isOn(); };
};


TEST_CASE("SceneController - two lights end to end", "[controller]")
{
  TestEntityHostPtr host = TestEntityHostPtr(new TestEntityHost);
  SceneControllerPtr scene = SceneControllerPtr(new SceneController(twoLightsScene(), host));
  CHECK(scene->getState()==scene_unknown);
  CHECK(scene->getNumberTolerance()==5);
  host->setObservation(observation("light.desk", "on", "{\"brightness\":102}"));
  host->setObservation(observation("light.shelf", "on", "{\"rgb_color\":[254,1,0]}"));
  CHECK(scene->checkAllStates());
  CHECK(scene->isOn());
  host->setObservation(observation("light.shelf", "off"));
  CHECK_FALSE(scene->checkAllStates());
  CHECK(scene->getState()==scene_off);
}


TEST_CASE("SceneController - change notifications", "[controller]")
{
  TestEntityHostPtr host = TestEntityHostPtr(new TestEntityHost);
  SceneControllerPtr scene = SceneControllerPtr(new SceneController(twoLightsScene(), host));
  StateCounter counter;
  scene->setStateChangedCB(boost::bind(&StateCounter::stateChanged, &counter, _1));
  host->setObservation(observation("light.desk", "off"));
  host->setObservation(observation("light.shelf", "on", "{\"rgb_color\":[255,0,0]}"));
  REQUIRE(Error::isOK(scene->registerCallbacks()));
  CHECK(scene->callbacksRegistered());
  CHECK(host->numSubscriptions()==1);

  SECTION("interesting change re-evaluates immediately without debounce") {
    host->changeState(observation("light.desk", "on", "{\"brightness\":98}"));
    CHECK(counter.mCalls==1);
    CHECK(counter.mLastOn);
    CHECK(scene->isOn());
    CHECK_FALSE(scene->reEvaluationPending());
    // previous observation is kept as the restore point
    EntityObservationPtr prev = scene->aggregator().lastObservation("light.desk");
    REQUIRE(prev);
    CHECK(prev->state()->stringValue()=="off");
  }
  SECTION("irrelevant attribute change is ignored") {
    host->changeState(observation("light.shelf", "on", "{\"rgb_color\":[255,0,0],\"friendly_name\":\"Shelf\"}"));
    CHECK(counter.mCalls==0);
    CHECK(scene->getState()==scene_unknown);
  }
  SECTION("changes of foreign entities are not delivered") {
    host->changeState(observation("light.kitchen", "on"));
    CHECK(counter.mCalls==0);
  }
  SECTION("unregistering stops notifications") {
    scene->unregisterCallbacks();
    CHECK_FALSE(scene->callbacksRegistered());
    CHECK(host->numSubscriptions()==0);
    host->changeState(observation("light.desk", "on", "{\"brightness\":100}"));
    CHECK(counter.mCalls==0);
  }
  SECTION("destroying the scene unregisters") {
    scene.reset();
    CHECK(host->numSubscriptions()==0);
  }
}


TEST_CASE("SceneController - registering without host fails", "[controller]")
{
  SceneControllerPtr scene = SceneControllerPtr(new SceneController(twoLightsScene(), EntityHostPtr()));
  ErrorPtr err = scene->registerCallbacks();
  CHECK(Error::isError(err, SceneError::domain(), SceneError::NoCallbacks));
  CHECK_FALSE(scene->callbacksRegistered());
}


TEST_CASE("SceneController - turnOn", "[controller]")
{
  TestEntityHostPtr host = TestEntityHostPtr(new TestEntityHost);
  SceneSpecPtr spec = twoLightsScene();
  SceneControllerPtr scene = SceneControllerPtr(new SceneController(spec, host));
  StateCounter counter;
  scene->setStateChangedCB(boost::bind(&StateCounter::stateChanged, &counter, _1));
  scene->setTransitionTime(2*Second);

  SECTION("no resolvable entity") {
    ErrorPtr err = scene->turnOn();
    CHECK(Error::isError(err, SceneError::domain(), SceneError::NoResolvableEntity));
    CHECK(host->mActivated.empty());
    CHECK(scene->getState()==scene_unknown);
    CHECK(counter.mCalls==0);
  }
  SECTION("entity resolved through the host") {
    host->mSceneEntities["reading"] = "scene.reading";
    CHECK(Error::isOK(scene->turnOn()));
    REQUIRE(host->mActivated.size()==1);
    CHECK(host->mActivated[0]=="scene.reading");
    CHECK(host->mLastTransitionTime==2*Second);
    CHECK(scene->isOn());
    CHECK(counter.mCalls==1);
  }
  SECTION("explicit entity id") {
    spec->setEntityId("scene.explicit");
    host->mSceneEntities["reading"] = "scene.reading";
    CHECK(Error::isOK(scene->turnOn()));
    REQUIRE(host->mActivated.size()==1);
    CHECK(host->mActivated[0]=="scene.explicit");
  }
  SECTION("host failure is propagated") {
    host->mSceneEntities["reading"] = "scene.reading";
    host->mActionError = TextError::err("service unavailable");
    CHECK(Error::notOK(scene->turnOn()));
    CHECK_FALSE(scene->isOn());
  }
}


TEST_CASE("SceneController - turnOff", "[controller]")
{
  TestEntityHostPtr host = TestEntityHostPtr(new TestEntityHost);
  host->mSceneEntities["reading"] = "scene.reading";
  SceneControllerPtr scene = SceneControllerPtr(new SceneController(twoLightsScene(), host));
  host->setObservation(observation("light.desk", "on", "{\"brightness\":30}"));
  host->setObservation(observation("light.shelf", "off"));
  REQUIRE(Error::isOK(scene->registerCallbacks()));

  SECTION("not on is a no-op") {
    CHECK(Error::isOK(scene->turnOff()));
    CHECK(host->mRestoreCount==0);
    CHECK(host->mTurnOffCount==0);
    CHECK(scene->getState()==scene_unknown);
  }
  SECTION("restores the states from before activation") {
    REQUIRE(Error::isOK(scene->turnOn()));
    // host applies the scene
    host->changeState(observation("light.desk", "on", "{\"brightness\":100}"));
    host->changeState(observation("light.shelf", "on", "{\"rgb_color\":[255,0,0]}"));
    CHECK(scene->isOn());
    CHECK(Error::isOK(scene->turnOff()));
    CHECK(scene->getState()==scene_off);
    CHECK(host->mRestoreCount==1);
    CHECK(host->mTurnOffCount==0);
    AttributeValuePtr payload = host->mLastRestorePayload;
    REQUIRE(payload);
    REQUIRE(payload->has("light.desk"));
    CHECK(payload->get("light.desk")->get("brightness")->numberValue()==30);
    REQUIRE(payload->has("light.shelf"));
    CHECK(payload->get("light.shelf")->get("state")->stringValue()=="off");
  }
  SECTION("turns entities off without restore") {
    scene->setRestoreOnDeactivate(false);
    REQUIRE(Error::isOK(scene->turnOn()));
    CHECK(Error::isOK(scene->turnOff()));
    CHECK(host->mRestoreCount==0);
    CHECK(host->mTurnOffCount==1);
    REQUIRE(host->mTurnedOff.size()==2);
    CHECK(host->mTurnedOff[0]=="light.desk");
    CHECK(host->mTurnedOff[1]=="light.shelf");
    CHECK(scene->getState()==scene_off);
  }
  SECTION("host failure still ends up off") {
    REQUIRE(Error::isOK(scene->turnOn()));
    host->mActionError = TextError::err("service unavailable");
    CHECK(Error::notOK(scene->turnOff()));
    CHECK(scene->getState()==scene_off);
  }
}


TEST_CASE("SceneController - settings", "[controller]")
{
  TestEntityHostPtr host = TestEntityHostPtr(new TestEntityHost);
  SceneControllerPtr scene = SceneControllerPtr(new SceneController(twoLightsScene(), host));
  host->setObservation(observation("light.desk", "off"));
  host->setObservation(observation("light.shelf", "on", "{\"rgb_color\":[255,0,0]}"));

  SECTION("defaults") {
    CHECK(scene->getTransitionTime()==0);
    CHECK(scene->getDebounceTime()==0);
    CHECK(scene->getRestoreOnDeactivate());
    CHECK_FALSE(scene->getIgnoreUnavailable());
  }
  SECTION("negative times are clamped") {
    scene->setTransitionTime(-Second);
    scene->setDebounceTime(-Second);
    CHECK(scene->getTransitionTime()==0);
    CHECK(scene->getDebounceTime()==0);
  }
  SECTION("enabling restore rescans all entities") {
    scene->setRestoreOnDeactivate(false);
    CHECK_FALSE(scene->checkAllStates());
    CHECK(host->mFetchCount==1);
    host->resetCounters();
    scene->setRestoreOnDeactivate(true);
    CHECK(host->mFetchCount==2);
    CHECK(scene->aggregator().lastMatch("light.shelf")==entity_matched);
    host->resetCounters();
    // no transition, no rescan
    scene->setRestoreOnDeactivate(true);
    CHECK(host->mFetchCount==0);
  }
  SECTION("ignoring unavailable entities") {
    host->setObservation(observation("light.desk", "unavailable"));
    CHECK_FALSE(scene->checkAllStates());
    scene->setIgnoreUnavailable(true);
    CHECK(scene->checkAllStates());
  }
}


TEST_CASE("SceneController - learn scenes are not evaluated", "[controller]")
{
  TestEntityHostPtr host = TestEntityHostPtr(new TestEntityHost);
  SceneSpecPtr spec = twoLightsScene();
  spec->setLearn(true);
  SceneControllerPtr scene = SceneControllerPtr(new SceneController(spec, host));
  CHECK(scene->getSceneId()=="reading_learned");
  host->setObservation(observation("light.desk", "on", "{\"brightness\":100}"));
  host->setObservation(observation("light.shelf", "on", "{\"rgb_color\":[255,0,0]}"));
  CHECK_FALSE(scene->checkAllStates());
  CHECK(host->mFetchCount==0);
  CHECK(scene->getState()==scene_unknown);
}


// MARK: - debouncing

class DebounceScript
{
public:
  TestEntityHostPtr mHost;
  SceneControllerPtr mScene;
  StateCounter mCounter;
  bool mPendingBeforeExpiry;
  int mCallsBeforeExpiry;

  DebounceScript() : mPendingBeforeExpiry(false), mCallsBeforeExpiry(-1) {};

  void firstChange() { mHost->changeState(observation("light.desk", "on", "{\"brightness\":60}")); };
  void secondChange() { mHost->changeState(observation("light.desk", "on", "{\"brightness\":100}")); };
  void probe()
  {
    mPendingBeforeExpiry = mScene->reEvaluationPending();
    mCallsBeforeExpiry = mCounter.mCalls;
  };
  void done() { MainLoop::currentMainLoop().terminate(EXIT_SUCCESS); };
};


TEST_CASE("SceneController - debounced re-evaluation", "[controller][mainloop]")
{
  DebounceScript script;
  script.mHost = TestEntityHostPtr(new TestEntityHost);
  script.mScene = SceneControllerPtr(new SceneController(twoLightsScene(), script.mHost));
  script.mScene->setStateChangedCB(boost::bind(&StateCounter::stateChanged, &script.mCounter, _1));
  script.mScene->setDebounceTime(200*MilliSecond);
  script.mHost->setObservation(observation("light.desk", "off"));
  script.mHost->setObservation(observation("light.shelf", "on", "{\"rgb_color\":[255,0,0]}"));
  REQUIRE(Error::isOK(script.mScene->registerCallbacks()));

  // second change at 100mS supersedes the first, re-evaluation is due at 300mS
  MLTicket first, second, probe, done;
  first.executeOnce(boost::bind(&DebounceScript::firstChange, &script), 0);
  second.executeOnce(boost::bind(&DebounceScript::secondChange, &script), 100*MilliSecond);
  probe.executeOnce(boost::bind(&DebounceScript::probe, &script), 250*MilliSecond);
  done.executeOnce(boost::bind(&DebounceScript::done, &script), 600*MilliSecond);
  MainLoop::currentMainLoop().run();

  CHECK(script.mPendingBeforeExpiry);
  CHECK(script.mCallsBeforeExpiry==0);
  CHECK(script.mCounter.mCalls==1);
  CHECK(script.mCounter.mLastOn);
  CHECK_FALSE(script.mScene->reEvaluationPending());
  script.mScene->unregisterCallbacks();
}
