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
#include "scenehub.hpp"

#include <errno.h>
#include <string.h>

using namespace sscenes;


SceneHub::SceneHub(EntityHostPtr aHost, const string &aConfigDir, double aNumberTolerance) :
  mHost(aHost),
  mConfigDir(aConfigDir),
  mNumberTolerance(aNumberTolerance),
  mPersistenceReady(false)
{
  mDomainAttributes = DomainAttributes::defaultAttributes();
  if (!mConfigDir.empty() && mConfigDir[mConfigDir.size()-1]!='/') mConfigDir += '/';
}


SceneHub::~SceneHub()
{
  unregisterCallbacks();
  mScenes.clear();
}


ErrorPtr SceneHub::initializePersistence(const string &aDatabasePath, bool aFactoryReset)
{
  ErrorPtr err = mParamStore.connectAndInitialize(aDatabasePath.c_str(), SCENESETTINGS_SCHEMA_VERSION, SCENESETTINGS_SCHEMA_MIN_VERSION, aFactoryReset);
  mPersistenceReady = Error::isOK(err);
  if (!mPersistenceReady) {
    OLOG(LOG_ERR, "cannot open settings database '%s': %s", aDatabasePath.c_str(), err->text());
  }
  return err;
}


// MARK: - configuration files

ErrorPtr SceneHub::loadDomainAttributes()
{
  #if ENABLE_SETTINGS_FROM_FILES
  if (mConfigDir.empty()) return ErrorPtr();
  string fn = mConfigDir + "domainattributes.json";
  FILE *file = fopen(fn.c_str(), "r");
  if (!file) {
    int syserr = errno;
    if (syserr!=ENOENT) {
      // file not existing is ok, all other errors must be reported
      OLOG(LOG_ERR, "failed opening file '%s' - %s", fn.c_str(), strerror(syserr));
      return SysError::err(syserr);
    }
    OLOG(LOG_DEBUG, "loadDomainAttributes: tried '%s' - not found", fn.c_str());
    return ErrorPtr();
  }
  fclose(file);
  ErrorPtr err;
  JsonObjectPtr cfg = JsonObject::objFromFile(fn.c_str(), &err);
  if (Error::isOK(err)) {
    err = mDomainAttributes->configureFromJSON(cfg);
  }
  if (Error::notOK(err)) {
    OLOG(LOG_ERR, "invalid domain attributes in '%s': %s", fn.c_str(), err->text());
    return err;
  }
  OLOG(LOG_INFO, "domain attributes customized from %s", fn.c_str());
  #endif // ENABLE_SETTINGS_FROM_FILES
  return ErrorPtr();
}


ErrorPtr SceneHub::loadDefinitions(const string &aPath)
{
  if (aPath.empty()) {
    return Error::err<SceneError>(SceneError::DefinitionNotFound, "Scenes file not specified.");
  }
  FILE *file = fopen(aPath.c_str(), "r");
  if (!file) {
    int syserr = errno;
    if (syserr==ENOENT) {
      return Error::err<SceneError>(SceneError::DefinitionNotFound, "No scenes file %s", aPath.c_str());
    }
    return Error::err<SceneError>(SceneError::DefinitionInvalid, "No scenes found in %s - %s", aPath.c_str(), strerror(syserr));
  }
  fclose(file);
  ErrorPtr err;
  JsonObjectPtr defs = JsonObject::objFromFile(aPath.c_str(), &err);
  if (Error::notOK(err)) {
    return Error::err<SceneError>(SceneError::DefinitionInvalid, "No scenes found in %s - %s", aPath.c_str(), err->text());
  }
  return loadDefinitionsFromJSON(defs, aPath);
}


ErrorPtr SceneHub::loadDefinitionsFromJSON(JsonObjectPtr aDefinitions, const string &aSourceName)
{
  if (!aDefinitions || !aDefinitions->isType(json_type_array) || aDefinitions->arrayLength()==0) {
    return Error::err<SceneError>(SceneError::DefinitionInvalid, "No scenes found in %s", aSourceName.c_str());
  }
  ErrorPtr lastErr;
  for (int i=0; i<aDefinitions->arrayLength(); i++) {
    JsonObjectPtr rec = aDefinitions->arrayGet(i);
    ErrorPtr err = validateSceneRecord(rec);
    if (Error::notOK(err)) {
      // invalid scene only prevents this scene from being set up
      OLOG(LOG_ERR, "%s: scene #%d skipped: %s", aSourceName.c_str(), i, err->text());
      lastErr = err;
      continue;
    }
    addScene(extractSceneSpec(rec));
  }
  OLOG(LOG_NOTICE, "%s: %zu scenes loaded", aSourceName.c_str(), mScenes.size());
  return lastErr;
}


ErrorPtr SceneHub::validateSceneRecord(JsonObjectPtr aSceneRecord)
{
  if (!aSceneRecord || !aSceneRecord->isType(json_type_object)) {
    return Error::err<SceneError>(SceneError::DefinitionInvalid, "Scene definition is not an object");
  }
  JsonObjectPtr o;
  string name = "<unnamed>";
  if (aSceneRecord->get("name", o)) name = o->stringValue();
  JsonObjectPtr entities;
  if (!aSceneRecord->get("entities", entities) || !entities->isType(json_type_object)) {
    return Error::err<SceneError>(SceneError::DefinitionInvalid, "Scene is missing entities: %s", name.c_str());
  }
  if (!aSceneRecord->get("id", o)) {
    return Error::err<SceneError>(SceneError::DefinitionInvalid, "Scene is missing id: %s", name.c_str());
  }
  string entityId;
  JsonObjectPtr attrs;
  int numEntities = 0;
  entities->resetKeyIteration();
  while (entities->nextKeyValue(entityId, attrs)) {
    if (!attrs || !attrs->isType(json_type_object) || !attrs->get("state")) {
      return Error::err<SceneError>(SceneError::DefinitionInvalid, "Scene is missing state for entity %s in %s", entityId.c_str(), name.c_str());
    }
    numEntities++;
  }
  if (numEntities==0) {
    return Error::err<SceneError>(SceneError::DefinitionInvalid, "Scene has no entities: %s", name.c_str());
  }
  return ErrorPtr();
}


SceneSpecPtr SceneHub::extractSceneSpec(JsonObjectPtr aSceneRecord)
{
  JsonObjectPtr o;
  string id;
  if (aSceneRecord->get("id", o)) id = o->stringValue();
  string name = id;
  if (aSceneRecord->get("name", o)) name = o->stringValue();
  SceneSpecPtr spec = SceneSpecPtr(new SceneSpec(id, name));
  // entities, with attributes reduced to those compared for their domain
  if (aSceneRecord->get("entities", o)) {
    string entityId;
    JsonObjectPtr entityRecord;
    o->resetKeyIteration();
    while (o->nextKeyValue(entityId, entityRecord)) {
      EntitySpecPtr es = EntitySpec::fromRecord(entityId, AttributeValue::fromJson(entityRecord), mDomainAttributes);
      if (es) spec->addEntity(es);
    }
  }
  // the scene entity itself
  string sceneEntityId;
  if (aSceneRecord->get("entity_id", o)) sceneEntityId = o->stringValue();
  if (sceneEntityId.empty() && mHost) sceneEntityId = mHost->entityIdForSceneId(id);
  spec->mEntityId = sceneEntityId;
  if (aSceneRecord->get("icon", o)) spec->mIcon = o->stringValue();
  else if (mHost && !sceneEntityId.empty()) spec->mIcon = mHost->iconForEntity(sceneEntityId);
  if (aSceneRecord->get("area", o)) spec->mArea = o->stringValue();
  else if (mHost && !sceneEntityId.empty()) spec->mArea = mHost->areaForEntity(sceneEntityId);
  if (aSceneRecord->get("learn", o)) spec->mLearn = o->boolValue();
  spec->mNumberTolerance = mNumberTolerance;
  if (aSceneRecord->get("number_tolerance", o)) spec->mNumberTolerance = o->doubleValue();
  return spec;
}


SceneControllerPtr SceneHub::addExternalScene(const string &aSceneEntityId, AttributeValuePtr aEntities)
{
  if (!aEntities || !aEntities->isKind(attr_mapping)) return SceneControllerPtr();
  string id = mHost ? mHost->sceneIdForEntity(aSceneEntityId) : "";
  if (id.empty()) id = aSceneEntityId;
  string name = mHost ? mHost->nameForEntity(aSceneEntityId) : "";
  if (name.empty()) name = aSceneEntityId;
  SceneSpecPtr spec = SceneSpecPtr(new SceneSpec(id, name));
  const AttributeMapping &entities = aEntities->mapping();
  for (AttributeMapping::const_iterator pos = entities.begin(); pos!=entities.end(); ++pos) {
    EntitySpecPtr es = EntitySpec::fromRecord(pos->first, pos->second, mDomainAttributes);
    if (!es) {
      OLOG(LOG_WARNING, "external scene %s: entity %s has no state -> ignored", aSceneEntityId.c_str(), pos->first.c_str());
      continue;
    }
    spec->addEntity(es);
  }
  if (spec->numEntities()==0) return SceneControllerPtr();
  spec->mEntityId = aSceneEntityId;
  if (mHost) {
    spec->mIcon = mHost->iconForEntity(aSceneEntityId);
    spec->mArea = mHost->areaForEntity(aSceneEntityId);
  }
  spec->mLearn = true;
  spec->mNumberTolerance = mNumberTolerance;
  return addScene(spec);
}


SceneControllerPtr SceneHub::addScene(SceneSpecPtr aSceneSpec)
{
  SceneControllerPtr scene = SceneControllerPtr(new SceneController(
    aSceneSpec, mHost, mDomainAttributes, mPersistenceReady ? &mParamStore : NULL
  ));
  mScenes.push_back(scene);
  OLOG(LOG_INFO, "added %s", aSceneSpec->description().c_str());
  return scene;
}


AttributeValuePtr SceneHub::learnSceneStates(EntityHostPtr aHost, const EntityIdList &aEntityIds)
{
  AttributeValuePtr conf = AttributeValue::newMapping();
  for (EntityIdList::const_iterator pos = aEntityIds.begin(); pos!=aEntityIds.end(); ++pos) {
    EntityObservationPtr obs = aHost->getObservation(*pos);
    if (!obs) {
      LOG(LOG_WARNING, "learnSceneStates: entity not found: %s", pos->c_str());
      continue;
    }
    conf->set(*pos, obs->asStateMapping());
  }
  return conf;
}


SceneControllerPtr SceneHub::getScene(const string &aSceneId) const
{
  for (ScenesVector::const_iterator pos = mScenes.begin(); pos!=mScenes.end(); ++pos) {
    if ((*pos)->getSceneId()==aSceneId) return *pos;
  }
  return SceneControllerPtr();
}


ErrorPtr SceneHub::registerCallbacks()
{
  ErrorPtr firstErr;
  for (ScenesVector::iterator pos = mScenes.begin(); pos!=mScenes.end(); ++pos) {
    ErrorPtr err = (*pos)->registerCallbacks();
    if (Error::notOK(err)) {
      SOLOG(**pos, LOG_ERR, "cannot register callbacks: %s", err->text());
      if (!firstErr) firstErr = err;
      continue;
    }
    (*pos)->checkAllStates();
  }
  return firstErr;
}


void SceneHub::unregisterCallbacks()
{
  for (ScenesVector::iterator pos = mScenes.begin(); pos!=mScenes.end(); ++pos) {
    (*pos)->unregisterCallbacks();
  }
}
