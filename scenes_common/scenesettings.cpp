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
#include "scenesettings.hpp"

#include "scenecontroller.hpp"

using namespace sscenes;


// MARK: - SceneParamStore

string SceneParamStore::dbSchemaUpgradeSQL(int aFromVersion, int &aToVersion)
{
  string sql;
  if (aFromVersion==0) {
    // create DB from scratch
    // - use standard globs table for schema version
    sql = inherited::dbSchemaUpgradeSQL(aFromVersion, aToVersion);
    // - no store level table to create at this time
    //   (PersistentParams create and update their tables as needed)
    // reached final version in one step
    aToVersion = SCENESETTINGS_SCHEMA_VERSION;
  }
  return sql;
}


// MARK: - SceneSettings

SceneSettings::SceneSettings(SceneController &aScene, ParamStore &aParamStore) :
  inherited(aParamStore),
  mScene(aScene)
{
}


ErrorPtr SceneSettings::load()
{
  ErrorPtr err = loadFromStore(mScene.getSceneId().c_str());
  if (Error::notOK(err)) SOLOG(mScene, LOG_ERR, "Error loading settings: %s", err->text());
  return err;
}


ErrorPtr SceneSettings::save()
{
  ErrorPtr err = saveToStore(mScene.getSceneId().c_str(), false); // only one record per scene
  if (Error::notOK(err)) SOLOG(mScene, LOG_ERR, "Error saving settings: %s", err->text());
  return err;
}


// SQLIte3 table name to store these parameters to
const char *SceneSettings::tableName()
{
  return "SceneSettings";
}


// data field definitions

static const size_t numFields = 4;

size_t SceneSettings::numFieldDefs()
{
  return inherited::numFieldDefs()+numFields;
}


// scene flag definitions
// Note: these bit positions are part of persistent settings, do not change!
enum {
  sceneflags_restoreOnDeactivate = 0x0001, ///< restore previous states instead of turning off
  sceneflags_ignoreUnavailable = 0x0002, ///< unavailable entities do not count
};

const FieldDefinition *SceneSettings::getFieldDef(size_t aIndex)
{
  static const FieldDefinition dataDefs[numFields] = {
    { "sceneFlags", SQLITE_INTEGER },
    { "transitionTime", SQLITE_INTEGER },
    { "debounceTime", SQLITE_INTEGER },
    { "numberTolerance", SQLITE_FLOAT }
  };
  if (aIndex<inherited::numFieldDefs())
    return inherited::getFieldDef(aIndex);
  aIndex -= inherited::numFieldDefs();
  if (aIndex<numFields)
    return &dataDefs[aIndex];
  return NULL;
}


/// load values from passed row
void SceneSettings::loadFromRow(sqlite3pp::query::iterator &aRow, int &aIndex, uint64_t *aCommonFlagsP)
{
  inherited::loadFromRow(aRow, aIndex, aCommonFlagsP);
  // get the field values
  uint64_t flags = aRow->getCastedWithDefault<uint64_t, long long int>(aIndex++, sceneflags_restoreOnDeactivate);
  MLMicroSeconds transitionTime = aRow->getCastedWithDefault<MLMicroSeconds, long long int>(aIndex++, 0);
  MLMicroSeconds debounceTime = aRow->getCastedWithDefault<MLMicroSeconds, long long int>(aIndex++, 0);
  double tolerance = aRow->getCastedWithDefault<double, double>(aIndex++, mScene.getNumberTolerance());
  // apply to scene without re-saving
  mScene.mTransitionTime = transitionTime;
  mScene.mDebounceTime = debounceTime;
  mScene.mAggregator.setNumberTolerance(tolerance);
  mScene.mAggregator.setRestoreOnDeactivate(flags & sceneflags_restoreOnDeactivate);
  mScene.mAggregator.setIgnoreUnavailable(flags & sceneflags_ignoreUnavailable);
  // pass the flags out to subclass which called this superclass to get the flags (and decode themselves)
  if (aCommonFlagsP) *aCommonFlagsP = flags;
}


// bind values to passed statement
void SceneSettings::bindToStatement(sqlite3pp::statement &aStatement, int &aIndex, const char *aParentIdentifier, uint64_t aCommonFlags)
{
  inherited::bindToStatement(aStatement, aIndex, aParentIdentifier, aCommonFlags);
  // encode the flags
  aCommonFlags =
    (mScene.getRestoreOnDeactivate() ? sceneflags_restoreOnDeactivate : 0) |
    (mScene.getIgnoreUnavailable() ? sceneflags_ignoreUnavailable : 0);
  // bind the fields
  aStatement.bind(aIndex++, (long long int)aCommonFlags);
  aStatement.bind(aIndex++, (long long int)mScene.getTransitionTime());
  aStatement.bind(aIndex++, (long long int)mScene.getDebounceTime());
  aStatement.bind(aIndex++, mScene.getNumberTolerance());
}
