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
#ifndef __sscenes__scenesettings__
#define __sscenes__scenesettings__

#include "sscenes_common.hpp"

#include "persistentparams.hpp"

using namespace std;
using namespace p44;

namespace sscenes {

  class SceneController;

  /// the database storing the runtime settings of all scenes
  class SceneParamStore : public ParamStore
  {
    typedef ParamStore inherited;

  protected:

    /// Get DB Schema creation/upgrade SQL statements
    virtual string dbSchemaUpgradeSQL(int aFromVersion, int &aToVersion) P44_OVERRIDE;

  };


  /// persistent runtime settings of a scene (transition, debounce, tolerance and policy flags).
  /// Keyed by the scene id as parent identifier.
  class SceneSettings : public PersistentParams, public P44Obj
  {
    typedef PersistentParams inherited;
    friend class SceneController;

    SceneController &mScene;

  public:
    SceneSettings(SceneController &aScene, ParamStore &aParamStore);
    virtual ~SceneSettings() {}; // important for multiple inheritance!

    /// load settings of the scene
    /// @return ok or error
    ErrorPtr load();

    /// save settings of the scene if modified
    /// @return ok or error
    ErrorPtr save();

    // persistence implementation
    virtual const char *tableName() P44_OVERRIDE;
    virtual size_t numFieldDefs() P44_OVERRIDE;
    virtual const FieldDefinition *getFieldDef(size_t aIndex) P44_OVERRIDE;
    virtual void loadFromRow(sqlite3pp::query::iterator &aRow, int &aIndex, uint64_t *aCommonFlagsP) P44_OVERRIDE;
    virtual void bindToStatement(sqlite3pp::statement &aStatement, int &aIndex, const char *aParentIdentifier, uint64_t aCommonFlags) P44_OVERRIDE;

  };
  typedef boost::intrusive_ptr<SceneSettings> SceneSettingsPtr;

} // namespace sscenes

#endif /* defined(__sscenes__scenesettings__) */
