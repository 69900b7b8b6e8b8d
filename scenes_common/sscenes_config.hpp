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

#ifndef __sscenes__config__
#define __sscenes__config__

/// default tolerance for comparing numbers and color components
#ifndef DEFAULT_NUMBER_TOLERANCE
  #define DEFAULT_NUMBER_TOLERANCE 3
#endif

/// persist per-scene runtime settings in the SceneSettings SQLite3 table
#ifndef ENABLE_SCENE_SETTINGS_PERSISTENCE
  #define ENABLE_SCENE_SETTINGS_PERSISTENCE 1
#endif

/// allow overriding the domain attribute table from domainattributes.json in the config dir
#ifndef ENABLE_SETTINGS_FROM_FILES
  #define ENABLE_SETTINGS_FROM_FILES 1
#endif

/// suffix appended to the id of learn scenes
#define LEARNED_SCENE_ID_SUFFIX "_learned"

/// state string the host reports for entities that are not reachable
#define UNAVAILABLE_STATE "unavailable"

#endif /* defined(__sscenes__config__) */
