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

#ifndef __p44utils__config__
#define __p44utils__config__

// statefulscenes specific p44utils configuration

#define ENABLE_JSON_APPLICATION 1
#define ENABLE_APPLICATION_SUPPORT 1
#define ENABLE_NAMED_ERRORS 1
#define ENABLE_P44SCRIPT 0
#define ENABLE_EXPRESSIONS 0

#endif /* defined(__p44utils__config__) */
