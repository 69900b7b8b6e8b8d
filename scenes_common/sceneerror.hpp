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
#ifndef __sscenes__sceneerror__
#define __sscenes__sceneerror__

#include "sscenes_common.hpp"

using namespace std;
using namespace p44;

namespace sscenes {

  class SceneError : public Error
  {
  public:
    // Errors
    typedef enum {
      OK,
      DefinitionNotFound, ///< scene definition source is not specified or does not exist
      DefinitionInvalid, ///< scene definition is malformed or incomplete
      NoResolvableEntity, ///< no entity_id could be derived for the scene to activate
      EntityMissing, ///< host has no observation for an entity
      NoCallbacks, ///< cannot register change callbacks (no host)
      numErrorCodes
    } ErrorCodes;

    static const char *domain() { return "StatefulScenes"; }
    virtual const char *getErrorDomain() const P44_OVERRIDE { return SceneError::domain(); };
    SceneError(ErrorCodes aError) : Error(ErrorCode(aError)) {};
    #if ENABLE_NAMED_ERRORS
  protected:
    virtual const char* errorName() const P44_OVERRIDE { return errNames[getErrorCode()]; };
  private:
    static constexpr const char* const errNames[numErrorCodes] = {
      "OK",
      "DefinitionNotFound",
      "DefinitionInvalid",
      "NoResolvableEntity",
      "EntityMissing",
      "NoCallbacks",
    };
    #endif // ENABLE_NAMED_ERRORS
  };

} // namespace sscenes

#endif /* defined(__sscenes__sceneerror__) */
