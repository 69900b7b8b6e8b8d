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
#ifndef __sscenes__domainattributes__
#define __sscenes__domainattributes__

#include "sscenes_common.hpp"

#include "jsonobject.hpp"

using namespace std;
using namespace p44;

namespace sscenes {

  typedef vector<string> AttributeNameList;

  class DomainAttributes;
  typedef boost::intrusive_ptr<DomainAttributes> DomainAttributesPtr;

  /// per-domain list of the attributes that take part in scene comparison and restore
  class DomainAttributes : public P44Obj
  {
    typedef P44Obj inherited;

    typedef map<string, AttributeNameList> DomainMap;
    DomainMap mDomains;

  public:

    /// create with the default table
    DomainAttributes();

    /// @return a table with the default domain/attribute assignments
    static DomainAttributesPtr defaultAttributes();

    /// reset to the built-in default table
    void setDefaults();

    /// remove all domains
    void clear() { mDomains.clear(); };

    /// set the attribute list for a domain
    /// @param aDomain the entity domain (e.g. "light")
    /// @param aAttributes the attributes to compare for entities of that domain
    void setAttributes(const string &aDomain, const AttributeNameList &aAttributes);

    /// remove a domain, so none of its attributes are compared
    void removeDomain(const string &aDomain);

    /// @param aDomain the entity domain
    /// @return true if the domain is known (even with an empty attribute list)
    bool hasDomain(const string &aDomain) const;

    /// @param aDomain the entity domain
    /// @return list of attributes to compare, empty for unknown domains
    const AttributeNameList &attributesFor(const string &aDomain) const;

    /// @return true if aAttribute is compared for aDomain
    bool isAllowed(const string &aDomain, const string &aAttribute) const;

    /// update the table from JSON
    /// @param aConfig JSON object { "<domain>":["attr",...], ... }; a domain set to null is removed
    /// @return ok or error when aConfig is malformed
    ErrorPtr configureFromJSON(JsonObjectPtr aConfig);

    /// @return JSON representation of the table
    JsonObjectPtr toJSON() const;

  };


  /// @param aEntityId an entity id of the form "<domain>.<object_id>"
  /// @return the domain part of the entity id, the entire id if there is no separator
  string domainOfEntityId(const string &aEntityId);

} // namespace sscenes

#endif /* defined(__sscenes__domainattributes__) */
