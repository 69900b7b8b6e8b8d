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
#ifndef __sscenes__attributevalue__
#define __sscenes__attributevalue__

#include "sscenes_common.hpp"

#include "jsonobject.hpp"

using namespace std;
using namespace p44;

namespace sscenes {

  /// kinds of values an attribute (or entity state) can have
  typedef enum {
    attr_string, ///< scalar text
    attr_bool, ///< scalar boolean
    attr_number, ///< number, compared with tolerance
    attr_sequence, ///< ordered list of values (e.g. color tuples)
    attr_mapping ///< ordered key/value map
  } AttributeKind;

  class AttributeValue;
  typedef boost::intrusive_ptr<AttributeValue> AttributeValuePtr;

  typedef vector<AttributeValuePtr> AttributeSequence;
  typedef vector< pair<string, AttributeValuePtr> > AttributeMapping;

  /// uniform recursive representation of entity states and attribute values.
  /// @note a NULL AttributeValuePtr represents an absent value (or JSON null)
  class AttributeValue : public P44Obj
  {
    typedef P44Obj inherited;

    AttributeKind mKind;
    string mStringValue;
    bool mBoolValue;
    double mNumberValue;
    AttributeSequence mSequence;
    AttributeMapping mMapping;

    AttributeValue(AttributeKind aKind);

  public:

    /// @name factory methods
    /// @{
    static AttributeValuePtr newString(const string &aString);
    static AttributeValuePtr newBool(bool aBool);
    static AttributeValuePtr newNumber(double aNumber);
    static AttributeValuePtr newSequence();
    static AttributeValuePtr newMapping();
    /// @}

    /// create value from JSON
    /// @param aJson JSON value, can be NULL (JSON null)
    /// @return new value, NULL for JSON null
    static AttributeValuePtr fromJson(JsonObjectPtr aJson);

    /// @return JSON representation of this value
    JsonObjectPtr toJson() const;

    AttributeKind kind() const { return mKind; };
    bool isKind(AttributeKind aKind) const { return mKind==aKind; };

    /// @return true for strings and booleans
    bool isScalar() const { return mKind==attr_string || mKind==attr_bool; };

    /// @return the string value, for non-strings the JSON representation
    string stringValue() const;
    bool boolValue() const { return mBoolValue; };
    double numberValue() const { return mNumberValue; };

    /// @name sequence access
    /// @{
    const AttributeSequence &sequence() const { return mSequence; };
    void append(AttributeValuePtr aValue);
    /// @}

    /// @name mapping access
    /// @{
    const AttributeMapping &mapping() const { return mMapping; };

    /// get a mapping member
    /// @param aKey the key
    /// @param aValue will be set to the member value (which may be NULL when the key exists with a null value)
    /// @return true if the key exists
    bool get(const string &aKey, AttributeValuePtr &aValue) const;

    /// @return member value, NULL if not found or null
    AttributeValuePtr get(const string &aKey) const;

    /// @return true if the mapping contains the key
    bool has(const string &aKey) const;

    /// set a mapping member, replacing an existing member with the same key in place
    void set(const string &aKey, AttributeValuePtr aValue);
    /// @}

    /// @return number of sequence elements or mapping members, 0 for scalars and numbers
    size_t size() const;

  };


  /// text description of a value for log messages
  /// @param aValue value, can be NULL
  /// @return JSON text or "null"
  string attrDesc(AttributeValuePtr aValue);

} // namespace sscenes

#endif /* defined(__sscenes__attributevalue__) */
