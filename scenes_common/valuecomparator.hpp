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
#ifndef __sscenes__valuecomparator__
#define __sscenes__valuecomparator__

#include "attributevalue.hpp"

using namespace std;

namespace sscenes {

  /// tolerant ("fuzzy") equality over attribute values
  /// @note all comparisons are total: shapes that cannot be compared yield false, never an error
  class ValueComparator
  {
  public:

    /// compare two values
    /// - numbers match when their absolute difference is <= aTolerance
    /// - scalars (strings, booleans) must be identical
    /// - sequences are compared element by element up to the length of the shorter one,
    ///   surplus elements of the longer sequence are ignored
    /// - mappings: every key of aA must exist in aB with a matching value, keys only present
    ///   in aB are ignored. So equal(a,b) does not imply equal(b,a) for mappings.
    /// - any other combination of kinds does not match
    /// @param aA first value (NULL = absent)
    /// @param aB second value (NULL = absent)
    /// @param aTolerance max absolute difference for numbers to be considered equal
    /// @return true if values match
    static bool equal(AttributeValuePtr aA, AttributeValuePtr aB, double aTolerance);

    /// compare two color tuples
    /// @param aA first color (NULL = absent)
    /// @param aB second color (NULL = absent)
    /// @param aTolerance max absolute difference per component
    /// @param aIsXY if set, components are CIE xy coordinates; their difference is scaled by 100
    ///   to make the same tolerance meaningful for xy as for 0..255 RGB or 0..360 hue components
    /// @return true if both are absent, or both are sequences with all common components within tolerance
    static bool equalColor(AttributeValuePtr aA, AttributeValuePtr aB, double aTolerance, bool aIsXY);

    /// @param aAttributeName attribute name
    /// @return true if the attribute must be compared with equalColor()
    static bool isColorAttribute(const string &aAttributeName);

    /// @param aAttributeName attribute name
    /// @return true if the attribute holds xy color coordinates
    static bool isXYColorAttribute(const string &aAttributeName) { return aAttributeName=="xy_color"; };

    /// compare a named attribute, choosing equalColor() for color attributes and equal() for all others
    static bool equalAttribute(const string &aAttributeName, AttributeValuePtr aA, AttributeValuePtr aB, double aTolerance);

  };

} // namespace sscenes

#endif /* defined(__sscenes__valuecomparator__) */
