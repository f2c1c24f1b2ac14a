// -*- LSST-C++ -*-

/*
 * LSST Data Management System
 * Copyright 2020 LSST/AURA
 *
 * This product includes software developed by the
 * LSST Project (http://www.lsst.org/).
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the LSST License Statement and
 * the GNU General Public License along with this program.  If not,
 * see <http://www.lsstcorp.org/LegalNotices/>.
 */
#ifndef LSST_MEAS_CENTROID_Result_h_INCLUDED
#define LSST_MEAS_CENTROID_Result_h_INCLUDED

#include <string>
#include <utility>
#include <vector>

#include "ndarray.h"

namespace lsst {
namespace meas {
namespace centroid {

/// Pixel type used for all image, error and intermediate arrays.
typedef double Pixel;

/// A 2-d image (or error) array; axis 0 is y (rows), axis 1 is x (columns).
typedef ndarray::Array<Pixel const, 2, 1> ImageArray;

/// A 2-d boolean array; true marks an excluded pixel.
typedef ndarray::Array<bool const, 2, 1> MaskArray;

/**
 *  Non-fatal data-quality conditions noticed while computing a result.
 *
 *  A condition never stops a computation; the affected pixels have already
 *  been excluded when it is reported.
 */
enum class Condition {
    NONFINITE_DATA,  ///< Non-finite data values were masked automatically.
    NONFINITE_ERROR  ///< Non-finite error values were masked automatically.
};

/**
 *  An ordered list of the conditions reported by a computation.
 */
class Conditions {
public:
    typedef std::pair<Condition, std::string> Entry;

    Conditions() : _entries() {}

    /// Record a condition with a human-readable description.
    void add(Condition condition, std::string const& message) { _entries.emplace_back(condition, message); }

    /// Append all entries of another list.
    void extend(Conditions const& other) {
        _entries.insert(_entries.end(), other._entries.begin(), other._entries.end());
    }

    /// Return true if the given condition has been reported at least once.
    bool has(Condition condition) const;

    bool empty() const { return _entries.empty(); }

    std::size_t size() const { return _entries.size(); }

    std::vector<Entry> const& getEntries() const { return _entries; }

private:
    std::vector<Entry> _entries;
};

/**
 *  A computed value together with the conditions reported while computing it.
 */
template <typename T>
struct Result {
    T value;
    Conditions conditions;

    Result() : value(), conditions() {}

    explicit Result(T const& value_, Conditions const& conditions_ = Conditions())
            : value(value_), conditions(conditions_) {}
};

}  // namespace centroid
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_CENTROID_Result_h_INCLUDED
