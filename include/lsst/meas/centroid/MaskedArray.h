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
#ifndef LSST_MEAS_CENTROID_MaskedArray_h_INCLUDED
#define LSST_MEAS_CENTROID_MaskedArray_h_INCLUDED

#include <cstddef>
#include <string>

#include "boost/format.hpp"

#include "ndarray.h"
#include "lsst/pex/exceptions.h"
#include "lsst/meas/centroid/Result.h"

namespace lsst {
namespace meas {
namespace centroid {

namespace detail {

/**
 *  Advance a row-major multi-index over an array of the given shape.
 *
 *  @return false once every index has been visited.
 */
template <int N>
inline bool nextIndex(ndarray::Vector<ndarray::Size, N>& index,
                      ndarray::Vector<ndarray::Size, N> const& shape) {
    for (int k = N - 1; k >= 0; --k) {
        if (++index[k] < shape[k]) {
            return true;
        }
        index[k] = 0;
    }
    return false;
}

}  // namespace detail

/**
 *  Throw LengthError unless two arrays have the same shape.
 *
 *  @param[in] data       Reference array.
 *  @param[in] other      Array to compare; an empty array is always accepted,
 *                        as it stands for an argument that was not supplied.
 *  @param[in] otherName  Name of the other argument, for the message.
 */
template <typename T, typename U, int N, int C1, int C2>
void checkSameShape(ndarray::Array<T, N, C1> const& data, ndarray::Array<U, N, C2> const& other,
                    std::string const& otherName) {
    if (!other.isEmpty() && data.getShape() != other.getShape()) {
        throw LSST_EXCEPT(pex::exceptions::LengthError,
                          (boost::format("data and %s must have the same shape.") % otherName).str());
    }
}

/**
 *  Convert a mask of any element type to a boolean mask (nonzero is true).
 */
template <typename MaskT, int N, int C>
ndarray::Array<bool, N, N> makeBoolMask(ndarray::Array<MaskT, N, C> const& mask) {
    ndarray::Array<bool, N, N> result = ndarray::allocate(mask.getShape());
    ndarray::Vector<ndarray::Size, N> const shape = mask.getShape();
    ndarray::Vector<ndarray::Size, N> index(0);
    if (mask.getNumElements() == 0) {
        return result;
    }
    do {
        result[index] = (mask[index] != 0);
    } while (detail::nextIndex(index, shape));
    return result;
}

/**
 *  A copy of a data array paired with an explicit exclusion mask.
 *
 *  Values are copied into a contiguous array of Pixel.  Every excluded
 *  element holds zero, so sums over the values array are masked sums.
 *  Non-finite values are only excluded on request (maskNonfinite), because
 *  some algorithms must reject them instead.
 */
template <int N>
class MaskedArray {
public:
    typedef ndarray::Vector<ndarray::Size, N> Index;

    /**
     *  Copy data and apply an optional mask.
     *
     *  @throws lsst::pex::exceptions::LengthError if the mask is not empty and
     *          its shape differs from the data's.
     */
    MaskedArray(ndarray::Array<Pixel const, N, 1> const& data,
                ndarray::Array<bool const, N, 1> const& mask = ndarray::Array<bool const, N, 1>());

    /**
     *  Exclude every non-finite value that is not already excluded.
     *
     *  @return true if any value was newly excluded.
     */
    bool maskNonfinite();

    /**
     *  Exclude every element where a companion array (e.g. errors) is not
     *  finite.
     *
     *  @return true if any element was newly excluded.
     *
     *  @throws lsst::pex::exceptions::LengthError if shapes differ.
     */
    bool maskNonfinite(ndarray::Array<Pixel const, N, 1> const& other);

    /// Number of elements that are not excluded.
    std::size_t countValid() const;

    Index getShape() const { return _values.getShape(); }

    ndarray::Array<Pixel const, N, N> getValues() const { return _values; }

    ndarray::Array<bool const, N, N> getExcluded() const { return _excluded; }

private:
    ndarray::Array<Pixel, N, N> _values;
    ndarray::Array<bool, N, N> _excluded;
};

}  // namespace centroid
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_CENTROID_MaskedArray_h_INCLUDED
