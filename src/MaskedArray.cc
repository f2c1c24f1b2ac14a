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

#include <cmath>

#include "lsst/meas/centroid/MaskedArray.h"

namespace lsst {
namespace meas {
namespace centroid {

template <int N>
MaskedArray<N>::MaskedArray(ndarray::Array<Pixel const, N, 1> const& data,
                            ndarray::Array<bool const, N, 1> const& mask)
        : _values(ndarray::allocate(data.getShape())), _excluded(ndarray::allocate(data.getShape())) {
    checkSameShape(data, mask, "mask");
    bool const hasMask = !mask.isEmpty();
    Index const shape = data.getShape();
    Index index(0);
    if (data.getNumElements() == 0) {
        return;
    }
    do {
        bool const excluded = hasMask && mask[index];
        _excluded[index] = excluded;
        _values[index] = excluded ? 0.0 : data[index];
    } while (detail::nextIndex(index, shape));
}

template <int N>
bool MaskedArray<N>::maskNonfinite() {
    bool found = false;
    Pixel* values = _values.getData();
    bool* excluded = _excluded.getData();
    for (std::size_t i = 0, n = _values.getNumElements(); i < n; ++i) {
        if (!excluded[i] && !std::isfinite(values[i])) {
            excluded[i] = true;
            values[i] = 0.0;
            found = true;
        }
    }
    return found;
}

template <int N>
bool MaskedArray<N>::maskNonfinite(ndarray::Array<Pixel const, N, 1> const& other) {
    checkSameShape(_values, other, "error");
    if (other.isEmpty()) {
        return false;
    }
    bool found = false;
    Index const shape = _values.getShape();
    Index index(0);
    if (_values.getNumElements() == 0) {
        return false;
    }
    do {
        if (!std::isfinite(other[index])) {
            if (!_excluded[index]) {
                found = true;
            }
            _excluded[index] = true;
            _values[index] = 0.0;
        }
    } while (detail::nextIndex(index, shape));
    return found;
}

template <int N>
std::size_t MaskedArray<N>::countValid() const {
    std::size_t count = 0;
    bool const* excluded = _excluded.getData();
    for (std::size_t i = 0, n = _excluded.getNumElements(); i < n; ++i) {
        if (!excluded[i]) {
            ++count;
        }
    }
    return count;
}

template class MaskedArray<1>;
template class MaskedArray<2>;
template class MaskedArray<3>;

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
