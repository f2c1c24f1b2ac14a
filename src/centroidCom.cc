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

#include <vector>

#include "lsst/log/Log.h"
#include "lsst/meas/centroid/centroidCom.h"
#include "lsst/meas/centroid/MaskedArray.h"

namespace lsst {
namespace meas {
namespace centroid {

namespace {

LOG_LOGGER _log = LOG_GET("lsst.meas.centroid.centroidCom");

}  // namespace

template <int N>
Result<Eigen::VectorXd> centroidCom(ndarray::Array<Pixel const, N, 1> const& data,
                                    ndarray::Array<bool const, N, 1> const& mask,
                                    Oversampling const& oversampling) {
    oversampling.validate(N);

    Result<Eigen::VectorXd> result;
    MaskedArray<N> masked(data, mask);
    if (masked.maskNonfinite()) {
        LOGL_DEBUG(_log, "Non-finite data values were automatically masked.");
        result.conditions.add(Condition::NONFINITE_DATA,
                              "Input data contains non-finite values (e.g. NaNs or infs), "
                              "which were automatically masked.");
    }

    // moments[axis] accumulates index_axis * value, in array axis order
    std::vector<double> moments(N, 0.0);
    double total = 0.0;
    typename MaskedArray<N>::Index const shape = masked.getShape();
    typename MaskedArray<N>::Index index(0);
    ndarray::Array<Pixel const, N, N> values = masked.getValues();
    if (values.getNumElements() > 0) {
        do {
            double const value = values[index];
            total += value;
            for (int axis = 0; axis < N; ++axis) {
                moments[axis] += index[axis] * value;
            }
        } while (detail::nextIndex(index, shape));
    }

    result.value = Eigen::VectorXd(N);
    for (int axis = 0; axis < N; ++axis) {
        int const pixelAxis = N - 1 - axis;
        result.value[pixelAxis] = moments[axis] / total / oversampling.getFactor(pixelAxis);
    }
    return result;
}

Result<geom::Point2D> centroidCom(ImageArray const& data, MaskArray const& mask,
                                  Oversampling const& oversampling) {
    Result<Eigen::VectorXd> com = centroidCom<2>(data, mask, oversampling);
    return Result<geom::Point2D>(geom::Point2D(com.value[0], com.value[1]), com.conditions);
}

#define INSTANTIATE(N)                                                                                 \
    template Result<Eigen::VectorXd> centroidCom<N>(ndarray::Array<Pixel const, N, 1> const&,          \
                                                    ndarray::Array<bool const, N, 1> const&,           \
                                                    Oversampling const&);

INSTANTIATE(1);
INSTANTIATE(2);
INSTANTIATE(3);

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
