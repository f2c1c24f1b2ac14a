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
#ifndef LSST_MEAS_CENTROID_centroidCom_h_INCLUDED
#define LSST_MEAS_CENTROID_centroidCom_h_INCLUDED

#include "Eigen/Core"

#include "ndarray.h"
#include "lsst/geom/Point.h"
#include "lsst/meas/centroid/Result.h"
#include "lsst/meas/centroid/Oversampling.h"

namespace lsst {
namespace meas {
namespace centroid {

/**
 *  Compute the centroid of an N-dimensional array as its "center of mass"
 *  determined from first moments.
 *
 *  Masked and non-finite values are replaced by zero before the moments are
 *  computed; finding non-finite values is reported as
 *  Condition::NONFINITE_DATA.  The centroid is undefined (NaN or inf) when
 *  the remaining values sum to zero.
 *
 *  @param[in] data          Input array; explicitly instantiated for N = 1, 2, 3.
 *  @param[in] mask          Optional array of the same shape; true excludes
 *                           the corresponding element.
 *  @param[in] oversampling  Oversampling factors in pixel order; each
 *                           coordinate is divided by the factor of its axis.
 *
 *  @return The centroid coordinates in pixel order (x, y, ...), i.e. the
 *          reverse of the array's axis order.
 *
 *  @throws lsst::pex::exceptions::LengthError if the mask shape differs from
 *          the data shape, or the number of oversampling factors is neither
 *          1 nor N.
 *  @throws lsst::pex::exceptions::InvalidParameterError if an oversampling
 *          factor is not positive.
 */
template <int N>
Result<Eigen::VectorXd> centroidCom(
        ndarray::Array<Pixel const, N, 1> const& data,
        ndarray::Array<bool const, N, 1> const& mask = ndarray::Array<bool const, N, 1>(),
        Oversampling const& oversampling = Oversampling());

/**
 *  Compute the centroid of a 2-d image from its first moments.
 *
 *  Equivalent to centroidCom<2>, returning the result as an (x, y) point.
 */
Result<geom::Point2D> centroidCom(ImageArray const& data, MaskArray const& mask = MaskArray(),
                                  Oversampling const& oversampling = Oversampling());

}  // namespace centroid
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_CENTROID_centroidCom_h_INCLUDED
