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
#ifndef LSST_MEAS_CENTROID_ShapeMoments_h_INCLUDED
#define LSST_MEAS_CENTROID_ShapeMoments_h_INCLUDED

#include "Eigen/Core"

#include "lsst/geom/Point.h"
#include "lsst/meas/centroid/Result.h"

namespace lsst {
namespace meas {
namespace centroid {

/**
 *  Second-moment shape of an image, as used to seed a 2-d Gaussian fit.
 */
struct ShapeEstimate {
    geom::Point2D centroid;      ///< first-moment centroid (x, y)
    Eigen::Matrix2d covariance;  ///< [[var_x, cov_xy], [cov_xy, var_y]], regularised
    double semimajorSigma;       ///< sqrt of the larger covariance eigenvalue
    double semiminorSigma;       ///< sqrt of the smaller covariance eigenvalue
    double orientation;          ///< radians from +x to the major axis, counter-clockwise; NaN if undefined
};

/**
 *  Estimate the centroid, covariance, axis lengths and orientation of an
 *  image from its first and second moments.
 *
 *  A covariance matrix whose determinant is smaller than (1/12)^2 in
 *  absolute value is regularised by adding 1/12 to its diagonal until it is
 *  not.  Masked elements do not contribute.
 *
 *  @throws lsst::pex::exceptions::LengthError if the mask shape differs from
 *          the data shape.
 */
ShapeEstimate estimateShape(ImageArray const& data, MaskArray const& mask = MaskArray());

}  // namespace centroid
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_CENTROID_ShapeMoments_h_INCLUDED
