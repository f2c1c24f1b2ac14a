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
#include <limits>

#include "Eigen/Eigenvalues"

#include "lsst/meas/centroid/ShapeMoments.h"
#include "lsst/meas/centroid/MaskedArray.h"

namespace lsst {
namespace meas {
namespace centroid {

namespace {

double const DELTA = 1.0 / 12.0;  // variance of a uniform distribution over one pixel

}  // namespace

ShapeEstimate estimateShape(ImageArray const& data, MaskArray const& mask) {
    MaskedArray<2> masked(data, mask);
    ndarray::Array<Pixel const, 2, 2> values = masked.getValues();
    int const height = values.getSize<0>();
    int const width = values.getSize<1>();

    double sum = 0.0, sumX = 0.0, sumY = 0.0;
    for (int iy = 0; iy < height; ++iy) {
        for (int ix = 0; ix < width; ++ix) {
            double const value = values[iy][ix];
            sum += value;
            sumX += ix * value;
            sumY += iy * value;
        }
    }
    double const xMean = sumX / sum;
    double const yMean = sumY / sum;

    double sumXX = 0.0, sumXY = 0.0, sumYY = 0.0;
    for (int iy = 0; iy < height; ++iy) {
        double const dy = iy - yMean;
        for (int ix = 0; ix < width; ++ix) {
            double const dx = ix - xMean;
            double const value = values[iy][ix];
            sumXX += dx * dx * value;
            sumXY += dx * dy * value;
            sumYY += dy * dy * value;
        }
    }

    ShapeEstimate result;
    result.centroid = geom::Point2D(xMean, yMean);
    result.covariance << sumXX / sum, sumXY / sum, sumXY / sum, sumYY / sum;
    // a singular covariance would give a zero-width axis
    while (std::abs(result.covariance.determinant()) < DELTA * DELTA) {
        result.covariance.diagonal().array() += DELTA;
    }

    Eigen::SelfAdjointEigenSolver<Eigen::Matrix2d> eigen(result.covariance, Eigen::EigenvaluesOnly);
    // eigenvalues are sorted in increasing order
    result.semimajorSigma = std::sqrt(eigen.eigenvalues()[1]);
    result.semiminorSigma = std::sqrt(eigen.eigenvalues()[0]);

    double const a = result.covariance(0, 0);
    double const b = result.covariance(0, 1);
    double const c = result.covariance(1, 1);
    if (a < 0.0 || c < 0.0) {
        result.orientation = std::numeric_limits<double>::quiet_NaN();
    } else {
        result.orientation = 0.5 * std::atan2(2.0 * b, a - c);
    }
    return result;
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
