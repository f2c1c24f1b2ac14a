/*
 * LSST Data Management System
 * Copyright 2008, 2009, 2010 LSST Corporation.
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

#define BOOST_TEST_DYN_LINK
#define BOOST_TEST_MODULE epsfCentroid

#include "boost/test/unit_test.hpp"

#include <cmath>
#include <limits>

#include "ndarray.h"
#include "lsst/pex/exceptions.h"
#include "lsst/meas/centroid/epsfCentroid.h"

namespace centroid = lsst::meas::centroid;
namespace pexExcept = lsst::pex::exceptions;

namespace {

/*
 * A unit-flux Gaussian integrated over unit pixels, sampled on a grid of
 * 1 + 25*oversampling points per axis with spacing 1/oversampling, centered
 * on the middle sample and offset by (dx, dy).
 */
ndarray::Array<double, 2, 2> makeIntegratedGaussian(double xOversampling, double yOversampling, double dx,
                                                    double dy, double sigma) {
    int const width = 1 + static_cast<int>(25 * xOversampling);
    int const height = 1 + static_cast<int>(25 * yOversampling);
    double const x0 = 0.5 * (width - 1) / xOversampling;
    double const y0 = 0.5 * (height - 1) / yOversampling;
    double const scale = std::sqrt(2.0) * sigma;
    ndarray::Array<double, 2, 2> data = ndarray::allocate(height, width);
    for (int iy = 0; iy < height; ++iy) {
        double const y = iy / yOversampling - y0 - dy;
        double const yFactor = std::erf((y + 0.5) / scale) - std::erf((y - 0.5) / scale);
        for (int ix = 0; ix < width; ++ix) {
            double const x = ix / xOversampling - x0 - dx;
            double const xFactor = std::erf((x + 0.5) / scale) - std::erf((x - 0.5) / scale);
            data[iy][ix] = 0.25 * xFactor * yFactor;
        }
    }
    return data;
}

ndarray::Array<bool, 2, 2> makeMask(int width, int height) {
    ndarray::Array<bool, 2, 2> mask = ndarray::allocate(height, width);
    mask.deep() = false;
    return mask;
}

// Same tolerance as |actual - expected| <= 1e-2 + 1e-3*|expected|.
void checkClose(double actual, double expected) {
    BOOST_CHECK_SMALL(actual - expected, 1.0e-2 + 1.0e-3 * std::abs(expected));
}

}  // namespace

BOOST_AUTO_TEST_CASE(integratedGaussian) {
    double const dx = 0.1;
    double const dy = 0.03;

    ndarray::Array<double, 2, 2> data = makeIntegratedGaussian(4.0, 4.0, dx, dy, 0.5);
    ndarray::Array<bool, 2, 2> mask = makeMask(data.getSize<1>(), data.getSize<0>());
    mask[0][0] = true;
    lsst::geom::Point2D center = centroid::centroidEpsf(data, mask, centroid::Oversampling(4.0));
    checkClose(center.getX(), 12.5 + dx);
    checkClose(center.getY(), 12.5 + dy);

    data = makeIntegratedGaussian(4.0, 6.0, dx, dy, 0.5);
    mask = makeMask(data.getSize<1>(), data.getSize<0>());
    mask[0][0] = true;
    center = centroid::centroidEpsf(data, mask, centroid::Oversampling(4.0, 6.0));
    checkClose(center.getX(), 12.5 + dx);
    checkClose(center.getY(), 12.5 + dy);
}

BOOST_AUTO_TEST_CASE(controlOverload) {
    ndarray::Array<double, 2, 2> data = makeIntegratedGaussian(4.0, 4.0, -0.05, 0.08, 0.5);
    centroid::EpsfCentroidControl ctrl;
    lsst::geom::Point2D const fromControl = centroid::centroidEpsf(data, centroid::MaskArray(), ctrl);
    lsst::geom::Point2D const fromDefaults = centroid::centroidEpsf(data);
    BOOST_CHECK_EQUAL(fromControl.getX(), fromDefaults.getX());
    BOOST_CHECK_EQUAL(fromControl.getY(), fromDefaults.getY());
    checkClose(fromControl.getX(), 12.5 - 0.05);
    checkClose(fromControl.getY(), 12.5 + 0.08);

    ctrl.shiftVal = 0.0;
    BOOST_CHECK_THROW(ctrl.validate(), pexExcept::InvalidParameterError);
    BOOST_CHECK_THROW(centroid::centroidEpsf(data, centroid::MaskArray(), ctrl),
                      pexExcept::InvalidParameterError);
    ctrl.shiftVal = 0.5;
    ctrl.oversamplingY = -2.0;
    BOOST_CHECK_THROW(ctrl.validate(), pexExcept::InvalidParameterError);
}

BOOST_AUTO_TEST_CASE(invalidArguments) {
    ndarray::Array<double, 2, 2> data = ndarray::allocate(5, 5);
    data.deep() = 1.0;

    BOOST_CHECK_THROW(centroid::centroidEpsf(data, makeMask(5, 4)), pexExcept::LengthError);
    BOOST_CHECK_THROW(centroid::centroidEpsf(data, centroid::MaskArray(), centroid::Oversampling(4.0), -1.0),
                      pexExcept::InvalidParameterError);
    BOOST_CHECK_THROW(centroid::centroidEpsf(data, centroid::MaskArray(), centroid::Oversampling(-1.0)),
                      pexExcept::InvalidParameterError);
    // centre +/- 3 samples does not fit in a 5x5 array
    BOOST_CHECK_THROW(centroid::centroidEpsf(data), pexExcept::InvalidParameterError);
}

BOOST_AUTO_TEST_CASE(nonfiniteSample) {
    ndarray::Array<double, 2, 2> data = ndarray::allocate(21, 21);
    data.deep() = 1.0;
    data[10][10] = std::numeric_limits<double>::infinity();
    BOOST_CHECK_THROW(centroid::centroidEpsf(data), pexExcept::InvalidParameterError);

    // a non-finite value that is masked is replaced by zero
    ndarray::Array<bool, 2, 2> mask = makeMask(21, 21);
    mask[10][10] = true;
    BOOST_CHECK_NO_THROW(centroid::centroidEpsf(data, mask));

    // and one that is not needed is ignored
    data[10][10] = 1.0;
    data[0][0] = std::numeric_limits<double>::quiet_NaN();
    BOOST_CHECK_NO_THROW(centroid::centroidEpsf(data));
}
