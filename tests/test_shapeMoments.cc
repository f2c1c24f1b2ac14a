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
#define BOOST_TEST_MODULE shapeMoments

#include "boost/test/unit_test.hpp"

#include <cmath>

#include "ndarray.h"
#include "lsst/pex/exceptions.h"
#include "lsst/meas/centroid/ShapeMoments.h"
#include "lsst/meas/centroid/GaussianModels.h"

namespace centroid = lsst::meas::centroid;
namespace pexExcept = lsst::pex::exceptions;

namespace {

ndarray::Array<double, 2, 2> makeImage(int width, int height, centroid::GaussianConst2D const& model) {
    ndarray::Array<double, 2, 2> image = ndarray::allocate(height, width);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            image[y][x] = model(x, y);
        }
    }
    return image;
}

}  // namespace

BOOST_AUTO_TEST_CASE(rotatedGaussian) {
    double const theta = 0.5;
    centroid::GaussianConst2D model(0.0, 3.0, 40.2, 39.7, 3.0, 1.5, theta);
    ndarray::Array<double, 2, 2> data = makeImage(80, 80, model);

    centroid::ShapeEstimate const shape = centroid::estimateShape(data);
    BOOST_CHECK_SMALL(shape.centroid.getX() - 40.2, 1.0e-6);
    BOOST_CHECK_SMALL(shape.centroid.getY() - 39.7, 1.0e-6);
    BOOST_CHECK_SMALL(shape.semimajorSigma - 3.0, 1.0e-6);
    BOOST_CHECK_SMALL(shape.semiminorSigma - 1.5, 1.0e-6);
    BOOST_CHECK_SMALL(shape.orientation - theta, 1.0e-6);

    double const c = std::cos(theta);
    double const s = std::sin(theta);
    BOOST_CHECK_SMALL(shape.covariance(0, 0) - (9.0 * c * c + 2.25 * s * s), 1.0e-6);
    BOOST_CHECK_SMALL(shape.covariance(1, 1) - (9.0 * s * s + 2.25 * c * c), 1.0e-6);
    BOOST_CHECK_SMALL(shape.covariance(0, 1) - (9.0 - 2.25) * s * c, 1.0e-6);
    BOOST_CHECK_EQUAL(shape.covariance(0, 1), shape.covariance(1, 0));
}

BOOST_AUTO_TEST_CASE(singlePixelIsRegularised) {
    ndarray::Array<double, 2, 2> data = ndarray::allocate(5, 5);
    data.deep() = 0.0;
    data[2][3] = 1.0;

    centroid::ShapeEstimate const shape = centroid::estimateShape(data);
    BOOST_CHECK_SMALL(shape.centroid.getX() - 3.0, 1.0e-12);
    BOOST_CHECK_SMALL(shape.centroid.getY() - 2.0, 1.0e-12);
    BOOST_CHECK_CLOSE(shape.semimajorSigma, std::sqrt(1.0 / 12.0), 1.0e-8);
    BOOST_CHECK_CLOSE(shape.semiminorSigma, std::sqrt(1.0 / 12.0), 1.0e-8);
    BOOST_CHECK_SMALL(shape.orientation, 1.0e-12);
}

BOOST_AUTO_TEST_CASE(maskedPixelsAreIgnored) {
    centroid::GaussianConst2D model(0.0, 3.0, 20.0, 20.0, 2.0, 2.0);
    ndarray::Array<double, 2, 2> data = makeImage(40, 40, model);
    ndarray::Array<double, 2, 2> corrupted = ndarray::copy(data);
    ndarray::Array<bool, 2, 2> mask = ndarray::allocate(40, 40);
    mask.deep() = false;
    corrupted[5][30] = 1.0e6;
    mask[5][30] = true;

    centroid::ShapeEstimate const reference = centroid::estimateShape(data);
    centroid::ShapeEstimate const masked = centroid::estimateShape(corrupted, mask);
    BOOST_CHECK_CLOSE(masked.centroid.getX(), reference.centroid.getX(), 1.0e-8);
    BOOST_CHECK_CLOSE(masked.centroid.getY(), reference.centroid.getY(), 1.0e-8);
    BOOST_CHECK_CLOSE(masked.semimajorSigma, reference.semimajorSigma, 1.0e-8);

    ndarray::Array<bool, 2, 2> wrongShape = ndarray::allocate(4, 4);
    wrongShape.deep() = false;
    BOOST_CHECK_THROW(centroid::estimateShape(data, wrongShape), pexExcept::LengthError);
}
