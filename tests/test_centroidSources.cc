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
#define BOOST_TEST_MODULE centroidSources

#include "boost/test/unit_test.hpp"

#include <cmath>
#include <limits>
#include <vector>

#include "ndarray.h"
#include "lsst/pex/exceptions.h"
#include "lsst/meas/centroid/centroidSources.h"
#include "lsst/meas/centroid/centroidCom.h"
#include "lsst/meas/centroid/GaussianModels.h"

namespace centroid = lsst::meas::centroid;
namespace geom = lsst::geom;
namespace pexExcept = lsst::pex::exceptions;

namespace {

int const WIDTH = 80;
int const HEIGHT = 60;

ndarray::Array<double, 2, 2> makeField() {
    centroid::GaussianConst2D star1(0.0, 100.0, 20.3, 30.6, 2.0, 2.0);
    centroid::GaussianConst2D star2(0.0, 50.0, 55.2, 40.1, 1.5, 2.5, 0.3);
    ndarray::Array<double, 2, 2> image = ndarray::allocate(HEIGHT, WIDTH);
    for (int y = 0; y < HEIGHT; ++y) {
        for (int x = 0; x < WIDTH; ++x) {
            image[y][x] = star1(x, y) + star2(x, y);
        }
    }
    return image;
}

// Centroid of the [x0, x1) x [y0, y1) part of the image, in image coordinates.
geom::Point2D comOfCrop(ndarray::Array<double, 2, 2> const& image, int x0, int x1, int y0, int y1) {
    ndarray::Array<double, 2, 2> crop = ndarray::copy(image[ndarray::view(y0, y1)(x0, x1)]);
    geom::Point2D const com = centroid::centroidCom(crop).value;
    return geom::Point2D(com.getX() + x0, com.getY() + y0);
}

}  // namespace

BOOST_AUTO_TEST_CASE(matchesManualCrop) {
    ndarray::Array<double, 2, 2> image = makeField();
    std::vector<double> const xpos = {20.0, 55.0};
    std::vector<double> const ypos = {31.0, 40.0};
    centroid::ComCentroider com;

    centroid::Result<centroid::SourceCentroids> result = centroid::centroidSources(image, xpos, ypos, com);
    BOOST_REQUIRE_EQUAL(result.value.x.size(), 2u);
    BOOST_REQUIRE_EQUAL(result.value.y.size(), 2u);

    geom::Point2D const first = comOfCrop(image, 15, 26, 26, 37);
    BOOST_CHECK_CLOSE(result.value.x[0], first.getX(), 1.0e-10);
    BOOST_CHECK_CLOSE(result.value.y[0], first.getY(), 1.0e-10);
    geom::Point2D const second = comOfCrop(image, 50, 61, 35, 46);
    BOOST_CHECK_CLOSE(result.value.x[1], second.getX(), 1.0e-10);
    BOOST_CHECK_CLOSE(result.value.y[1], second.getY(), 1.0e-10);
}

BOOST_AUTO_TEST_CASE(rectangularBoxAndFitters) {
    ndarray::Array<double, 2, 2> image = makeField();
    std::vector<double> const xpos = {21.0, 54.5};
    std::vector<double> const ypos = {30.0, 41.0};
    centroid::CentroidSourcesControl ctrl;
    ctrl.boxSize = {21, 15};

    centroid::Result<centroid::SourceCentroids> result =
            centroid::centroidSources(image, xpos, ypos, *centroid::makeCentroider("2dg"), ctrl);
    BOOST_CHECK_SMALL(result.value.x[0] - 20.3, 1.0e-2);
    BOOST_CHECK_SMALL(result.value.y[0] - 30.6, 1.0e-2);
    BOOST_CHECK_SMALL(result.value.x[1] - 55.2, 1.0e-2);
    BOOST_CHECK_SMALL(result.value.y[1] - 40.1, 1.0e-2);
}

BOOST_AUTO_TEST_CASE(imageEdge) {
    ndarray::Array<double, 2, 2> image = makeField();
    std::vector<double> const xpos = {2.0, 78.5};
    std::vector<double> const ypos = {3.0, 59.0};
    centroid::ComCentroider com;

    centroid::Result<centroid::SourceCentroids> result = centroid::centroidSources(image, xpos, ypos, com);
    // x: [ceil(2 - 5.5), +11) = [-3, 8); y: [ceil(3 - 5.5), +11) = [-2, 9)
    geom::Point2D const first = comOfCrop(image, 0, 8, 0, 9);
    BOOST_CHECK_CLOSE(result.value.x[0], first.getX(), 1.0e-10);
    BOOST_CHECK_CLOSE(result.value.y[0], first.getY(), 1.0e-10);
    // x: [73, 84); y: [54, 65)
    geom::Point2D const second = comOfCrop(image, 73, 80, 54, 60);
    BOOST_CHECK_CLOSE(result.value.x[1], second.getX(), 1.0e-10);
    BOOST_CHECK_CLOSE(result.value.y[1], second.getY(), 1.0e-10);
}

BOOST_AUTO_TEST_CASE(footprintAndMask) {
    ndarray::Array<double, 2, 2> image = makeField();
    ndarray::Array<bool, 2, 2> imageMask = ndarray::allocate(HEIGHT, WIDTH);
    imageMask.deep() = false;
    imageMask[31][20] = true;

    // 3 rows by 5 columns, excluding the corners
    ndarray::Array<bool, 2, 2> footprint = ndarray::allocate(3, 5);
    footprint.deep() = true;
    footprint[0][0] = footprint[0][4] = footprint[2][0] = footprint[2][4] = false;

    ndarray::Array<bool, 2, 2> seen = ndarray::allocate(3, 5);
    centroid::FunctionCentroider recorder(
            [&seen](centroid::ImageArray const& data, centroid::MaskArray const& mask) {
                BOOST_REQUIRE_EQUAL(data.getSize<0>(), 3u);
                BOOST_REQUIRE_EQUAL(data.getSize<1>(), 5u);
                BOOST_REQUIRE_EQUAL(mask.getSize<0>(), 3u);
                BOOST_REQUIRE_EQUAL(mask.getSize<1>(), 5u);
                seen.deep() = mask;
                return centroid::Result<geom::Point2D>(geom::Point2D(0.0, 0.0));
            });

    std::vector<double> const xpos = {20.0};
    std::vector<double> const ypos = {31.0};
    centroid::Result<centroid::SourceCentroids> result = centroid::centroidSources(
            image, xpos, ypos, recorder, centroid::CentroidSourcesControl(), footprint, centroid::ImageArray(),
            imageMask);

    // x: [ceil(20 - 2.5), +5) = [18, 23); y: [ceil(31 - 1.5), +3) = [30, 33)
    BOOST_CHECK_EQUAL(result.value.x[0], 18.0);
    BOOST_CHECK_EQUAL(result.value.y[0], 30.0);
    for (int y = 0; y < 3; ++y) {
        for (int x = 0; x < 5; ++x) {
            bool const expected = !footprint[y][x] || (y == 1 && x == 2);
            BOOST_CHECK_EQUAL(seen[y][x], expected);
        }
    }
}

BOOST_AUTO_TEST_CASE(errorRouting) {
    ndarray::Array<double, 2, 2> image = makeField();
    ndarray::Array<double, 2, 2> error = ndarray::allocate(HEIGHT, WIDTH);
    error.deep() = 2.0;
    std::vector<double> const xpos = {20.0};
    std::vector<double> const ypos = {31.0};

    int withError = 0;
    int withoutError = 0;
    centroid::FunctionErrorCentroider errorRecorder(
            [&withError, &withoutError](centroid::ImageArray const& data, centroid::MaskArray const& mask,
                                        centroid::ImageArray const& err) {
                if (err.isEmpty()) {
                    ++withoutError;
                } else {
                    BOOST_CHECK(err.getShape() == data.getShape());
                    BOOST_CHECK_EQUAL(err[0][0], 2.0);
                    ++withError;
                }
                return centroid::Result<geom::Point2D>(geom::Point2D(1.0, 2.0));
            });

    centroid::centroidSources(image, xpos, ypos, errorRecorder, centroid::CentroidSourcesControl(),
                              centroid::MaskArray(), error);
    BOOST_CHECK_EQUAL(withError, 1);
    centroid::centroidSources(image, xpos, ypos, errorRecorder);
    BOOST_CHECK_EQUAL(withoutError, 1);

    // a centroider without error support ignores the error array
    centroid::ComCentroider com;
    centroid::Result<centroid::SourceCentroids> withErr = centroid::centroidSources(
            image, xpos, ypos, com, centroid::CentroidSourcesControl(), centroid::MaskArray(), error);
    centroid::Result<centroid::SourceCentroids> noErr = centroid::centroidSources(image, xpos, ypos, com);
    BOOST_CHECK_EQUAL(withErr.value.x[0], noErr.value.x[0]);
    BOOST_CHECK_EQUAL(withErr.value.y[0], noErr.value.y[0]);
}

BOOST_AUTO_TEST_CASE(conditionsAreCollected) {
    ndarray::Array<double, 2, 2> image = makeField();
    image[40][56] = std::numeric_limits<double>::quiet_NaN();
    std::vector<double> const xpos = {20.0, 55.0};
    std::vector<double> const ypos = {31.0, 40.0};

    centroid::Result<centroid::SourceCentroids> result =
            centroid::centroidSources(image, xpos, ypos, centroid::ComCentroider());
    BOOST_CHECK_EQUAL(result.conditions.size(), 1u);
    BOOST_CHECK(result.conditions.has(centroid::Condition::NONFINITE_DATA));
    BOOST_CHECK(std::isfinite(result.value.x[1]));
}

BOOST_AUTO_TEST_CASE(invalidArguments) {
    ndarray::Array<double, 2, 2> image = makeField();
    centroid::ComCentroider com;
    std::vector<double> const one = {20.0};
    std::vector<double> const two = {20.0, 30.0};

    BOOST_CHECK_THROW(centroid::centroidSources(image, one, two, com), pexExcept::LengthError);

    centroid::CentroidSourcesControl ctrl;
    ctrl.boxSize.clear();
    BOOST_CHECK_THROW(centroid::centroidSources(image, one, one, com, ctrl), pexExcept::InvalidParameterError);
    ctrl.boxSize = {3, 3, 3};
    BOOST_CHECK_THROW(centroid::centroidSources(image, one, one, com, ctrl), pexExcept::InvalidParameterError);
    ctrl.boxSize = {0};
    BOOST_CHECK_THROW(centroid::centroidSources(image, one, one, com, ctrl), pexExcept::InvalidParameterError);

    std::vector<double> const outside = {-100.0};
    BOOST_CHECK_THROW(centroid::centroidSources(image, outside, one, com), pexExcept::InvalidParameterError);
    std::vector<double> const nan = {std::numeric_limits<double>::quiet_NaN()};
    BOOST_CHECK_THROW(centroid::centroidSources(image, nan, one, com), pexExcept::InvalidParameterError);

    ndarray::Array<bool, 2, 2> smallMask = ndarray::allocate(3, 3);
    smallMask.deep() = false;
    BOOST_CHECK_THROW(centroid::centroidSources(image, one, one, com, centroid::CentroidSourcesControl(),
                                                centroid::MaskArray(), centroid::ImageArray(), smallMask),
                      pexExcept::LengthError);
}
