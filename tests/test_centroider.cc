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
#define BOOST_TEST_MODULE centroider

#include "boost/test/unit_test.hpp"

#include <memory>

#include "ndarray.h"
#include "lsst/pex/exceptions.h"
#include "lsst/meas/centroid/Centroider.h"
#include "lsst/meas/centroid/centroidCom.h"
#include "lsst/meas/centroid/gaussianCentroid.h"
#include "lsst/meas/centroid/GaussianModels.h"

namespace centroid = lsst::meas::centroid;
namespace geom = lsst::geom;
namespace pexExcept = lsst::pex::exceptions;

namespace {

ndarray::Array<double, 2, 2> makeStar() {
    centroid::GaussianConst2D model(0.0, 10.0, 12.4, 10.8, 2.0, 2.0);
    ndarray::Array<double, 2, 2> image = ndarray::allocate(21, 25);
    for (int y = 0; y < 21; ++y) {
        for (int x = 0; x < 25; ++x) {
            image[y][x] = model(x, y);
        }
    }
    return image;
}

}  // namespace

BOOST_AUTO_TEST_CASE(factory) {
    std::shared_ptr<centroid::Centroider> com = centroid::makeCentroider("com");
    BOOST_CHECK(std::dynamic_pointer_cast<centroid::ComCentroider>(com));
    BOOST_CHECK(!com->usesError());

    std::shared_ptr<centroid::Centroider> g1 = centroid::makeCentroider("1dg");
    BOOST_CHECK(std::dynamic_pointer_cast<centroid::Gaussian1dCentroider>(g1));
    BOOST_CHECK(g1->usesError());

    std::shared_ptr<centroid::Centroider> g2 = centroid::makeCentroider("2dg");
    BOOST_CHECK(std::dynamic_pointer_cast<centroid::Gaussian2dCentroider>(g2));
    BOOST_CHECK(g2->usesError());

    std::shared_ptr<centroid::Centroider> epsf = centroid::makeCentroider("epsf");
    BOOST_CHECK(std::dynamic_pointer_cast<centroid::EpsfCentroider>(epsf));
    BOOST_CHECK(!epsf->usesError());

    BOOST_CHECK_THROW(centroid::makeCentroider("3dg"), pexExcept::NotFoundError);
}

BOOST_AUTO_TEST_CASE(strategiesAgree) {
    ndarray::Array<double, 2, 2> image = makeStar();
    ndarray::Array<double, 2, 2> error = ndarray::allocate(21, 25);
    error.deep() = 0.5;

    char const* names[] = {"com", "1dg", "2dg"};
    for (char const* name : names) {
        std::shared_ptr<centroid::Centroider> cc = centroid::makeCentroider(name);
        centroid::Result<geom::Point2D> result = cc->apply(image);
        BOOST_CHECK_SMALL(result.value.getX() - 12.4, 1.0e-3);
        BOOST_CHECK_SMALL(result.value.getY() - 10.8, 1.0e-3);

        result = cc->apply(image, centroid::MaskArray(), error);
        BOOST_CHECK_SMALL(result.value.getX() - 12.4, 1.0e-3);
        BOOST_CHECK_SMALL(result.value.getY() - 10.8, 1.0e-3);
    }
}

BOOST_AUTO_TEST_CASE(comOversampling) {
    ndarray::Array<double, 2, 2> image = makeStar();
    centroid::ComCentroider com(centroid::Oversampling(2.0, 4.0));
    centroid::Result<geom::Point2D> result = com.apply(image);
    BOOST_CHECK_SMALL(result.value.getX() - 12.4 / 2.0, 1.0e-3);
    BOOST_CHECK_SMALL(result.value.getY() - 10.8 / 4.0, 1.0e-3);

    BOOST_CHECK_THROW(centroid::ComCentroider{centroid::Oversampling(-1.0)}, pexExcept::InvalidParameterError);
}

BOOST_AUTO_TEST_CASE(invalidControls) {
    centroid::LevMarControl levMar;
    levMar.maxEvaluations = -3;
    BOOST_CHECK_THROW(centroid::Gaussian1dCentroider{levMar}, pexExcept::InvalidParameterError);
    BOOST_CHECK_THROW(centroid::Gaussian2dCentroider{levMar}, pexExcept::InvalidParameterError);

    centroid::EpsfCentroidControl epsf;
    epsf.shiftVal = -1.0;
    BOOST_CHECK_THROW(centroid::EpsfCentroider{epsf}, pexExcept::InvalidParameterError);
}

BOOST_AUTO_TEST_CASE(functionAdapters) {
    ndarray::Array<double, 2, 2> image = makeStar();

    centroid::FunctionCentroider wrapped([](centroid::ImageArray const& data, centroid::MaskArray const& mask) {
        return centroid::centroidCom(data, mask);
    });
    centroid::Result<geom::Point2D> result = wrapped.apply(image);
    BOOST_CHECK_SMALL(result.value.getX() - 12.4, 1.0e-3);
    BOOST_CHECK(!wrapped.usesError());

    bool sawError = false;
    centroid::FunctionErrorCentroider withError(
            [&sawError](centroid::ImageArray const& data, centroid::MaskArray const& mask,
                        centroid::ImageArray const& error) {
                sawError = !error.isEmpty();
                return centroid::centroid2dg(data, error, mask);
            });
    BOOST_CHECK(withError.usesError());
    result = withError.apply(image);
    BOOST_CHECK(!sawError);
    BOOST_CHECK_SMALL(result.value.getY() - 10.8, 1.0e-3);

    BOOST_CHECK_THROW(centroid::FunctionCentroider{centroid::FunctionCentroider::Function()},
                      pexExcept::InvalidParameterError);
}
