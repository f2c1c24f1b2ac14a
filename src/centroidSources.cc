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

#include "boost/format.hpp"

#include "lsst/log/Log.h"
#include "lsst/pex/exceptions.h"
#include "lsst/meas/centroid/centroidSources.h"
#include "lsst/meas/centroid/MaskedArray.h"
#include "lsst/meas/centroid/Overlap.h"

namespace lsst {
namespace meas {
namespace centroid {

namespace {

LOG_LOGGER _log = LOG_GET("lsst.meas.centroid.centroidSources");

ndarray::Array<Pixel, 2, 2> makeCutout(ImageArray const& image, geom::Box2I const& box) {
    return ndarray::copy(
            image[ndarray::view(box.getBeginY(), box.getEndY())(box.getBeginX(), box.getEndX())]);
}

}  // namespace

void CentroidSourcesControl::validate() const {
    if (boxSize.empty()) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError, "boxSize or footprint must be defined.");
    }
    if (boxSize.size() > 2u) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("boxSize must have 1 or 2 elements; got %d.") % boxSize.size())
                                  .str());
    }
    for (int size : boxSize) {
        if (size <= 0) {
            throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                              (boost::format("boxSize elements must be positive; got %d.") % size).str());
        }
    }
}

ndarray::Array<bool, 2, 2> CentroidSourcesControl::makeFootprint() const {
    validate();
    int const height = boxSize.front();
    int const width = boxSize.back();
    ndarray::Array<bool, 2, 2> footprint = ndarray::allocate(height, width);
    footprint.deep() = true;
    return footprint;
}

Result<SourceCentroids> centroidSources(ImageArray const& data, std::vector<double> const& xpos,
                                        std::vector<double> const& ypos, Centroider const& centroider,
                                        CentroidSourcesControl const& ctrl, MaskArray const& footprint,
                                        ImageArray const& error, MaskArray const& mask) {
    if (xpos.size() != ypos.size()) {
        throw LSST_EXCEPT(pex::exceptions::LengthError,
                          (boost::format("Got %d x positions and %d y positions.") % xpos.size() %
                           ypos.size())
                                  .str());
    }
    checkSameShape(data, error, "error");
    checkSameShape(data, mask, "mask");

    if (!footprint.isEmpty() && (footprint.getSize<0>() == 0 || footprint.getSize<1>() == 0)) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError, "footprint must not be empty.");
    }
    MaskArray const window = footprint.isEmpty() ? MaskArray(ctrl.makeFootprint()) : footprint;

    geom::Extent2I const imageDimensions(data.getSize<1>(), data.getSize<0>());
    geom::Extent2I const windowDimensions(window.getSize<1>(), window.getSize<0>());

    Result<SourceCentroids> result;
    result.value.x.reserve(xpos.size());
    result.value.y.reserve(ypos.size());
    for (std::size_t i = 0; i < xpos.size(); ++i) {
        Overlap const overlap =
                computeOverlap(imageDimensions, windowDimensions, geom::Point2D(xpos[i], ypos[i]));
        geom::Box2I const& large = overlap.large;
        geom::Box2I const& small = overlap.small;

        ImageArray const dataCutout = makeCutout(data, large);
        ndarray::Array<bool, 2, 2> maskCutout = ndarray::allocate(large.getHeight(), large.getWidth());
        for (int iy = 0; iy < large.getHeight(); ++iy) {
            for (int ix = 0; ix < large.getWidth(); ++ix) {
                bool excluded = !window[small.getMinY() + iy][small.getMinX() + ix];
                if (!mask.isEmpty()) {
                    excluded = excluded || mask[large.getMinY() + iy][large.getMinX() + ix];
                }
                maskCutout[iy][ix] = excluded;
            }
        }

        Result<geom::Point2D> centroid;
        if (error.isEmpty()) {
            centroid = centroider.apply(dataCutout, maskCutout);
        } else {
            centroid = centroider.apply(dataCutout, maskCutout, makeCutout(error, large));
        }
        result.value.x.push_back(centroid.value.getX() + large.getMinX());
        result.value.y.push_back(centroid.value.getY() + large.getMinY());
        result.conditions.extend(centroid.conditions);
        LOGL_DEBUG(_log, "Source %d at (%g, %g) centroided at (%g, %g)", static_cast<int>(i), xpos[i],
                   ypos[i], result.value.x.back(), result.value.y.back());
    }
    return result;
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
