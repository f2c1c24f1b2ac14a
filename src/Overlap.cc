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

#include <algorithm>
#include <cmath>

#include "boost/format.hpp"

#include "lsst/pex/exceptions.h"
#include "lsst/meas/centroid/Overlap.h"

namespace lsst {
namespace meas {
namespace centroid {

namespace {

// Half-open index ranges [begin, end) of the overlap along one axis.
struct AxisOverlap {
    int largeBegin, largeEnd;
    int smallBegin, smallEnd;
};

AxisOverlap computeAxisOverlap(int imageSize, int windowSize, double position, char const* axisName) {
    if (!std::isfinite(position)) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Position along %s is not finite.") % axisName).str());
    }
    int const begin = static_cast<int>(std::ceil(position - 0.5 * windowSize));
    int const end = begin + windowSize;
    if (end <= 0 || begin >= imageSize) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("A window of size %d centered at %g along %s does not overlap "
                                         "an image of size %d.") %
                           windowSize % position % axisName % imageSize)
                                  .str());
    }
    AxisOverlap result;
    result.largeBegin = std::max(0, begin);
    result.largeEnd = std::min(imageSize, end);
    result.smallBegin = std::max(0, -begin);
    result.smallEnd = std::min(imageSize - begin, windowSize);
    return result;
}

}  // namespace

Overlap computeOverlap(geom::Extent2I const& imageDimensions, geom::Extent2I const& windowDimensions,
                       geom::Point2D const& center) {
    AxisOverlap const x =
            computeAxisOverlap(imageDimensions.getX(), windowDimensions.getX(), center.getX(), "x");
    AxisOverlap const y =
            computeAxisOverlap(imageDimensions.getY(), windowDimensions.getY(), center.getY(), "y");

    Overlap result;
    result.large = geom::Box2I(geom::Point2I(x.largeBegin, y.largeBegin),
                               geom::Extent2I(x.largeEnd - x.largeBegin, y.largeEnd - y.largeBegin));
    result.small = geom::Box2I(geom::Point2I(x.smallBegin, y.smallBegin),
                               geom::Extent2I(x.smallEnd - x.smallBegin, y.smallEnd - y.smallBegin));
    return result;
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
