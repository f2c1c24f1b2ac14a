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
#ifndef LSST_MEAS_CENTROID_Overlap_h_INCLUDED
#define LSST_MEAS_CENTROID_Overlap_h_INCLUDED

#include "lsst/geom/Box.h"
#include "lsst/geom/Extent.h"
#include "lsst/geom/Point.h"

namespace lsst {
namespace meas {
namespace centroid {

/**
 *  The overlapping region of an image and a window placed on it.
 */
struct Overlap {
    geom::Box2I large;  ///< the overlap in image pixel coordinates
    geom::Box2I small;  ///< the overlap in window pixel coordinates
};

/**
 *  Compute the overlap of a window centered on a position with an image.
 *
 *  Along each axis the window spans [ceil(p - n/2), ceil(p - n/2) + n) for a
 *  window of size n centered at position p; the parts of it that fall off
 *  the image are dropped.
 *
 *  @param[in] imageDimensions   Image width and height.
 *  @param[in] windowDimensions  Window width and height.
 *  @param[in] center            Window center in image pixel coordinates.
 *
 *  @throws lsst::pex::exceptions::InvalidParameterError if the window does
 *          not overlap the image or the center is not finite.
 */
Overlap computeOverlap(geom::Extent2I const& imageDimensions, geom::Extent2I const& windowDimensions,
                       geom::Point2D const& center);

}  // namespace centroid
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_CENTROID_Overlap_h_INCLUDED
