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
#ifndef LSST_MEAS_CENTROID_centroidSources_h_INCLUDED
#define LSST_MEAS_CENTROID_centroidSources_h_INCLUDED

#include <vector>

#include "ndarray.h"
#include "lsst/pex/config.h"
#include "lsst/meas/centroid/Result.h"
#include "lsst/meas/centroid/Centroider.h"

namespace lsst {
namespace meas {
namespace centroid {

/**
 *  Control object for centroidSources.
 */
class CentroidSourcesControl {
public:
    CentroidSourcesControl() : boxSize(1, 11) {}

    LSST_CONTROL_FIELD(boxSize, std::vector<int>,
                       "Size of the rectangular cutout around each position, as (height, width), or a "
                       "single value for a square cutout.");

    /// @throws lsst::pex::exceptions::InvalidParameterError if boxSize is malformed.
    void validate() const;

    /// Return an all-true footprint of the configured box size.
    ndarray::Array<bool, 2, 2> makeFootprint() const;
};

/// Centroids of a list of positions, in input order.
struct SourceCentroids {
    std::vector<double> x;
    std::vector<double> y;
};

/**
 *  Centroid sources at the given initial positions of an image.
 *
 *  For each position a cutout of the shape of the footprint is centered on
 *  it (parts falling off the image are dropped), pixels outside the
 *  footprint are added to the mask, and the centroider is applied to the
 *  cutout.  The error array is passed on only when given; centroiders that
 *  do not use errors ignore it.
 *
 *  @param[in] data        Image.
 *  @param[in] xpos        Initial x positions.
 *  @param[in] ypos        Initial y positions, same length as xpos.
 *  @param[in] centroider  Algorithm applied to each cutout.
 *  @param[in] ctrl        Box size, used when no footprint is given.
 *  @param[in] footprint   Optional footprint; true pixels are used.
 *  @param[in] error       Optional 1-sigma errors, same shape as data.
 *  @param[in] mask        Optional mask, same shape as data.
 *
 *  @return The centroids in image pixel coordinates; the conditions of all
 *          positions are combined.
 *
 *  @throws lsst::pex::exceptions::LengthError if xpos and ypos differ in
 *          length, or the error or mask shape differs from the data's.
 *  @throws lsst::pex::exceptions::InvalidParameterError if the box size or
 *          footprint is invalid, or a cutout does not overlap the image.
 */
Result<SourceCentroids> centroidSources(ImageArray const& data, std::vector<double> const& xpos,
                                        std::vector<double> const& ypos, Centroider const& centroider,
                                        CentroidSourcesControl const& ctrl = CentroidSourcesControl(),
                                        MaskArray const& footprint = MaskArray(),
                                        ImageArray const& error = ImageArray(),
                                        MaskArray const& mask = MaskArray());

}  // namespace centroid
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_CENTROID_centroidSources_h_INCLUDED
