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
#ifndef LSST_MEAS_CENTROID_epsfCentroid_h_INCLUDED
#define LSST_MEAS_CENTROID_epsfCentroid_h_INCLUDED

#include "lsst/pex/config.h"
#include "lsst/geom/Point.h"
#include "lsst/meas/centroid/Result.h"
#include "lsst/meas/centroid/Oversampling.h"

namespace lsst {
namespace meas {
namespace centroid {

/**
 *  Control object for centroidEpsf.
 */
class EpsfCentroidControl {
public:
    EpsfCentroidControl() : oversamplingX(4.0), oversamplingY(4.0), shiftVal(0.5) {}

    LSST_CONTROL_FIELD(oversamplingX, double, "Oversampling factor of the ePSF along x.");

    LSST_CONTROL_FIELD(oversamplingY, double, "Oversampling factor of the ePSF along y.");

    LSST_CONTROL_FIELD(shiftVal, double,
                       "Offset from the center, in undersampled pixels, at which the symmetry of the "
                       "ePSF is measured.");

    Oversampling getOversampling() const { return Oversampling(oversamplingX, oversamplingY); }

    /// @throws lsst::pex::exceptions::InvalidParameterError if a field is not positive.
    void validate() const;
};

/**
 *  Compute the center of an ePSF from the symmetry of its values about its
 *  nominal center (Anderson & King 2000, PASP 112, 1360).
 *
 *  The ePSF must be sampled on an odd-sized grid whose middle element is the
 *  nominal center.  Along each axis the shift is
 *  @f[
 *      \frac{\psi(+s) - \psi(-s)}{|\psi'(+s)| + |\psi'(-s)|}
 *  @f]
 *  where @f$s@f$ is shiftVal in undersampled pixels and the derivatives are
 *  central differences on the oversampled grid.  The shift is measured in
 *  grid samples of round-half-even(shiftVal * x oversampling) along both
 *  axes.
 *
 *  Masked values are replaced by zero.  Non-finite values are not masked;
 *  they are an error if any sample the computation needs is one.
 *
 *  @param[in] data          Oversampled ePSF.
 *  @param[in] mask          Optional mask, same shape as data.
 *  @param[in] oversampling  Oversampling factors in pixel order.
 *  @param[in] shiftVal      Offset at which the symmetry is measured.
 *
 *  @return The center in undersampled pixels.
 *
 *  @throws lsst::pex::exceptions::LengthError if the mask shape differs from
 *          the data shape, or more than two oversampling factors are given.
 *  @throws lsst::pex::exceptions::InvalidParameterError if an oversampling
 *          factor or shiftVal is not positive, or a required sample lies
 *          outside the array or is not finite.
 */
geom::Point2D centroidEpsf(ImageArray const& data, MaskArray const& mask = MaskArray(),
                           Oversampling const& oversampling = Oversampling(4.0), double shiftVal = 0.5);

/// Compute the center of an ePSF with the settings of a control object.
geom::Point2D centroidEpsf(ImageArray const& data, MaskArray const& mask, EpsfCentroidControl const& ctrl);

}  // namespace centroid
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_CENTROID_epsfCentroid_h_INCLUDED
