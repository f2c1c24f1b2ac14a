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

#include "boost/format.hpp"

#include "lsst/log/Log.h"
#include "lsst/pex/exceptions.h"
#include "lsst/meas/centroid/epsfCentroid.h"
#include "lsst/meas/centroid/MaskedArray.h"

namespace lsst {
namespace meas {
namespace centroid {

namespace {

LOG_LOGGER _log = LOG_GET("lsst.meas.centroid.epsfCentroid");

void checkShiftVal(double shiftVal) {
    if (!(shiftVal > 0.0)) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("shiftVal must be a positive number; got %g.") % shiftVal).str());
    }
}

/*
 * Samples of the ePSF along one axis through its center.
 */
class AxisCut {
public:
    AxisCut(ndarray::Array<Pixel const, 2, 2> const& values, int center, int fixed, bool alongX)
            : _values(values), _center(center), _fixed(fixed), _alongX(alongX) {}

    // Return the sample at the given offset from the center.
    double operator()(int offset) const {
        int const index = _center + offset;
        int const size = _alongX ? _values.getSize<1>() : _values.getSize<0>();
        if (index < 0 || index >= size) {
            throw LSST_EXCEPT(
                    pex::exceptions::InvalidParameterError,
                    (boost::format("Centroiding pixel %d along %s lies outside the ePSF array of size %d.") %
                     index % (_alongX ? "x" : "y") % size)
                            .str());
        }
        double const value = _alongX ? _values[_fixed][index] : _values[index][_fixed];
        if (!std::isfinite(value)) {
            throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                              "One or more centroiding pixels is set to a bad value, e.g., NaN or inf.");
        }
        return value;
    }

private:
    ndarray::Array<Pixel const, 2, 2> _values;
    int _center;
    int _fixed;
    bool _alongX;
};

/*
 * The samples of an axis cut used to measure the shift along it.
 */
struct ShiftSamples {
    double psiPos, psiPosM1, psiPosP1;
    double psiNeg, psiNegM1, psiNegP1;

    ShiftSamples(AxisCut const& cut, int shiftIdx)
            : psiPos(cut(shiftIdx)),
              psiPosM1(cut(shiftIdx - 1)),
              psiPosP1(cut(shiftIdx + 1)),
              psiNeg(cut(-shiftIdx)),
              psiNegM1(cut(-shiftIdx - 1)),
              psiNegP1(cut(-shiftIdx + 1)) {}

    // Return the shift in undersampled pixels.
    double computeShift(double factor) const {
        // central differences span 2 oversampled samples, i.e. 2/factor undersampled pixels
        double const dpsiPos = std::abs(psiPosP1 - psiPosM1) / (2.0 / factor);
        double const dpsiNeg = std::abs(psiNegP1 - psiNegM1) / (2.0 / factor);
        LOGL_DEBUG(_log, "psi(+) %g, psi(-) %g, dpsi(+) %g, dpsi(-) %g", psiPos, psiNeg, dpsiPos, dpsiNeg);
        return (psiPos - psiNeg) / (dpsiPos + dpsiNeg);
    }
};

}  // namespace

void EpsfCentroidControl::validate() const {
    getOversampling().validate(2);
    checkShiftVal(shiftVal);
}

geom::Point2D centroidEpsf(ImageArray const& data, MaskArray const& mask, Oversampling const& oversampling,
                           double shiftVal) {
    oversampling.validate(2);
    MaskedArray<2> masked(data, mask);
    checkShiftVal(shiftVal);

    ndarray::Array<Pixel const, 2, 2> values = masked.getValues();
    int const xCenter = (static_cast<int>(values.getSize<1>()) - 1) / 2;
    int const yCenter = (static_cast<int>(values.getSize<0>()) - 1) / 2;
    double const x0 = xCenter / oversampling.getX();
    double const y0 = yCenter / oversampling.getY();

    // Both axes use the x oversampling factor for the shift index.
    int const shiftIdx = static_cast<int>(std::nearbyint(shiftVal * oversampling.getX()));

    AxisCut const xCut(values, xCenter, yCenter, true);
    AxisCut const yCut(values, yCenter, xCenter, false);
    xCut(0);  // the center itself must be valid
    ShiftSamples const xSamples(xCut, shiftIdx);
    ShiftSamples const ySamples(yCut, shiftIdx);
    double const xShift = xSamples.computeShift(oversampling.getX());
    double const yShift = ySamples.computeShift(oversampling.getY());

    return geom::Point2D(x0 + xShift, y0 + yShift);
}

geom::Point2D centroidEpsf(ImageArray const& data, MaskArray const& mask, EpsfCentroidControl const& ctrl) {
    ctrl.validate();
    return centroidEpsf(data, mask, ctrl.getOversampling(), ctrl.shiftVal);
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
