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
#ifndef LSST_MEAS_CENTROID_Oversampling_h_INCLUDED
#define LSST_MEAS_CENTROID_Oversampling_h_INCLUDED

#include <vector>

namespace lsst {
namespace meas {
namespace centroid {

/**
 *  Oversampling factors of pixel indices, in pixel order (x, y, ...).
 *
 *  A single factor applies to every axis.  Computed pixel-index coordinates
 *  are divided by the factor of their axis to express them in native pixels.
 */
class Oversampling {
public:
    /// Construct with the same factor along every axis.
    Oversampling(double factor = 1.0) : _factors(1, factor) {}

    /// Construct with separate x and y factors.
    Oversampling(double xFactor, double yFactor) : _factors{xFactor, yFactor} {}

    /// Construct from factors given in pixel order.
    explicit Oversampling(std::vector<double> const& factors);

    /// Return the factor for the given pixel-order axis (0 is x).
    double getFactor(int axis) const { return _factors.size() == 1u ? _factors.front() : _factors.at(axis); }

    double getX() const { return getFactor(0); }

    double getY() const { return getFactor(1); }

    /// Return true if a single factor is broadcast to every axis.
    bool isScalar() const { return _factors.size() == 1u; }

    std::vector<double> const& getFactors() const { return _factors; }

    /**
     *  Check that the factors can be applied to an array with the given
     *  number of axes.
     *
     *  @throws lsst::pex::exceptions::LengthError if the number of factors
     *          is neither 1 nor nAxes.
     *  @throws lsst::pex::exceptions::InvalidParameterError if any factor is
     *          not strictly positive.
     */
    void validate(int nAxes) const;

private:
    std::vector<double> _factors;
};

}  // namespace centroid
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_CENTROID_Oversampling_h_INCLUDED
