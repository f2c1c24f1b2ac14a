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

#include "lsst/pex/exceptions.h"
#include "lsst/meas/centroid/Oversampling.h"

namespace lsst {
namespace meas {
namespace centroid {

Oversampling::Oversampling(std::vector<double> const& factors) : _factors(factors) {
    if (_factors.empty()) {
        throw LSST_EXCEPT(pex::exceptions::LengthError, "At least one oversampling factor is required.");
    }
}

void Oversampling::validate(int nAxes) const {
    if (!isScalar() && static_cast<int>(_factors.size()) != nAxes) {
        throw LSST_EXCEPT(pex::exceptions::LengthError,
                          (boost::format("Got %d oversampling factors for an array with %d axes.") %
                           _factors.size() % nAxes)
                                  .str());
    }
    for (double factor : _factors) {
        // also rejects NaN
        if (!(factor > 0.0)) {
            throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                              "Oversampling factors must all be positive numbers.");
        }
    }
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
