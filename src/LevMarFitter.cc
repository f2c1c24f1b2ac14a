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
#include "lsst/meas/centroid/LevMarFitter.h"

namespace lsst {
namespace meas {
namespace centroid {

void LevMarControl::validate() const {
    if (maxEvaluations <= 0) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("maxEvaluations must be positive; got %d.") % maxEvaluations).str());
    }
    if (!(ftol >= 0.0) || !(xtol >= 0.0) || !(gtol >= 0.0)) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Tolerances must be non-negative; got ftol=%g, xtol=%g, gtol=%g.") %
                           ftol % xtol % gtol)
                                  .str());
    }
    if (!(stepBound > 0.0)) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("stepBound must be positive; got %g.") % stepBound).str());
    }
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
