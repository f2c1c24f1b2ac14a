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
#include "lsst/meas/centroid/Centroider.h"
#include "lsst/meas/centroid/centroidCom.h"
#include "lsst/meas/centroid/gaussianCentroid.h"

namespace lsst {
namespace meas {
namespace centroid {

namespace {

LOG_LOGGER _log = LOG_GET("lsst.meas.centroid.Centroider");

}  // namespace

Result<geom::Point2D> Centroider::apply(ImageArray const& data, MaskArray const& mask) const {
    LOGL_DEBUG(_log, "Centroiding %dx%d cutout", static_cast<int>(data.getSize<1>()),
               static_cast<int>(data.getSize<0>()));
    return doApply(data, mask);
}

Result<geom::Point2D> Centroider::apply(ImageArray const& data, MaskArray const& mask,
                                        ImageArray const& error) const {
    LOGL_DEBUG(_log, "Centroiding %dx%d cutout with errors", static_cast<int>(data.getSize<1>()),
               static_cast<int>(data.getSize<0>()));
    return doApplyWithError(data, mask, error);
}

Result<geom::Point2D> Centroider::doApplyWithError(ImageArray const& data, MaskArray const& mask,
                                                   ImageArray const&) const {
    return doApply(data, mask);
}

Result<geom::Point2D> ErrorCentroider::doApply(ImageArray const& data, MaskArray const& mask) const {
    return doApplyWithError(data, mask, ImageArray());
}

ComCentroider::ComCentroider(Oversampling const& oversampling) : _oversampling(oversampling) {
    _oversampling.validate(2);
}

Result<geom::Point2D> ComCentroider::doApply(ImageArray const& data, MaskArray const& mask) const {
    return centroidCom(data, mask, _oversampling);
}

Gaussian1dCentroider::Gaussian1dCentroider(LevMarControl const& ctrl) : _ctrl(ctrl) { _ctrl.validate(); }

Result<geom::Point2D> Gaussian1dCentroider::doApplyWithError(ImageArray const& data, MaskArray const& mask,
                                                             ImageArray const& error) const {
    return centroid1dg(data, error, mask, _ctrl);
}

Gaussian2dCentroider::Gaussian2dCentroider(LevMarControl const& ctrl) : _ctrl(ctrl) { _ctrl.validate(); }

Result<geom::Point2D> Gaussian2dCentroider::doApplyWithError(ImageArray const& data, MaskArray const& mask,
                                                             ImageArray const& error) const {
    return centroid2dg(data, error, mask, _ctrl);
}

EpsfCentroider::EpsfCentroider(EpsfCentroidControl const& ctrl) : _ctrl(ctrl) { _ctrl.validate(); }

Result<geom::Point2D> EpsfCentroider::doApply(ImageArray const& data, MaskArray const& mask) const {
    return Result<geom::Point2D>(centroidEpsf(data, mask, _ctrl));
}

FunctionCentroider::FunctionCentroider(Function const& function) : _function(function) {
    if (!_function) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError, "FunctionCentroider needs a callable.");
    }
}

Result<geom::Point2D> FunctionCentroider::doApply(ImageArray const& data, MaskArray const& mask) const {
    return _function(data, mask);
}

FunctionErrorCentroider::FunctionErrorCentroider(Function const& function) : _function(function) {
    if (!_function) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          "FunctionErrorCentroider needs a callable.");
    }
}

Result<geom::Point2D> FunctionErrorCentroider::doApplyWithError(ImageArray const& data, MaskArray const& mask,
                                                                ImageArray const& error) const {
    return _function(data, mask, error);
}

std::shared_ptr<Centroider> makeCentroider(std::string const& name) {
    if (name == "com") {
        return std::make_shared<ComCentroider>();
    } else if (name == "1dg") {
        return std::make_shared<Gaussian1dCentroider>();
    } else if (name == "2dg") {
        return std::make_shared<Gaussian2dCentroider>();
    } else if (name == "epsf") {
        return std::make_shared<EpsfCentroider>();
    }
    throw LSST_EXCEPT(pex::exceptions::NotFoundError,
                      (boost::format("Centroider of type \"%s\" is not implemented") % name).str());
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
