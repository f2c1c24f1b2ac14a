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
#ifndef LSST_MEAS_CENTROID_Centroider_h_INCLUDED
#define LSST_MEAS_CENTROID_Centroider_h_INCLUDED

#include <functional>
#include <memory>
#include <string>

#include "lsst/geom/Point.h"
#include "lsst/meas/centroid/Result.h"
#include "lsst/meas/centroid/Oversampling.h"
#include "lsst/meas/centroid/LevMarFitter.h"
#include "lsst/meas/centroid/epsfCentroid.h"

namespace lsst {
namespace meas {
namespace centroid {

/**
 * @brief A strategy that computes the centroid of an image cutout and an
 * exclusion mask.
 *
 * Centroiders that ignore per-pixel errors derive from this class directly;
 * those that use them derive from ErrorCentroider.  Instances are immutable.
 */
class Centroider {
public:
    virtual ~Centroider() {}

    /// Compute the centroid of data, excluding pixels where mask is true.
    Result<geom::Point2D> apply(ImageArray const& data, MaskArray const& mask = MaskArray()) const;

    /**
     * Compute the centroid of data with 1-sigma errors.
     *
     * The errors are ignored unless usesError() is true.
     */
    Result<geom::Point2D> apply(ImageArray const& data, MaskArray const& mask, ImageArray const& error) const;

    /// Return true if apply makes use of an error array.
    virtual bool usesError() const { return false; }

private:
    virtual Result<geom::Point2D> doApply(ImageArray const& data, MaskArray const& mask) const = 0;

    virtual Result<geom::Point2D> doApplyWithError(ImageArray const& data, MaskArray const& mask,
                                                   ImageArray const& error) const;
};

/**
 * @brief A Centroider that weights pixels by their errors.
 */
class ErrorCentroider : public Centroider {
public:
    bool usesError() const override { return true; }

private:
    Result<geom::Point2D> doApply(ImageArray const& data, MaskArray const& mask) const override;

    Result<geom::Point2D> doApplyWithError(ImageArray const& data, MaskArray const& mask,
                                           ImageArray const& error) const override = 0;
};

/// Centroid from first moments (centroidCom).
class ComCentroider : public Centroider {
public:
    explicit ComCentroider(Oversampling const& oversampling = Oversampling());

    Oversampling const& getOversampling() const { return _oversampling; }

private:
    Result<geom::Point2D> doApply(ImageArray const& data, MaskArray const& mask) const override;

    Oversampling _oversampling;
};

/// Centroid from 1-d Gaussian fits to the marginal distributions (centroid1dg).
class Gaussian1dCentroider : public ErrorCentroider {
public:
    explicit Gaussian1dCentroider(LevMarControl const& ctrl = LevMarControl());

    LevMarControl const& getControl() const { return _ctrl; }

private:
    Result<geom::Point2D> doApplyWithError(ImageArray const& data, MaskArray const& mask,
                                           ImageArray const& error) const override;

    LevMarControl _ctrl;
};

/// Centroid from a 2-d Gaussian fit (centroid2dg).
class Gaussian2dCentroider : public ErrorCentroider {
public:
    explicit Gaussian2dCentroider(LevMarControl const& ctrl = LevMarControl());

    LevMarControl const& getControl() const { return _ctrl; }

private:
    Result<geom::Point2D> doApplyWithError(ImageArray const& data, MaskArray const& mask,
                                           ImageArray const& error) const override;

    LevMarControl _ctrl;
};

/// Center of an ePSF from its symmetry (centroidEpsf).
class EpsfCentroider : public Centroider {
public:
    explicit EpsfCentroider(EpsfCentroidControl const& ctrl = EpsfCentroidControl());

    EpsfCentroidControl const& getControl() const { return _ctrl; }

private:
    Result<geom::Point2D> doApply(ImageArray const& data, MaskArray const& mask) const override;

    EpsfCentroidControl _ctrl;
};

/// Adapt a callable taking data and mask to a Centroider.
class FunctionCentroider : public Centroider {
public:
    typedef std::function<Result<geom::Point2D>(ImageArray const&, MaskArray const&)> Function;

    explicit FunctionCentroider(Function const& function);

private:
    Result<geom::Point2D> doApply(ImageArray const& data, MaskArray const& mask) const override;

    Function _function;
};

/// Adapt a callable taking data, mask and error to an ErrorCentroider.
class FunctionErrorCentroider : public ErrorCentroider {
public:
    typedef std::function<Result<geom::Point2D>(ImageArray const&, MaskArray const&, ImageArray const&)>
            Function;

    explicit FunctionErrorCentroider(Function const& function);

private:
    Result<geom::Point2D> doApplyWithError(ImageArray const& data, MaskArray const& mask,
                                           ImageArray const& error) const override;

    Function _function;
};

/**
 * @brief A factory function to return a Centroider with default settings.
 *
 * @param[in] name  One of "com", "1dg", "2dg" or "epsf".
 *
 * @throws lsst::pex::exceptions::NotFoundError if name is not recognised.
 */
std::shared_ptr<Centroider> makeCentroider(std::string const& name);

}  // namespace centroid
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_CENTROID_Centroider_h_INCLUDED
