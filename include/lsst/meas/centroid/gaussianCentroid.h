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
#ifndef LSST_MEAS_CENTROID_gaussianCentroid_h_INCLUDED
#define LSST_MEAS_CENTROID_gaussianCentroid_h_INCLUDED

#include "ndarray.h"
#include "lsst/geom/Point.h"
#include "lsst/meas/centroid/Result.h"
#include "lsst/meas/centroid/GaussianModels.h"
#include "lsst/meas/centroid/LevMarFitter.h"

namespace lsst {
namespace meas {
namespace centroid {

/// Moment-based estimate of the parameters of a 1-d Gaussian.
struct Gaussian1DMoments {
    double amplitude;
    double mean;
    double stddev;

    Gaussian1DMoments() : amplitude(0.0), mean(0.0), stddev(0.0) {}
    Gaussian1DMoments(double amplitude_, double mean_, double stddev_)
            : amplitude(amplitude_), mean(mean_), stddev(stddev_) {}
};

/**
 *  Estimate 1-d Gaussian parameters of a profile from its moments.
 *
 *  Non-finite values are masked automatically (Condition::NONFINITE_DATA).
 *  Masked values are replaced by zero; the mean and standard deviation are
 *  the first moment and the square root of the absolute second central
 *  moment of the index, and the amplitude is the peak-to-peak range of the
 *  zero-filled data.
 *
 *  @throws lsst::pex::exceptions::LengthError if the mask shape differs from
 *          the data shape.
 */
Result<Gaussian1DMoments> gaussian1dMoments(
        ndarray::Array<Pixel const, 1, 1> const& data,
        ndarray::Array<bool const, 1, 1> const& mask = ndarray::Array<bool const, 1, 1>());

/**
 *  Fit a 2-d Gaussian plus a constant to an image.
 *
 *  Pixels that are masked, or where the data or error are not finite, get
 *  zero weight.  Other pixels are weighted by 1/error (errors are clipped at
 *  1e-30), or uniformly if no error array is given.  The initial guess comes
 *  from the image's second moments after subtracting its minimum.
 *
 *  @param[in] data   Image to fit.
 *  @param[in] error  Optional 1-sigma errors, same shape as data.
 *  @param[in] mask   Optional mask, same shape as data; true excludes a pixel.
 *  @param[in] ctrl   Solver settings.
 *
 *  @return The best-fit model; convergence is not checked.
 *
 *  @throws lsst::pex::exceptions::LengthError if the error or mask shape
 *          differs from the data shape.
 *  @throws lsst::pex::exceptions::InvalidParameterError if fewer than 7
 *          pixels remain unmasked.
 */
Result<GaussianConst2D> fit2dGaussian(ImageArray const& data, ImageArray const& error = ImageArray(),
                                      MaskArray const& mask = MaskArray(),
                                      LevMarControl const& ctrl = LevMarControl());

/**
 *  Compute the centroid of an image by fitting 1-d Gaussians plus constants
 *  to its marginal x and y distributions.
 *
 *  Masking and weighting follow fit2dGaussian; the error of a marginal bin
 *  is the quadrature sum of the unmasked errors that contribute to it, and a
 *  bin with no unmasked pixels gets zero weight.
 *
 *  @throws lsst::pex::exceptions::LengthError if the error or mask shape
 *          differs from the data shape.
 */
Result<geom::Point2D> centroid1dg(ImageArray const& data, ImageArray const& error = ImageArray(),
                                  MaskArray const& mask = MaskArray(),
                                  LevMarControl const& ctrl = LevMarControl());

/**
 *  Compute the centroid of an image by fitting a 2-d Gaussian plus a
 *  constant (see fit2dGaussian).
 */
Result<geom::Point2D> centroid2dg(ImageArray const& data, ImageArray const& error = ImageArray(),
                                  MaskArray const& mask = MaskArray(),
                                  LevMarControl const& ctrl = LevMarControl());

}  // namespace centroid
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_CENTROID_gaussianCentroid_h_INCLUDED
