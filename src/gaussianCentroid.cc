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

#include <algorithm>
#include <cmath>
#include <limits>

#include "boost/format.hpp"

#include "lsst/log/Log.h"
#include "lsst/pex/exceptions.h"
#include "lsst/meas/centroid/gaussianCentroid.h"
#include "lsst/meas/centroid/MaskedArray.h"
#include "lsst/meas/centroid/ShapeMoments.h"

namespace lsst {
namespace meas {
namespace centroid {

namespace {

LOG_LOGGER _log = LOG_GET("lsst.meas.centroid.gaussianCentroid");

double const MIN_ERROR = 1.0e-30;

// Number of unmasked pixels needed to constrain a GaussianConst2D.
int const MIN_UNMASKED_2D = 7;

void addNonfiniteDataCondition(Conditions& conditions) {
    LOGL_DEBUG(_log, "Non-finite data values were automatically masked.");
    conditions.add(Condition::NONFINITE_DATA,
                   "Input data contains non-finite values (e.g. NaNs or infs), "
                   "which were automatically masked.");
}

/*
 * Copy data, combining the mask with the non-finite values of the data and
 * of the (optional) error array.
 */
MaskedArray<2> maskInvalid(ImageArray const& data, ImageArray const& error, MaskArray const& mask,
                           Conditions& conditions) {
    checkSameShape(data, error, "error");
    MaskedArray<2> masked(data, mask);
    if (masked.maskNonfinite()) {
        addNonfiniteDataCondition(conditions);
    }
    if (!error.isEmpty() && masked.maskNonfinite(error)) {
        LOGL_DEBUG(_log, "Non-finite error values were automatically masked.");
        conditions.add(Condition::NONFINITE_ERROR,
                       "Input error contains non-finite values (e.g. NaNs or infs), "
                       "which were automatically masked.");
    }
    return masked;
}

double computeWeight(double error) { return 1.0 / std::max(error, MIN_ERROR); }

/*
 * Fit a GaussianConst1D to a marginal profile and return its mean.
 */
double fitMarginal(Eigen::VectorXd const& profile, Eigen::VectorXd const& weights, double constantInit,
                   LevMarControl const& ctrl, Conditions& conditions, char const* axisName) {
    int const size = profile.size();
    ndarray::Array<Pixel, 1, 1> profileArray = ndarray::allocate(size);
    Eigen::MatrixXd coords(size, 1);
    for (int i = 0; i < size; ++i) {
        profileArray[i] = profile[i];
        coords(i, 0) = i;
    }
    Result<Gaussian1DMoments> moments = gaussian1dMoments(profileArray);
    conditions.extend(moments.conditions);

    GaussianConst1D initial(constantInit, moments.value.amplitude, moments.value.mean,
                            moments.value.stddev);
    LevMarFitter<GaussianConst1D> fitter(initial, coords, profile, weights, ctrl);
    LOGL_DEBUG(_log, "%s marginal fit: status %d after %d evaluations, mean %g", axisName,
               fitter.getStatus(), fitter.getNumEvaluations(), fitter.getBestFitModel().getMean());
    return fitter.getBestFitModel().getMean();
}

}  // namespace

Result<Gaussian1DMoments> gaussian1dMoments(ndarray::Array<Pixel const, 1, 1> const& data,
                                            ndarray::Array<bool const, 1, 1> const& mask) {
    Result<Gaussian1DMoments> result;
    MaskedArray<1> masked(data, mask);
    if (masked.maskNonfinite()) {
        addNonfiniteDataCondition(result.conditions);
    }
    ndarray::Array<Pixel const, 1, 1> values = masked.getValues();
    int const size = values.getSize<0>();

    double sum = 0.0, sumX = 0.0;
    for (int i = 0; i < size; ++i) {
        sum += values[i];
        sumX += i * values[i];
    }
    double const mean = sumX / sum;

    double sumVar = 0.0;
    double minValue = std::numeric_limits<double>::infinity();
    double maxValue = -std::numeric_limits<double>::infinity();
    for (int i = 0; i < size; ++i) {
        sumVar += values[i] * (i - mean) * (i - mean);
        minValue = std::min(minValue, values[i]);
        maxValue = std::max(maxValue, values[i]);
    }

    result.value.mean = mean;
    result.value.stddev = std::sqrt(std::abs(sumVar / sum));
    result.value.amplitude = (size > 0) ? maxValue - minValue : 0.0;
    return result;
}

Result<GaussianConst2D> fit2dGaussian(ImageArray const& data, ImageArray const& error, MaskArray const& mask,
                                      LevMarControl const& ctrl) {
    Conditions conditions;
    MaskedArray<2> masked = maskInvalid(data, error, mask, conditions);

    std::size_t const nValid = masked.countValid();
    if (nValid < static_cast<std::size_t>(MIN_UNMASKED_2D)) {
        throw LSST_EXCEPT(pex::exceptions::InvalidParameterError,
                          (boost::format("Input data must have at least %d unmasked values to fit a 2D "
                                         "Gaussian plus a constant; got %d.") %
                           MIN_UNMASKED_2D % nValid)
                                  .str());
    }

    ndarray::Array<Pixel const, 2, 2> values = masked.getValues();
    ndarray::Array<bool const, 2, 2> excluded = masked.getExcluded();
    int const height = values.getSize<0>();
    int const width = values.getSize<1>();
    int const nPix = height * width;

    Eigen::MatrixXd coords(nPix, 2);
    Eigen::VectorXd pixels(nPix);
    Eigen::VectorXd weights(nPix);
    for (int iy = 0, i = 0; iy < height; ++iy) {
        for (int ix = 0; ix < width; ++ix, ++i) {
            coords(i, 0) = ix;
            coords(i, 1) = iy;
            pixels[i] = values[iy][ix];
            if (excluded[iy][ix]) {
                weights[i] = 0.0;
            } else {
                weights[i] = error.isEmpty() ? 1.0 : computeWeight(error[iy][ix]);
            }
        }
    }

    // The minimum is subtracted before the moments are taken, so that they
    // are computed from non-negative values.
    double const minValue = pixels.minCoeff();
    double const maxValue = pixels.maxCoeff();
    ndarray::Array<Pixel, 2, 2> shifted = ndarray::allocate(height, width);
    for (int iy = 0; iy < height; ++iy) {
        for (int ix = 0; ix < width; ++ix) {
            shifted[iy][ix] = values[iy][ix] - minValue;
        }
    }
    ShapeEstimate const shape = estimateShape(shifted, excluded);

    GaussianConst2D initial(0.0, maxValue - minValue, shape.centroid.getX(), shape.centroid.getY(),
                            shape.semimajorSigma, shape.semiminorSigma, shape.orientation);
    LevMarFitter<GaussianConst2D> fitter(initial, coords, pixels, weights, ctrl);
    LOGL_DEBUG(_log, "2-d Gaussian fit to %d pixels: status %d after %d evaluations",
               static_cast<int>(nValid), fitter.getStatus(), fitter.getNumEvaluations());

    return Result<GaussianConst2D>(fitter.getBestFitModel(), conditions);
}

Result<geom::Point2D> centroid1dg(ImageArray const& data, ImageArray const& error, MaskArray const& mask,
                                  LevMarControl const& ctrl) {
    Result<geom::Point2D> result;
    MaskedArray<2> masked = maskInvalid(data, error, mask, result.conditions);

    ndarray::Array<Pixel const, 2, 2> values = masked.getValues();
    ndarray::Array<bool const, 2, 2> excluded = masked.getExcluded();
    int const height = values.getSize<0>();
    int const width = values.getSize<1>();

    Eigen::VectorXd xProfile = Eigen::VectorXd::Zero(width);
    Eigen::VectorXd yProfile = Eigen::VectorXd::Zero(height);
    Eigen::VectorXd xVariance = Eigen::VectorXd::Zero(width);
    Eigen::VectorXd yVariance = Eigen::VectorXd::Zero(height);
    Eigen::VectorXi xCount = Eigen::VectorXi::Zero(width);
    Eigen::VectorXi yCount = Eigen::VectorXi::Zero(height);
    double constantInit = std::numeric_limits<double>::infinity();

    for (int iy = 0; iy < height; ++iy) {
        for (int ix = 0; ix < width; ++ix) {
            if (excluded[iy][ix]) {
                continue;
            }
            double const value = values[iy][ix];
            xProfile[ix] += value;
            yProfile[iy] += value;
            ++xCount[ix];
            ++yCount[iy];
            constantInit = std::min(constantInit, value);
            if (!error.isEmpty()) {
                double const variance = error[iy][ix] * error[iy][ix];
                xVariance[ix] += variance;
                yVariance[iy] += variance;
            }
        }
    }
    if (!std::isfinite(constantInit)) {
        constantInit = 0.0;
    }

    Eigen::VectorXd xWeights(width);
    for (int ix = 0; ix < width; ++ix) {
        if (xCount[ix] == 0) {
            xWeights[ix] = 0.0;
        } else {
            xWeights[ix] = error.isEmpty() ? 1.0 : computeWeight(std::sqrt(xVariance[ix]));
        }
    }
    Eigen::VectorXd yWeights(height);
    for (int iy = 0; iy < height; ++iy) {
        if (yCount[iy] == 0) {
            yWeights[iy] = 0.0;
        } else {
            yWeights[iy] = error.isEmpty() ? 1.0 : computeWeight(std::sqrt(yVariance[iy]));
        }
    }

    double const xCenter = fitMarginal(xProfile, xWeights, constantInit, ctrl, result.conditions, "x");
    double const yCenter = fitMarginal(yProfile, yWeights, constantInit, ctrl, result.conditions, "y");
    result.value = geom::Point2D(xCenter, yCenter);
    return result;
}

Result<geom::Point2D> centroid2dg(ImageArray const& data, ImageArray const& error, MaskArray const& mask,
                                  LevMarControl const& ctrl) {
    Result<GaussianConst2D> fit = fit2dGaussian(data, error, mask, ctrl);
    return Result<geom::Point2D>(fit.value.getCenter(), fit.conditions);
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
