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
#ifndef LSST_MEAS_CENTROID_GaussianModels_h_INCLUDED
#define LSST_MEAS_CENTROID_GaussianModels_h_INCLUDED

#include "Eigen/Core"

#include "lsst/geom/Point.h"

namespace lsst {
namespace meas {
namespace centroid {

/**
 *  A 1-d Gaussian plus a constant:
 *  @f[
 *      f(x) = c + A \exp\left(-\frac{(x - \mu)^2}{2\sigma^2}\right)
 *  @f]
 *
 *  Instances are immutable; fitting produces a new instance.
 */
class GaussianConst1D {
public:
    enum Parameter { CONSTANT = 0, AMPLITUDE, MEAN, STDDEV, NPARAM };

    GaussianConst1D(double constant, double amplitude, double mean, double stddev)
            : _constant(constant), _amplitude(amplitude), _mean(mean), _stddev(stddev) {}

    /// Construct from a parameter vector ordered as the Parameter enum.
    explicit GaussianConst1D(Eigen::VectorXd const& parameters);

    double getConstant() const { return _constant; }
    double getAmplitude() const { return _amplitude; }
    double getMean() const { return _mean; }
    double getStddev() const { return _stddev; }

    /// Return the parameters ordered as the Parameter enum.
    Eigen::VectorXd getParameters() const;

    double operator()(double x) const;

    /**
     *  Evaluate the model at a set of points.
     *
     *  @param[in]  coords  One row per point; column 0 is x.
     *  @param[out] values  Model values, resized to coords.rows().
     */
    void computeValues(Eigen::MatrixXd const& coords, Eigen::VectorXd& values) const;

    /**
     *  Evaluate the partial derivatives of the model with respect to each
     *  parameter at a set of points.
     *
     *  @param[in]  coords       One row per point; column 0 is x.
     *  @param[out] derivatives  Resized to (coords.rows(), NPARAM).
     */
    void computeDerivatives(Eigen::MatrixXd const& coords, Eigen::MatrixXd& derivatives) const;

private:
    double _constant;
    double _amplitude;
    double _mean;
    double _stddev;
};

/**
 *  A rotated elliptical 2-d Gaussian plus a constant:
 *  @f[
 *      f(x, y) = c + A \exp\left(-a (x - x_0)^2 - b (x - x_0)(y - y_0) - c' (y - y_0)^2\right)
 *  @f]
 *  with
 *  @f[
 *      a = \frac{\cos^2\theta}{2\sigma_x^2} + \frac{\sin^2\theta}{2\sigma_y^2}, \quad
 *      b = \frac{\sin 2\theta}{2\sigma_x^2} - \frac{\sin 2\theta}{2\sigma_y^2}, \quad
 *      c' = \frac{\sin^2\theta}{2\sigma_x^2} + \frac{\cos^2\theta}{2\sigma_y^2}
 *  @f]
 *  where theta is the rotation angle of the x axis of the ellipse, in
 *  radians, increasing counterclockwise.
 *
 *  Instances are immutable; fitting produces a new instance.
 */
class GaussianConst2D {
public:
    enum Parameter { CONSTANT = 0, AMPLITUDE, X_MEAN, Y_MEAN, X_STDDEV, Y_STDDEV, THETA, NPARAM };

    GaussianConst2D(double constant, double amplitude, double xMean, double yMean, double xStddev,
                    double yStddev, double theta = 0.0)
            : _constant(constant),
              _amplitude(amplitude),
              _xMean(xMean),
              _yMean(yMean),
              _xStddev(xStddev),
              _yStddev(yStddev),
              _theta(theta) {}

    /// Construct from a parameter vector ordered as the Parameter enum.
    explicit GaussianConst2D(Eigen::VectorXd const& parameters);

    double getConstant() const { return _constant; }
    double getAmplitude() const { return _amplitude; }
    double getXMean() const { return _xMean; }
    double getYMean() const { return _yMean; }
    double getXStddev() const { return _xStddev; }
    double getYStddev() const { return _yStddev; }
    double getTheta() const { return _theta; }

    /// Return (xMean, yMean).
    geom::Point2D getCenter() const { return geom::Point2D(_xMean, _yMean); }

    /// Return the parameters ordered as the Parameter enum.
    Eigen::VectorXd getParameters() const;

    double operator()(double x, double y) const;

    /**
     *  Evaluate the model at a set of points.
     *
     *  @param[in]  coords  One row per point; column 0 is x, column 1 is y.
     *  @param[out] values  Model values, resized to coords.rows().
     */
    void computeValues(Eigen::MatrixXd const& coords, Eigen::VectorXd& values) const;

    /**
     *  Evaluate the partial derivatives of the model with respect to each
     *  parameter at a set of points.
     *
     *  @param[in]  coords       One row per point; column 0 is x, column 1 is y.
     *  @param[out] derivatives  Resized to (coords.rows(), NPARAM).
     */
    void computeDerivatives(Eigen::MatrixXd const& coords, Eigen::MatrixXd& derivatives) const;

private:
    double _constant;
    double _amplitude;
    double _xMean;
    double _yMean;
    double _xStddev;
    double _yStddev;
    double _theta;
};

}  // namespace centroid
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_CENTROID_GaussianModels_h_INCLUDED
