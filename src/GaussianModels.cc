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

#include "lsst/pex/exceptions.h"
#include "lsst/meas/centroid/GaussianModels.h"

namespace lsst {
namespace meas {
namespace centroid {

namespace {

void checkParameterCount(Eigen::VectorXd const& parameters, int expected) {
    if (parameters.size() != expected) {
        throw LSST_EXCEPT(pex::exceptions::LengthError,
                          (boost::format("Expected %d model parameters; got %d.") % expected %
                           parameters.size())
                                  .str());
    }
}

// Coefficients of the quadratic form in the exponent of a rotated Gaussian.
struct EllipseCoefficients {
    double cos2;     // cos^2(theta)
    double sin2;     // sin^2(theta)
    double sin2t;    // sin(2 theta)
    double cos2t;    // cos(2 theta)
    double xVar2;    // 2 sigma_x^2
    double yVar2;    // 2 sigma_y^2
    double a;
    double b;
    double c;

    EllipseCoefficients(double xStddev, double yStddev, double theta) {
        double const cost = std::cos(theta);
        double const sint = std::sin(theta);
        cos2 = cost * cost;
        sin2 = sint * sint;
        sin2t = std::sin(2.0 * theta);
        cos2t = std::cos(2.0 * theta);
        xVar2 = 2.0 * xStddev * xStddev;
        yVar2 = 2.0 * yStddev * yStddev;
        a = cos2 / xVar2 + sin2 / yVar2;
        b = sin2t / xVar2 - sin2t / yVar2;
        c = sin2 / xVar2 + cos2 / yVar2;
    }
};

}  // namespace

GaussianConst1D::GaussianConst1D(Eigen::VectorXd const& parameters) {
    checkParameterCount(parameters, NPARAM);
    _constant = parameters[CONSTANT];
    _amplitude = parameters[AMPLITUDE];
    _mean = parameters[MEAN];
    _stddev = parameters[STDDEV];
}

Eigen::VectorXd GaussianConst1D::getParameters() const {
    Eigen::VectorXd parameters(NPARAM);
    parameters << _constant, _amplitude, _mean, _stddev;
    return parameters;
}

double GaussianConst1D::operator()(double x) const {
    double const u = (x - _mean) / _stddev;
    return _constant + _amplitude * std::exp(-0.5 * u * u);
}

void GaussianConst1D::computeValues(Eigen::MatrixXd const& coords, Eigen::VectorXd& values) const {
    values.resize(coords.rows());
    for (int i = 0; i < coords.rows(); ++i) {
        values[i] = (*this)(coords(i, 0));
    }
}

void GaussianConst1D::computeDerivatives(Eigen::MatrixXd const& coords, Eigen::MatrixXd& derivatives) const {
    derivatives.resize(coords.rows(), NPARAM);
    double const var = _stddev * _stddev;
    for (int i = 0; i < coords.rows(); ++i) {
        double const dx = coords(i, 0) - _mean;
        double const e = std::exp(-0.5 * dx * dx / var);
        double const g = _amplitude * e;
        derivatives(i, CONSTANT) = 1.0;
        derivatives(i, AMPLITUDE) = e;
        derivatives(i, MEAN) = g * dx / var;
        derivatives(i, STDDEV) = g * dx * dx / (var * _stddev);
    }
}

GaussianConst2D::GaussianConst2D(Eigen::VectorXd const& parameters) {
    checkParameterCount(parameters, NPARAM);
    _constant = parameters[CONSTANT];
    _amplitude = parameters[AMPLITUDE];
    _xMean = parameters[X_MEAN];
    _yMean = parameters[Y_MEAN];
    _xStddev = parameters[X_STDDEV];
    _yStddev = parameters[Y_STDDEV];
    _theta = parameters[THETA];
}

Eigen::VectorXd GaussianConst2D::getParameters() const {
    Eigen::VectorXd parameters(NPARAM);
    parameters << _constant, _amplitude, _xMean, _yMean, _xStddev, _yStddev, _theta;
    return parameters;
}

double GaussianConst2D::operator()(double x, double y) const {
    EllipseCoefficients const k(_xStddev, _yStddev, _theta);
    double const dx = x - _xMean;
    double const dy = y - _yMean;
    return _constant + _amplitude * std::exp(-(k.a * dx * dx + k.b * dx * dy + k.c * dy * dy));
}

void GaussianConst2D::computeValues(Eigen::MatrixXd const& coords, Eigen::VectorXd& values) const {
    EllipseCoefficients const k(_xStddev, _yStddev, _theta);
    values.resize(coords.rows());
    for (int i = 0; i < coords.rows(); ++i) {
        double const dx = coords(i, 0) - _xMean;
        double const dy = coords(i, 1) - _yMean;
        values[i] = _constant + _amplitude * std::exp(-(k.a * dx * dx + k.b * dx * dy + k.c * dy * dy));
    }
}

void GaussianConst2D::computeDerivatives(Eigen::MatrixXd const& coords, Eigen::MatrixXd& derivatives) const {
    EllipseCoefficients const k(_xStddev, _yStddev, _theta);
    derivatives.resize(coords.rows(), NPARAM);
    double const xStddev3 = _xStddev * _xStddev * _xStddev;
    double const yStddev3 = _yStddev * _yStddev * _yStddev;
    // derivatives of the quadratic-form coefficients with respect to theta
    double const daDtheta = k.sin2t * (1.0 / k.yVar2 - 1.0 / k.xVar2);
    double const dbDtheta = k.cos2t * (2.0 / k.xVar2 - 2.0 / k.yVar2);
    double const dcDtheta = -daDtheta;
    for (int i = 0; i < coords.rows(); ++i) {
        double const dx = coords(i, 0) - _xMean;
        double const dy = coords(i, 1) - _yMean;
        double const dx2 = dx * dx;
        double const dy2 = dy * dy;
        double const dxdy = dx * dy;
        double const e = std::exp(-(k.a * dx2 + k.b * dxdy + k.c * dy2));
        double const g = _amplitude * e;
        derivatives(i, CONSTANT) = 1.0;
        derivatives(i, AMPLITUDE) = e;
        derivatives(i, X_MEAN) = g * (2.0 * k.a * dx + k.b * dy);
        derivatives(i, Y_MEAN) = g * (k.b * dx + 2.0 * k.c * dy);
        derivatives(i, X_STDDEV) = g * (k.cos2 * dx2 + k.sin2t * dxdy + k.sin2 * dy2) / xStddev3;
        derivatives(i, Y_STDDEV) = g * (k.sin2 * dx2 - k.sin2t * dxdy + k.cos2 * dy2) / yStddev3;
        derivatives(i, THETA) = -g * (daDtheta * dx2 + dbDtheta * dxdy + dcDtheta * dy2);
    }
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
