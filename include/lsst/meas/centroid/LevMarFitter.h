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
#ifndef LSST_MEAS_CENTROID_LevMarFitter_h_INCLUDED
#define LSST_MEAS_CENTROID_LevMarFitter_h_INCLUDED

#include "Eigen/Core"
#include "unsupported/Eigen/NonLinearOptimization"

#include "boost/format.hpp"

#include "lsst/pex/config.h"
#include "lsst/pex/exceptions.h"

namespace lsst {
namespace meas {
namespace centroid {

/**
 *  Control object for the Levenberg-Marquardt fits used by the Gaussian
 *  centroiders.
 */
class LevMarControl {
public:
    LevMarControl() : maxEvaluations(100), ftol(1.0e-7), xtol(1.0e-7), gtol(0.0), stepBound(100.0) {}

    LSST_CONTROL_FIELD(maxEvaluations, int, "Maximum number of model evaluations.");

    LSST_CONTROL_FIELD(ftol, double, "Relative tolerance on the reduction of the sum of squares.");

    LSST_CONTROL_FIELD(xtol, double, "Relative tolerance on the change of the parameters.");

    LSST_CONTROL_FIELD(gtol, double, "Tolerance on the orthogonality of the residuals and the Jacobian.");

    LSST_CONTROL_FIELD(stepBound, double, "Factor setting the initial step bound.");

    /// @throws lsst::pex::exceptions::InvalidParameterError if a field is out of range.
    void validate() const;
};

/**
\brief Fit a parametric model to weighted data with the Levenberg-Marquardt
algorithm, using the analytic derivatives provided by the model.

The quantity minimised is
\f[ \sum_i \left( w_i \left( f(\mathbf{x}_i) - d_i \right) \right)^2 \f]
so a weight is the inverse of a 1\f$\sigma\f$ uncertainty, and a zero weight
removes a point from the fit.

The fit is performed on construction; whatever the solver returns is kept,
whether or not it reports convergence.

\tparam ModelT The model to fit.  Must provide a constructor from an
Eigen::VectorXd of parameters, getParameters(), computeValues(coords, values)
and computeDerivatives(coords, derivatives), as GaussianConst1D and
GaussianConst2D do.

\param initial Initial guess; not modified
\param coords One row per data point, one column per coordinate
\param data Measured values
\param weights Per-point weights
\param ctrl Solver settings
*/
template <class ModelT>
class LevMarFitter {
public:
    LevMarFitter(ModelT const& initial, Eigen::MatrixXd const& coords, Eigen::VectorXd const& data,
                 Eigen::VectorXd const& weights, LevMarControl const& ctrl = LevMarControl());

    /// Return the best-fit model.
    ModelT const& getBestFitModel() const { return _model; }

    /// Return the solver's termination status (Eigen::LevenbergMarquardtSpace::Status).
    int getStatus() const { return _status; }

    /// Return the number of model evaluations used by the solver.
    int getNumEvaluations() const { return _nEvaluations; }

    /// Return the weighted sum of squared residuals of the best-fit model.
    double getChiSq() const;

private:
    // Adapts a model type to the functor interface of Eigen::LevenbergMarquardt.
    class Residuals {
    public:
        Residuals(Eigen::MatrixXd const& coords, Eigen::VectorXd const& data, Eigen::VectorXd const& weights)
                : _coords(coords), _data(data), _weights(weights) {}

        int operator()(Eigen::VectorXd const& parameters, Eigen::VectorXd& residuals) const {
            ModelT(parameters).computeValues(_coords, residuals);
            residuals = _weights.cwiseProduct(residuals - _data);
            return 0;
        }

        int df(Eigen::VectorXd const& parameters, Eigen::MatrixXd& jacobian) const {
            ModelT(parameters).computeDerivatives(_coords, jacobian);
            jacobian = _weights.asDiagonal() * jacobian;
            return 0;
        }

        int values() const { return _data.size(); }

        int inputs() const { return ModelT::NPARAM; }

    private:
        Eigen::MatrixXd const& _coords;
        Eigen::VectorXd const& _data;
        Eigen::VectorXd const& _weights;
    };

    Eigen::MatrixXd _coords;
    Eigen::VectorXd _data;
    Eigen::VectorXd _weights;
    ModelT _model;
    int _status;
    int _nEvaluations;
};

//The .cc part

template <class ModelT>
LevMarFitter<ModelT>::LevMarFitter(ModelT const& initial, Eigen::MatrixXd const& coords,
                                   Eigen::VectorXd const& data, Eigen::VectorXd const& weights,
                                   LevMarControl const& ctrl)
        : _coords(coords), _data(data), _weights(weights), _model(initial), _status(0), _nEvaluations(0) {
    ctrl.validate();
    if (_coords.rows() != _data.size()) {
        throw LSST_EXCEPT(pex::exceptions::LengthError,
                          (boost::format("Got %d coordinates for %d data points.") % _coords.rows() %
                           _data.size())
                                  .str());
    }
    if (_weights.size() != _data.size()) {
        throw LSST_EXCEPT(pex::exceptions::LengthError,
                          (boost::format("Got %d weights for %d data points.") % _weights.size() %
                           _data.size())
                                  .str());
    }

    Residuals residuals(_coords, _data, _weights);
    Eigen::LevenbergMarquardt<Residuals> solver(residuals);
    solver.parameters.maxfev = ctrl.maxEvaluations;
    solver.parameters.ftol = ctrl.ftol;
    solver.parameters.xtol = ctrl.xtol;
    solver.parameters.gtol = ctrl.gtol;
    solver.parameters.factor = ctrl.stepBound;

    Eigen::VectorXd parameters = initial.getParameters();
    _status = solver.minimize(parameters);
    _nEvaluations = solver.nfev;
    _model = ModelT(parameters);
}

template <class ModelT>
double LevMarFitter<ModelT>::getChiSq() const {
    Eigen::VectorXd residuals;
    Residuals(_coords, _data, _weights)(_model.getParameters(), residuals);
    return residuals.squaredNorm();
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst

#endif  // !LSST_MEAS_CENTROID_LevMarFitter_h_INCLUDED
