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
#include "pybind11/pybind11.h"
#include "lsst/cpputils/python.h"
#include "pybind11/eigen.h"

#include "lsst/pex/config/python.h"  // defines LSST_DECLARE_CONTROL_FIELD
#include "lsst/meas/centroid/GaussianModels.h"
#include "lsst/meas/centroid/LevMarFitter.h"

namespace py = pybind11;
using namespace pybind11::literals;

namespace lsst {
namespace meas {
namespace centroid {
namespace {

void declareGaussianConst1D(lsst::cpputils::python::WrapperCollection &wrappers) {
    using PyGaussianConst1D = py::class_<GaussianConst1D>;
    wrappers.wrapType(PyGaussianConst1D(wrappers.module, "GaussianConst1D"), [](auto &mod, auto &cls) {
        cls.def(py::init<double, double, double, double>(), "constant"_a, "amplitude"_a, "mean"_a,
                "stddev"_a);
        cls.def(py::init<Eigen::VectorXd const &>(), "parameters"_a);

        cls.def("getConstant", &GaussianConst1D::getConstant);
        cls.def("getAmplitude", &GaussianConst1D::getAmplitude);
        cls.def("getMean", &GaussianConst1D::getMean);
        cls.def("getStddev", &GaussianConst1D::getStddev);
        cls.def("getParameters", &GaussianConst1D::getParameters);
        cls.def("__call__", &GaussianConst1D::operator(), "x"_a, py::is_operator());
    });
}

void declareGaussianConst2D(lsst::cpputils::python::WrapperCollection &wrappers) {
    using PyGaussianConst2D = py::class_<GaussianConst2D>;
    wrappers.wrapType(PyGaussianConst2D(wrappers.module, "GaussianConst2D"), [](auto &mod, auto &cls) {
        cls.def(py::init<double, double, double, double, double, double, double>(), "constant"_a,
                "amplitude"_a, "xMean"_a, "yMean"_a, "xStddev"_a, "yStddev"_a, "theta"_a = 0.0);
        cls.def(py::init<Eigen::VectorXd const &>(), "parameters"_a);

        cls.def("getConstant", &GaussianConst2D::getConstant);
        cls.def("getAmplitude", &GaussianConst2D::getAmplitude);
        cls.def("getXMean", &GaussianConst2D::getXMean);
        cls.def("getYMean", &GaussianConst2D::getYMean);
        cls.def("getXStddev", &GaussianConst2D::getXStddev);
        cls.def("getYStddev", &GaussianConst2D::getYStddev);
        cls.def("getTheta", &GaussianConst2D::getTheta);
        cls.def("getCenter", &GaussianConst2D::getCenter);
        cls.def("getParameters", &GaussianConst2D::getParameters);
        cls.def("__call__", &GaussianConst2D::operator(), "x"_a, "y"_a, py::is_operator());
    });
}

void declareLevMarControl(lsst::cpputils::python::WrapperCollection &wrappers) {
    using PyLevMarControl = py::class_<LevMarControl>;
    wrappers.wrapType(PyLevMarControl(wrappers.module, "LevMarControl"), [](auto &mod, auto &cls) {
        cls.def(py::init<>());

        LSST_DECLARE_CONTROL_FIELD(cls, LevMarControl, maxEvaluations);
        LSST_DECLARE_CONTROL_FIELD(cls, LevMarControl, ftol);
        LSST_DECLARE_CONTROL_FIELD(cls, LevMarControl, xtol);
        LSST_DECLARE_CONTROL_FIELD(cls, LevMarControl, gtol);
        LSST_DECLARE_CONTROL_FIELD(cls, LevMarControl, stepBound);

        cls.def("validate", &LevMarControl::validate);
    });
}

}  // namespace

void wrapGaussianModels(lsst::cpputils::python::WrapperCollection &wrappers) {
    declareGaussianConst1D(wrappers);
    declareGaussianConst2D(wrappers);
    declareLevMarControl(wrappers);
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
