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
#include "pybind11/stl.h"

#include <vector>

#include "lsst/meas/centroid/Result.h"
#include "lsst/meas/centroid/Oversampling.h"
#include "lsst/meas/centroid/GaussianModels.h"
#include "lsst/meas/centroid/gaussianCentroid.h"
#include "lsst/meas/centroid/centroidSources.h"

namespace py = pybind11;
using namespace pybind11::literals;

namespace lsst {
namespace meas {
namespace centroid {
namespace {

void declareConditions(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(py::enum_<Condition>(wrappers.module, "Condition"), [](auto &mod, auto &enm) {
        enm.value("NONFINITE_DATA", Condition::NONFINITE_DATA);
        enm.value("NONFINITE_ERROR", Condition::NONFINITE_ERROR);
    });
    wrappers.wrapType(py::class_<Conditions>(wrappers.module, "Conditions"), [](auto &mod, auto &cls) {
        cls.def(py::init<>());
        cls.def("add", &Conditions::add, "condition"_a, "message"_a);
        cls.def("extend", &Conditions::extend, "other"_a);
        cls.def("has", &Conditions::has, "condition"_a);
        cls.def("empty", &Conditions::empty);
        cls.def("__len__", &Conditions::size);
        cls.def("getEntries", &Conditions::getEntries);
    });
}

template <typename T>
void declareResult(lsst::cpputils::python::WrapperCollection &wrappers, std::string const &name) {
    using PyResult = py::class_<Result<T>>;
    wrappers.wrapType(PyResult(wrappers.module, name.c_str()), [](auto &mod, auto &cls) {
        cls.def(py::init<T const &, Conditions const &>(), "value"_a, "conditions"_a = Conditions());
        cls.def_readwrite("value", &Result<T>::value);
        cls.def_readwrite("conditions", &Result<T>::conditions);
    });
}

void declareOversampling(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(py::class_<Oversampling>(wrappers.module, "Oversampling"), [](auto &mod, auto &cls) {
        cls.def(py::init<double>(), "factor"_a = 1.0);
        cls.def(py::init<double, double>(), "xFactor"_a, "yFactor"_a);
        cls.def(py::init<std::vector<double> const &>(), "factors"_a);
        cls.def("getFactor", &Oversampling::getFactor, "axis"_a);
        cls.def("getX", &Oversampling::getX);
        cls.def("getY", &Oversampling::getY);
        cls.def("isScalar", &Oversampling::isScalar);
        cls.def("getFactors", &Oversampling::getFactors);
        cls.def("validate", &Oversampling::validate, "nAxes"_a);
    });
    py::implicitly_convertible<double, Oversampling>();
    py::implicitly_convertible<std::vector<double>, Oversampling>();
}

void declareValueTypes(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(py::class_<Gaussian1DMoments>(wrappers.module, "Gaussian1DMoments"),
                      [](auto &mod, auto &cls) {
                          cls.def(py::init<double, double, double>(), "amplitude"_a, "mean"_a, "stddev"_a);
                          cls.def_readwrite("amplitude", &Gaussian1DMoments::amplitude);
                          cls.def_readwrite("mean", &Gaussian1DMoments::mean);
                          cls.def_readwrite("stddev", &Gaussian1DMoments::stddev);
                      });
    wrappers.wrapType(py::class_<SourceCentroids>(wrappers.module, "SourceCentroids"),
                      [](auto &mod, auto &cls) {
                          cls.def(py::init<>());
                          cls.def_readwrite("x", &SourceCentroids::x);
                          cls.def_readwrite("y", &SourceCentroids::y);
                      });
}

}  // namespace

void wrapResult(lsst::cpputils::python::WrapperCollection &wrappers) {
    declareConditions(wrappers);
    declareOversampling(wrappers);
    declareValueTypes(wrappers);
    declareResult<geom::Point2D>(wrappers, "PointResult");
    declareResult<Gaussian1DMoments>(wrappers, "Gaussian1DMomentsResult");
    declareResult<GaussianConst2D>(wrappers, "GaussianConst2DResult");
    declareResult<SourceCentroids>(wrappers, "SourceCentroidsResult");
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
