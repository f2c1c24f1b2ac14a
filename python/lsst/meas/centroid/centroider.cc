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
#include "pybind11/functional.h"
#include "pybind11/stl.h"

#include <memory>

#include "ndarray/pybind11.h"

#include "lsst/pex/config/python.h"  // defines LSST_DECLARE_CONTROL_FIELD
#include "lsst/meas/centroid/Centroider.h"
#include "lsst/meas/centroid/centroidSources.h"

namespace py = pybind11;
using namespace pybind11::literals;

namespace lsst {
namespace meas {
namespace centroid {
namespace {

using PyCentroider = py::class_<Centroider, std::shared_ptr<Centroider>>;
using PyErrorCentroider = py::class_<ErrorCentroider, std::shared_ptr<ErrorCentroider>, Centroider>;

void declareCentroiderBases(lsst::cpputils::python::WrapperCollection &wrappers) {
    wrappers.wrapType(PyCentroider(wrappers.module, "Centroider"), [](auto &mod, auto &cls) {
        cls.def("apply", (Result<geom::Point2D>(Centroider::*)(ImageArray const &, MaskArray const &) const) &
                                 Centroider::apply,
                "data"_a, "mask"_a = MaskArray());
        cls.def("apply",
                (Result<geom::Point2D>(Centroider::*)(ImageArray const &, MaskArray const &,
                                                      ImageArray const &) const) &
                        Centroider::apply,
                "data"_a, "mask"_a, "error"_a);
        cls.def("usesError", &Centroider::usesError);
    });
    wrappers.wrapType(PyErrorCentroider(wrappers.module, "ErrorCentroider"), [](auto &mod, auto &cls) {});
}

template <typename T, typename Base, typename... Args>
void declareCentroider(lsst::cpputils::python::WrapperCollection &wrappers, std::string const &name,
                       py::arg_v const &arg) {
    using PyClass = py::class_<T, std::shared_ptr<T>, Base>;
    wrappers.wrapType(PyClass(wrappers.module, name.c_str()), [arg](auto &mod, auto &cls) {
        cls.def(py::init<Args...>(), arg);
        cls.def("getControl", &T::getControl);
    });
}

void declareCentroidSourcesControl(lsst::cpputils::python::WrapperCollection &wrappers) {
    using PyCentroidSourcesControl = py::class_<CentroidSourcesControl>;
    wrappers.wrapType(PyCentroidSourcesControl(wrappers.module, "CentroidSourcesControl"),
                      [](auto &mod, auto &cls) {
                          cls.def(py::init<>());

                          LSST_DECLARE_CONTROL_FIELD(cls, CentroidSourcesControl, boxSize);

                          cls.def("validate", &CentroidSourcesControl::validate);
                          cls.def("makeFootprint", &CentroidSourcesControl::makeFootprint);
                      });
}

}  // namespace

void wrapCentroider(lsst::cpputils::python::WrapperCollection &wrappers) {
    declareCentroiderBases(wrappers);

    using PyComCentroider = py::class_<ComCentroider, std::shared_ptr<ComCentroider>, Centroider>;
    wrappers.wrapType(PyComCentroider(wrappers.module, "ComCentroider"), [](auto &mod, auto &cls) {
        cls.def(py::init<Oversampling const &>(), "oversampling"_a = Oversampling());
        cls.def("getOversampling", &ComCentroider::getOversampling);
    });
    declareCentroider<Gaussian1dCentroider, ErrorCentroider, LevMarControl const &>(
            wrappers, "Gaussian1dCentroider", "ctrl"_a = LevMarControl());
    declareCentroider<Gaussian2dCentroider, ErrorCentroider, LevMarControl const &>(
            wrappers, "Gaussian2dCentroider", "ctrl"_a = LevMarControl());
    declareCentroider<EpsfCentroider, Centroider, EpsfCentroidControl const &>(
            wrappers, "EpsfCentroider", "ctrl"_a = EpsfCentroidControl());

    using PyFunctionCentroider =
            py::class_<FunctionCentroider, std::shared_ptr<FunctionCentroider>, Centroider>;
    wrappers.wrapType(PyFunctionCentroider(wrappers.module, "FunctionCentroider"), [](auto &mod, auto &cls) {
        cls.def(py::init<FunctionCentroider::Function const &>(), "function"_a);
    });
    using PyFunctionErrorCentroider =
            py::class_<FunctionErrorCentroider, std::shared_ptr<FunctionErrorCentroider>, ErrorCentroider>;
    wrappers.wrapType(PyFunctionErrorCentroider(wrappers.module, "FunctionErrorCentroider"),
                      [](auto &mod, auto &cls) {
                          cls.def(py::init<FunctionErrorCentroider::Function const &>(), "function"_a);
                      });

    declareCentroidSourcesControl(wrappers);

    wrappers.wrap([](auto &mod) {
        mod.def("makeCentroider", &makeCentroider, "name"_a);
        mod.def("centroid_sources", &centroidSources, "data"_a, "xpos"_a, "ypos"_a, "centroider"_a,
                "ctrl"_a = CentroidSourcesControl(), "footprint"_a = MaskArray(), "error"_a = ImageArray(),
                "mask"_a = MaskArray());
    });
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
