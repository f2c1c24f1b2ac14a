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

#include "ndarray/pybind11.h"

#include "lsst/pex/config/python.h"  // defines LSST_DECLARE_CONTROL_FIELD
#include "lsst/meas/centroid/centroidCom.h"
#include "lsst/meas/centroid/gaussianCentroid.h"
#include "lsst/meas/centroid/epsfCentroid.h"

namespace py = pybind11;
using namespace pybind11::literals;

namespace lsst {
namespace meas {
namespace centroid {
namespace {

template <int N>
void declareCentroidCom(py::module &mod) {
    mod.def("centroid_com", &centroidCom<N>, "data"_a,
            "mask"_a = ndarray::Array<bool const, N, 1>(), "oversampling"_a = Oversampling());
}

void declareEpsfCentroidControl(lsst::cpputils::python::WrapperCollection &wrappers) {
    using PyEpsfCentroidControl = py::class_<EpsfCentroidControl>;
    wrappers.wrapType(PyEpsfCentroidControl(wrappers.module, "EpsfCentroidControl"), [](auto &mod, auto &cls) {
        cls.def(py::init<>());

        LSST_DECLARE_CONTROL_FIELD(cls, EpsfCentroidControl, oversamplingX);
        LSST_DECLARE_CONTROL_FIELD(cls, EpsfCentroidControl, oversamplingY);
        LSST_DECLARE_CONTROL_FIELD(cls, EpsfCentroidControl, shiftVal);

        cls.def("getOversampling", &EpsfCentroidControl::getOversampling);
        cls.def("validate", &EpsfCentroidControl::validate);
    });
}

}  // namespace

void wrapCentroidFunctions(lsst::cpputils::python::WrapperCollection &wrappers) {
    declareEpsfCentroidControl(wrappers);

    wrappers.wrap([](auto &mod) {
        mod.def("centroid_com",
                (Result<geom::Point2D>(*)(ImageArray const &, MaskArray const &, Oversampling const &)) &
                        centroidCom,
                "data"_a, "mask"_a = MaskArray(), "oversampling"_a = Oversampling());
        declareCentroidCom<1>(mod);
        declareCentroidCom<3>(mod);

        mod.def("gaussian1d_moments", &gaussian1dMoments, "data"_a,
                "mask"_a = ndarray::Array<bool const, 1, 1>());
        mod.def("fit_2dgaussian", &fit2dGaussian, "data"_a, "error"_a = ImageArray(), "mask"_a = MaskArray(),
                "ctrl"_a = LevMarControl());
        mod.def("centroid_1dg", &centroid1dg, "data"_a, "error"_a = ImageArray(), "mask"_a = MaskArray(),
                "ctrl"_a = LevMarControl());
        mod.def("centroid_2dg", &centroid2dg, "data"_a, "error"_a = ImageArray(), "mask"_a = MaskArray(),
                "ctrl"_a = LevMarControl());

        mod.def("centroid_epsf",
                (geom::Point2D(*)(ImageArray const &, MaskArray const &, Oversampling const &, double)) &
                        centroidEpsf,
                "data"_a, "mask"_a = MaskArray(), "oversampling"_a = Oversampling(4.0), "shift_val"_a = 0.5);
        mod.def("centroid_epsf",
                (geom::Point2D(*)(ImageArray const &, MaskArray const &, EpsfCentroidControl const &)) &
                        centroidEpsf,
                "data"_a, "mask"_a, "ctrl"_a);
    });
}

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
