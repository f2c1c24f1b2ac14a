#include "pybind11/pybind11.h"
#include "lsst/cpputils/python.h"

namespace py = pybind11;
using namespace pybind11::literals;
using lsst::cpputils::python::WrapperCollection;

namespace lsst {
namespace meas {
namespace centroid {

void wrapResult(WrapperCollection &wrappers);
void wrapGaussianModels(WrapperCollection &wrappers);
void wrapCentroidFunctions(WrapperCollection &wrappers);
void wrapCentroider(WrapperCollection &wrappers);

PYBIND11_MODULE(_measCentroidLib, mod) {
    WrapperCollection wrappers(mod, "lsst.meas.centroid");

    wrappers.addInheritanceDependency("lsst.geom");

    wrapResult(wrappers);
    wrapGaussianModels(wrappers);
    wrapCentroidFunctions(wrappers);
    wrapCentroider(wrappers);
    wrappers.finish();
};

}  // namespace centroid
}  // namespace meas
}  // namespace lsst
