#include "pybind11/pybind11.h"
#include "pybind11/stl.h"
#include "pybind11/functional.h"
#define FORCE_IMPORT_ARRAY
#include "xtensor-python/pyarray.hpp"     // Numpy bindings
typedef xt::pyarray<double> PyArray;

#include "cachedmatrix.h"
#include "inverse_impl.h"
#include "cachesolve.h"

namespace py = pybind11;

typedef CachedMatrix<PyArray> PyCachedMatrix;

// Arrays are handed out as copies so that python code cannot modify the
// stored matrices in place.
PYBIND11_MODULE(cachesolvepp, m) {
    xt::import_numpy();

    py::register_exception<InvalidMatrixError>(m, "InvalidMatrixError", PyExc_ValueError);

    py::enum_<InverseMethod>(m, "InverseMethod")
        .value("PartialPivLU", InverseMethod::PartialPivLU)
        .value("FullPivLU", InverseMethod::FullPivLU)
        .value("ColPivHouseholderQR", InverseMethod::ColPivHouseholderQR)
        .value("FullPivHouseholderQR", InverseMethod::FullPivHouseholderQR);

    py::class_<InverseOptions>(m, "InverseOptions")
        .def(py::init<>())
        .def_readwrite("method", &InverseOptions::method)
        .def_readwrite("tol", &InverseOptions::tol)
        .def_readwrite("verbose", &InverseOptions::verbose)
        .def("__repr__", [](const InverseOptions& o) {
            return fmt::format("InverseOptions(method={}, tol={:g}, verbose={})", method_name(o.method), o.tol, o.verbose);
        });

    py::class_<PyCachedMatrix>(m, "CachedMatrix")
        .def(py::init<>())
        .def(py::init<const PyArray&>(), py::arg("x"))
        .def("set", &PyCachedMatrix::set, py::arg("x"))
        .def("get", [](const PyCachedMatrix& c) { return PyArray(c.get()); })
        .def("set_inverse", [](PyCachedMatrix& c, optional<PyArray> inv) {
            // inv may wrap the caller's numpy buffer, the holder stores a deep copy
            c.set_inverse(inv);
        }, py::arg("inv"))
        .def("get_inverse", [](const PyCachedMatrix& c) -> optional<PyArray> {
            if(!c.has_inverse())
                return nullopt;
            return PyArray(*c.get_inverse());
        })
        .def("has_inverse", &PyCachedMatrix::has_inverse)
        .def("invalidate_cache", &PyCachedMatrix::invalidate_cache);

    m.def("invert", [](const PyArray& a, const InverseOptions& options) {
            return invert<PyArray>(a, options);
        }, py::arg("a"), py::arg("options") = InverseOptions());
    m.def("cache_solve", [](PyCachedMatrix& x, const InverseOptions& options) {
            return PyArray(cache_solve<PyArray>(x, options));
        }, py::arg("x"), py::arg("options") = InverseOptions());
}
