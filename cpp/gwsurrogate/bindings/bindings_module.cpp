#include <pybind11/pybind11.h>

namespace py = pybind11;

// 声明外部初始化函数
void init_bindings_single(py::module &m);
void init_bindings_multi(py::module &m);

PYBIND11_MODULE(_gwsurrogate, m) {
    m.doc() = "Gravitational-wave surrogate evaluation C++ backend";

    init_bindings_single(m);
    init_bindings_multi(m);
}
