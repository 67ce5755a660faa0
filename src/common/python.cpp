#include "common/python.hpp"

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

PyThread_guard::PyThread_guard() {
    state = PyEval_SaveThread();
}

PyThread_guard::~PyThread_guard() {
    PyEval_RestoreThread(state);
}

void initialize_python() {
    if (Py_IsInitialized()) return;
    // 不处理信号，SIGINT 等信号仍由宿主程序处理
    Py_InitializeEx(0);
}
