#pragma once

#include <Python.h>

/**
 * @brief 在当前线程获取 GIL，析构时释放
 * 任何调用 CPython API 的代码都需要先持有 GIL
 */
class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

private:
    PyGILState_STATE state;
};

/**
 * @brief 释放当前线程持有的 GIL，析构时重新获取
 * 主线程初始化解释器后应当持有此对象，其他线程才能通过 GIL_guard 使用解释器
 */
class PyThread_guard {
public:
    PyThread_guard();
    ~PyThread_guard();

private:
    PyThreadState *state;
};

/**
 * @brief 初始化嵌入的 Python 解释器，重复调用无副作用
 * 嵌入的解释器只用于语法分析（ast 模块），不会执行用户代码
 */
void initialize_python();
