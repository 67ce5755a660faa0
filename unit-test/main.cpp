#include <glog/logging.h>
#include "common/python.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    initialize_python();
    // 主线程释放 GIL，解析器通过 GIL_guard 重新获取
    state = PyEval_SaveThread();
  }
  virtual void TearDown() {
    PyEval_RestoreThread(state);
  }

 private:
  PyThreadState *state = nullptr;
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
