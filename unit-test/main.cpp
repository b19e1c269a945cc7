#include <glog/logging.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/environment.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    pyexec::setup_test_environment();
  }
  virtual void TearDown() {
    pyexec::teardown_test_environment();
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
