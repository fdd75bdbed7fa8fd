#include <glog/logging.h>
#include <unistd.h>
#include <filesystem>
#include <system_error>
#include "common/system.hpp"
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    // 每次测试运行使用独立的临时目录，结束后整个删除
    grader::RUN_DIR = std::filesystem::temp_directory_path() / ("codegrader-test-" + std::to_string(getpid()));
    std::filesystem::create_directories(grader::RUN_DIR);
    // root 身份下不允许直接运行选手程序，切换到 nobody
    if (geteuid() == 0) {
      grader::RUN_USER_ID = grader::get_userid("nobody");
      grader::RUN_GROUP_ID = grader::get_primary_groupid(grader::RUN_USER_ID);
      ASSERT_GT(grader::RUN_USER_ID, 0) << "user nobody is required to run tests as root";
    }
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(grader::RUN_DIR, ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
