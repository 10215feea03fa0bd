#include <glog/logging.h>
#include <unistd.h>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    //  Stub
  }
  virtual void TearDown() {
    //  Stub
  }
};

/**
 * @brief 在沙箱中运行的辅助程序，SandboxTest 通过 --runbox-test-helper 启动测试程序自身
 *   alloc <MiB>  分配并写入内存，然后等待 1 秒
 *   spin         死循环消耗 CPU
 */
static int run_helper(int argc, char *argv[]) {
  std::string mode = argc > 2 ? argv[2] : "";
  if (mode == "alloc" && argc > 3) {
    size_t bytes = std::strtoull(argv[3], nullptr, 10) << 20;
    std::vector<char> buffer(bytes);
    for (size_t i = 0; i < bytes; i += 4096) buffer[i] = (char)i;
    sleep(1);
    return buffer[bytes / 2] == 0 ? 0 : 1;
  }
  if (mode == "spin") {
    volatile unsigned long counter = 0;
    while (true) ++counter;
  }
  return 100;
}

int main(int argc, char *argv[]) {
  if (argc > 1 && std::strcmp(argv[1], "--runbox-test-helper") == 0)
    return run_helper(argc, argv);

  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
