#include <unistd.h>
#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <codebox/logger.h>
#include <codebox/paths.h>

int verbosity;

class MyEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    InitLogger(verbosity);
    spdlog::set_pattern("[%P:%t] %+");
    fs::create_directories(kStoreRoot);
  }
  void TearDown() override {
    fs::remove_all(kStoreRoot);
  }
};

testing::Environment* const my_env = testing::AddGlobalTestEnvironment(new MyEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  kStoreRoot = fs::temp_directory_path() / ("codebox_test_" + std::to_string(getpid()));
  verbosity = 0;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) verbosity = 1;
    if (std::string("-vv") == argv[1]) verbosity = 2;
  }
  return RUN_ALL_TESTS();
}
