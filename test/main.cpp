#include <exgroup/log/log.h>
#include <gtest/gtest.h>

#include "test_kinds.h"

class test_env : public testing::Environment {
  public:
    void SetUp() override {
        using namespace exgroup;
        set_log_level(log_level::warn);
        register_test_kinds();
    }

    void TearDown() override { exgroup::log_flush(); }
};

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);

    testing::AddGlobalTestEnvironment(new test_env);

    return RUN_ALL_TESTS();
}
