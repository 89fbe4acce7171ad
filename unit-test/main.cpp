#include <glog/logging.h>
#include <signal.h>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/helpers.hpp"

class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        ptyrun::test::setup_test_environment();
    }

    void TearDown() override {
        ptyrun::test::cleanup_test_environment();
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    signal(SIGPIPE, SIG_IGN);

    AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
