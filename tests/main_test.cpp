#include <gtest/gtest.h>

#include <iostream>

#include "utils/Logger.hpp"
#include "utils/ResourceMonitor.hpp"

using namespace Methodical::Utils;

class ResourceListener : public testing::EmptyTestEventListener {
public:
    void OnTestStart(const testing::TestInfo& /*test_info*/) override {
        Logger::instance().reset_counts();
        monitor_.reset();
    }

    // Per-test time and memory, plus the errors a test logged on purpose
    void OnTestEnd(const testing::TestInfo& test_info) override {
        std::string test_name = std::string(test_info.test_suite_name()) + "." + test_info.name();
        std::cout << monitor_.format_stats(test_name);
        long errors = Logger::instance().count(Methodical::LogLevel::LOG_ERROR);
        if (errors > 0) {
            std::cout << ", logged errors: " << errors;
        }
        std::cout << std::endl;
    }

private:
    ResourceMonitor monitor_;
};

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);

    // Pipeline INFO lines drown the test report; warnings and errors stay visible
    Logger::instance().set_log_level(Methodical::LogLevel::LOG_WARN);

    testing::TestEventListeners& listeners = testing::UnitTest::GetInstance()->listeners();
    listeners.Append(new ResourceListener);

    return RUN_ALL_TESTS();
}
