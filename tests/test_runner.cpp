// Test runner: runs every suite against the fake driver and reports results.

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <chrono>

// Forward declarations of test functions from other test files.
namespace test_command_parser {
    bool run_all_tests();
}

namespace test_tab_registry {
    bool run_all_tests();
}

namespace test_action_dispatcher {
    bool run_all_tests();
}

namespace test_frame_decoder {
    bool run_all_tests();
}

namespace test_envelope {
    bool run_all_tests();
}

namespace test_unix_socket {
    bool run_all_tests();
}

namespace test_daemon_config {
    bool run_all_tests();
}

namespace test_client {
    bool run_all_tests();
}

namespace test_chrome_launch {
    bool run_all_tests();
}

namespace test_daemon_lifecycle {
    bool run_all_tests();
}

struct TestSuite {
    std::string name;
    std::function<bool()> runner;
};

int main() {
    std::vector<TestSuite> suites = {
        {"test_command_parser", test_command_parser::run_all_tests},
        {"test_tab_registry", test_tab_registry::run_all_tests},
        {"test_action_dispatcher", test_action_dispatcher::run_all_tests},
        {"test_frame_decoder", test_frame_decoder::run_all_tests},
        {"test_envelope", test_envelope::run_all_tests},
        {"test_unix_socket", test_unix_socket::run_all_tests},
        {"test_daemon_config", test_daemon_config::run_all_tests},
        {"test_client", test_client::run_all_tests},
        {"test_chrome_launch", test_chrome_launch::run_all_tests},
        {"test_daemon_lifecycle", test_daemon_lifecycle::run_all_tests},
    };

    int passed_count = 0;
    int failed_count = 0;
    auto total_start_time = std::chrono::steady_clock::now();

    std::cout << "=== NLBD Test Runner ===" << std::endl;
    std::cout << std::endl;

    for (const auto &suite : suites) {
        std::cout << "--- " << suite.name << " ---" << std::endl;
        auto suite_start_time = std::chrono::steady_clock::now();

        bool suite_passed = suite.runner();

        auto suite_elapsed = std::chrono::steady_clock::now() - suite_start_time;
        long suite_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(suite_elapsed).count();

        if (suite_passed) {
            std::cout << "  PASSED (" << suite_milliseconds << " ms)" << std::endl;
            passed_count++;
        } else {
            std::cout << "  FAILED (" << suite_milliseconds << " ms)" << std::endl;
            failed_count++;
        }
        std::cout << std::endl;
    }

    auto total_elapsed = std::chrono::steady_clock::now() - total_start_time;
    long total_milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(total_elapsed).count();

    std::cout << "=== Results ===" << std::endl;
    std::cout << "  Passed: " << passed_count << std::endl;
    std::cout << "  Failed: " << failed_count << std::endl;
    std::cout << "  Total time: " << total_milliseconds << " ms" << std::endl;

    return (failed_count == 0) ? 0 : 1;
}
