#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_form_tests(std::vector<ses::tests::TestCase>& tests);
void register_builder_tests(std::vector<ses::tests::TestCase>& tests);
void register_signer_tests(std::vector<ses::tests::TestCase>& tests);
void register_client_tests(std::vector<ses::tests::TestCase>& tests);
void register_config_tests(std::vector<ses::tests::TestCase>& tests);
void register_transport_tests(std::vector<ses::tests::TestCase>& tests);

int main(int argc, char** argv) {
    // Writes to a peer that hung up must not kill the runner.
    std::signal(SIGPIPE, SIG_IGN);

    std::vector<ses::tests::TestCase> tests;
    register_form_tests(tests);
    register_builder_tests(tests);
    register_signer_tests(tests);
    register_client_tests(tests);
    register_config_tests(tests);
    register_transport_tests(tests);

    // Optional name filter: run tests whose name contains argv[1].
    const std::string filter = (argc > 1) ? argv[1] : "";

    std::size_t ran = 0;
    std::size_t passed = 0;
    std::size_t failed = 0;

    for (const auto& test : tests) {
        if (!filter.empty() && test.name.find(filter) == std::string::npos) continue;
        ++ran;
        try {
            test.fn();
            ++passed;
        } catch (const std::exception& ex) {
            ++failed;
            std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
        }
    }

    std::cout << "Ran " << ran << " tests: " << passed << " passed, " << failed
              << " failed\n";
    return failed == 0 ? 0 : 1;
}
