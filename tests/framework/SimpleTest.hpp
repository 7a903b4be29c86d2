#pragma once

#include <iostream>
#include <vector>
#include <string>
#include <functional>
#include <stdexcept>
#include <cmath>

namespace coda::test {

class TestRunner {
public:
    static TestRunner& instance() {
        static TestRunner instance;
        return instance;
    }

    void register_test(const std::string& name, std::function<void()> test_func) {
        tests_.push_back({name, test_func});
    }

    int run_all() {
        int passed = 0;
        int failed = 0;

        std::cout << "\n=== CODA TEST SUITE ===\n" << std::endl;

        for (const auto& test : tests_) {
            try {
                test.func();
                std::cout << "[PASS] " << test.name << std::endl;
                passed++;
            } catch (const std::exception& e) {
                std::cout << "[FAIL] " << test.name << " - " << e.what() << std::endl;
                failed++;
            } catch (...) {
                std::cout << "[FAIL] " << test.name << " - Unknown exception" << std::endl;
                failed++;
            }
        }

        std::cout << "\nResults: " << passed << " Passed, " << failed << " Failed." << std::endl;
        return failed > 0 ? 1 : 0;
    }

private:
    struct TestEntry {
        std::string name;
        std::function<void()> func;
    };
    std::vector<TestEntry> tests_;
};

struct Registrar {
    Registrar(const std::string& name, std::function<void()> func) {
        TestRunner::instance().register_test(name, func);
    }
};

class AssertionFailure : public std::runtime_error {
public:
    AssertionFailure(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace coda::test

#define CODA_TEST_LOCATION " at " + std::string(__FILE__) + ":" + std::to_string(__LINE__)

#define TEST_CASE(name) \
    void name(); \
    static coda::test::Registrar reg_##name(#name, name); \
    void name()

#define ASSERT_TRUE(condition) \
    do { if (!(condition)) throw coda::test::AssertionFailure("Assertion failed: " #condition CODA_TEST_LOCATION); } while (0)

#define ASSERT_FALSE(condition) \
    do { if (condition) throw coda::test::AssertionFailure("Assertion failed: " #condition " is true" CODA_TEST_LOCATION); } while (0)

#define ASSERT_EQ(a, b) \
    do { if ((a) != (b)) throw coda::test::AssertionFailure("Assertion failed: " #a " == " #b CODA_TEST_LOCATION); } while (0)

#define ASSERT_NEAR(a, b, epsilon) \
    do { if (std::abs((a) - (b)) > epsilon) throw coda::test::AssertionFailure("Assertion failed: " #a " near " #b CODA_TEST_LOCATION); } while (0)

#define ASSERT_THROWS(statement, exception_type) \
    do { \
        bool thrown_ = false; \
        try { statement; } catch (const exception_type&) { thrown_ = true; } \
        if (!thrown_) throw coda::test::AssertionFailure("Expected " #exception_type " from " #statement CODA_TEST_LOCATION); \
    } while (0)
