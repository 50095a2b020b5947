/*
 * test_common.hpp
 *
 * Minimal check helpers shared by the test executables. Each test binary
 * prints its progress and returns nonzero if any check failed.
 */

#ifndef KINECT_CAMERA_TEST_COMMON_HPP
#define KINECT_CAMERA_TEST_COMMON_HPP

#include <iostream>

namespace test {

inline int& failures() {
    static int count = 0;
    return count;
}

inline int finish(const char* name) {
    if (failures() == 0) {
        std::cout << "\n=== " << name << ": PASS ===\n";
        return 0;
    }
    std::cout << "\n=== " << name << ": FAIL (" << failures() << " checks) ===\n";
    return 1;
}

} // namespace test

#define CHECK(cond)                                                        \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cout << "  FAIL " << __FILE__ << ":" << __LINE__          \
                      << "  " #cond "\n";                                  \
            ++test::failures();                                            \
        }                                                                  \
    } while (0)

// Evaluates `expr` and checks that it throws exception type `type`.
#define CHECK_THROWS_AS(expr, type)                                        \
    do {                                                                   \
        bool thrown_ = false;                                              \
        try {                                                              \
            expr;                                                          \
        } catch (const type&) {                                            \
            thrown_ = true;                                                \
        }                                                                  \
        if (!thrown_) {                                                    \
            std::cout << "  FAIL " << __FILE__ << ":" << __LINE__          \
                      << "  " #expr " did not throw " #type "\n";          \
            ++test::failures();                                            \
        }                                                                  \
    } while (0)

#endif // KINECT_CAMERA_TEST_COMMON_HPP
