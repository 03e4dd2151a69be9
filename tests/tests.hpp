#ifndef _TESTS_HPP_
#define _TESTS_HPP_
#include <string>

// The strings that the test programs print, ctest looks for "passed"
namespace SIGMAZK_TESTS {
const std::string passed = "\033[0;32mpassed\033[0m";
const std::string failed = "\033[0;31mFAILED\033[0m";
}
#endif // ifndef _TESTS_HPP_
