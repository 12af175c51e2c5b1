/**
 * @file drivers.hpp
 * @brief Test-driver programs placed beside the submission.
 *
 * A driver loads the submission, feeds one test's input to it and prints
 * the answer on stdout:
 *   - output printed while loading (a stdin-driven script) is the answer;
 *   - otherwise `main(raw_input)` if defined, else the last top-level
 *     function, called with arguments parsed from the input ("3,4" gives
 *     two arguments; unparsable input is passed as one string);
 *   - a returned list/dict/object prints as JSON, other values as text, and
 *     a function that returns nothing contributes what it printed.
 */

#pragma once

#include <string_view>

namespace sandbox_gate {

inline constexpr std::string_view kPythonDriverFile = "_driver.py";
inline constexpr std::string_view kJavaScriptDriverFile = "_driver.js";

/// Python 3 driver: `python3 _driver.py <solution.py>`.
[[nodiscard]] std::string_view python_driver_source() noexcept;

/// Node.js driver: `node _driver.js <solution.js>`. Also runs compiled TypeScript.
[[nodiscard]] std::string_view javascript_driver_source() noexcept;

}  // namespace sandbox_gate
