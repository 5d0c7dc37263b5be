#pragma once
#include <stdexcept>
#include <string>

namespace weft {

// Raised for structural invariant violations: programmer errors in the code
// building tensors or graphs, not bad runtime input. Not meant to be handled.
class InvariantError : public std::logic_error {
  public:
    using std::logic_error::logic_error;
};

namespace detail {
// Logs the failure at FATAL level under the "Check" scope, then throws InvariantError
[[noreturn]] void failCheck(const char* condition, const std::string& message, const char* file,
                            int line);
}  // namespace detail

}  // namespace weft

// ============================================================================
// Invariant checks - always on, independent of NDEBUG
// ============================================================================
#define WEFT_CHECK(condition, message)                                          \
    do {                                                                        \
        if (!(condition)) {                                                     \
            ::weft::detail::failCheck(#condition, (message), __FILE__, __LINE__); \
        }                                                                       \
    } while (0)
