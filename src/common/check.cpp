#include "weft/check.h"

#include <format>

#include "weft/logger.h"

namespace weft {
namespace detail {

void failCheck(const char* condition, const std::string& message, const char* file, int line) {
    const std::string what = std::format("{} (check `{}` failed at {}:{})", message, condition,
                                         file, line);
    Logger::getInstance("Check").fatal(what);
    throw InvariantError(what);
}

}  // namespace detail
}  // namespace weft
