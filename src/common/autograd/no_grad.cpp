#include "weft/autograd/no_grad.h"

namespace weft {
namespace autograd {

// Recording is on by default
thread_local bool NoGradMode::sEnabled = false;

bool NoGradMode::isEnabled() {
    return sEnabled;
}

void NoGradMode::setEnabled(bool enabled) {
    sEnabled = enabled;
}

}  // namespace autograd
}  // namespace weft
