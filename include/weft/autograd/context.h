#pragma once
#include <utility>
#include <vector>

namespace weft {
namespace autograd {

// Context: scratch space bridging one forward call to its matching backward call.
// Created by Function::apply, filled by forward, stored unchanged in the
// History of the result and handed read-only to backward.
template <typename T>
class Context {
  public:
    explicit Context(bool noGrad = false) : mNoGrad(noGrad) {}

    // Stash values needed by backward. Ignored when gradients are disabled.
    template <typename... Values>
    void saveForBackward(Values&&... values) {
        if (mNoGrad) {
            return;
        }
        (mSavedValues.push_back(std::forward<Values>(values)), ...);
    }

    [[nodiscard]] const std::vector<T>& savedValues() const { return mSavedValues; }
    [[nodiscard]] bool noGrad() const { return mNoGrad; }

  private:
    bool mNoGrad;
    std::vector<T> mSavedValues;
};

}  // namespace autograd
}  // namespace weft
