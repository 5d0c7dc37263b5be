#pragma once

namespace weft {
namespace autograd {

/**
 * @brief Thread-local switch for graph recording
 *
 * While enabled, Function::apply still computes forward results but records
 * them as constants: no History, nothing saved for backward.
 */
class NoGradMode {
  public:
    /// @return true if a NoGrad scope is active on this thread
    static bool isEnabled();

    static void setEnabled(bool enabled);

  private:
    static thread_local bool sEnabled;
};

/**
 * @brief RAII guard that disables graph recording for its scope
 *
 * @code
 *   {
 *       NoGrad no_grad;
 *       Scalar y = x * 2.0;  // y is a constant, x gets no gradient through it
 *   }
 * @endcode
 */
class NoGrad {
  public:
    NoGrad() : mPrevState(NoGradMode::isEnabled()) { NoGradMode::setEnabled(true); }
    ~NoGrad() { NoGradMode::setEnabled(mPrevState); }

    NoGrad(const NoGrad&) = delete;
    NoGrad& operator=(const NoGrad&) = delete;

  private:
    bool mPrevState;
};

}  // namespace autograd
}  // namespace weft
