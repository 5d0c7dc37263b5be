#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "weft/autograd/context.h"

namespace weft {
namespace autograd {

// Stable position of a node in its Graph arena
using NodeId = size_t;

template <typename T>
class Function;
template <typename T>
class Variable;

// History: how a computed value was produced. Input ids always refer to nodes
// created before the node holding this History, which keeps the graph acyclic.
template <typename T>
struct History {
    std::shared_ptr<const Function<T>> function;
    Context<T> context;
    std::vector<NodeId> inputs;
};

// Function: base class for every differentiable primitive over values of type T
// (double for scalars, TensorData for tensors). Each operation (Add, Mul, Log, ...)
// implements forward() and the matching backward().
template <typename T>
class Function : public std::enable_shared_from_this<Function<T>> {
  public:
    virtual ~Function() = default;

    // Get name for debugging (e.g., "Add", "Sigmoid")
    [[nodiscard]] virtual std::string name() const = 0;

    // Number of operands forward() expects
    [[nodiscard]] virtual size_t numInputs() const = 0;

    // Pure computation on raw values; may stash values into ctx for backward
    virtual T forward(Context<T>& ctx, const std::vector<T>& inputs) const = 0;

    // Gradient of the output w.r.t. each input, one entry per input (in order)
    // Example: for z = x * y, backward(dL/dz) returns [dL/dz * y, dL/dz * x]
    virtual std::vector<T> backward(const Context<T>& ctx, const T& gradOutput) const = 0;

    // Run forward on the inputs' values and record the result in their graph
    // with a History pointing back at this function, its context and the inputs.
    // Inputs must all belong to the same graph; bare numbers are promoted with
    // Graph::constant before reaching here. The function must be owned by a
    // shared_ptr (see instance()).
    Variable<T> apply(const std::vector<Variable<T>>& inputs) const;
};

// The shared instance of a stateless function type. Every History recorded
// through it references the same object.
template <typename Fn>
const std::shared_ptr<const Fn>& instance() {
    static const std::shared_ptr<const Fn> fn = std::make_shared<Fn>();
    return fn;
}

}  // namespace autograd
}  // namespace weft
