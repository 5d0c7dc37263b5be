#pragma once

#include <vector>

#include "weft/autograd/graph.h"
#include "weft/tensor/tensor_data.h"

namespace weft {
namespace autograd {

// ============================================================================
// Gradient arithmetic per value type
// ============================================================================

// Default seed for backpropagating from `output`: 1, or ones shaped like output
[[nodiscard]] double seedGradient(double output);
[[nodiscard]] TensorData seedGradient(const TensorData& output);

// Sum of two contributions to the same node. Tensor contributions must have
// identical shapes (InvariantError otherwise).
[[nodiscard]] double accumulateGradient(double current, double contribution);
[[nodiscard]] TensorData accumulateGradient(const TensorData& current,
                                            const TensorData& contribution);

// Gradient stored in a leaf's slot: tensors get their own buffer, detached from
// the seed and from every other leaf's gradient
[[nodiscard]] double ownedGradient(double gradient);
[[nodiscard]] TensorData ownedGradient(const TensorData& gradient);

// A tensor seed must have exactly the output's shape (InvariantError otherwise)
void checkSeed(double output, double seed);
void checkSeed(const TensorData& output, const TensorData& seed);

// ============================================================================
// Engine
// ============================================================================

// Engine: reverse-mode backpropagation over a Graph arena
template <typename T>
class Engine {
  public:
    // Execute the backward pass rooted at `root`
    // gradOutput: gradient of the final quantity w.r.t. root
    // Every computed node runs its backward exactly once, after all of its
    // consumers have contributed; leaves add the total into their grad slot.
    // Throws std::runtime_error if root is a constant and InvariantError if the
    // seed's shape differs from root's. Any exception raised by a backward
    // aborts the whole pass.
    static void backward(Graph<T>& graph, NodeId root, const T& gradOutput);

    // Nodes reachable from root through History inputs, constants excluded,
    // ordered so every node comes after all of its consumers (root first)
    // Depth-first with an explicit stack, so graph depth is not bounded by the call stack.
    [[nodiscard]] static std::vector<NodeId> topologicalSort(const Graph<T>& graph, NodeId root);
};

extern template class Engine<double>;
extern template class Engine<TensorData>;

}  // namespace autograd
}  // namespace weft
