#include "weft/autograd/engine.h"

#include <algorithm>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include "weft/check.h"
#include "weft/logger.h"
#include "weft/tensor/tensor_ops.h"

namespace weft {
namespace autograd {

double seedGradient(double) {
    return 1.0;
}

TensorData seedGradient(const TensorData& output) {
    return ops::ones(output.shape());
}

double accumulateGradient(double current, double contribution) {
    return current + contribution;
}

TensorData accumulateGradient(const TensorData& current, const TensorData& contribution) {
    WEFT_CHECK(current.shape() == contribution.shape(),
               "Gradient shape " + toString(contribution.shape()) +
                   " does not match accumulated shape " + toString(current.shape()));
    return ops::zip(current, contribution, [](double a, double b) { return a + b; });
}

double ownedGradient(double gradient) {
    return gradient;
}

TensorData ownedGradient(const TensorData& gradient) {
    return TensorData(gradient.storage().clone(), gradient.shape(), gradient.strides());
}

void checkSeed(double, double) {}

void checkSeed(const TensorData& output, const TensorData& seed) {
    WEFT_CHECK(seed.shape() == output.shape(),
               "Seed gradient shape " + toString(seed.shape()) + " does not match output shape " +
                   toString(output.shape()));
}

template <typename T>
void Engine<T>::backward(Graph<T>& graph, NodeId root, const T& gradOutput) {
    auto& logger = Logger::getInstance("Autograd");

    if (graph.node(root).isConstant()) {
        throw std::runtime_error("node " + std::to_string(root) +
                                 " is a constant and does not require grad");
    }
    checkSeed(graph.node(root).value, gradOutput);

    std::vector<NodeId> sorted = topologicalSort(graph, root);
    logger.debug("Topological sort completed {} nodes", sorted.size());

    // Pending gradient per node, filled in by its consumers
    std::unordered_map<NodeId, T> grads;
    grads.emplace(root, gradOutput);

    for (NodeId id : sorted) {
        auto it = grads.find(id);
        if (it == grads.end()) {
            continue;
        }
        const T grad_output = std::move(it->second);
        grads.erase(it);

        Node<T>& node = graph.node(id);

        // Leaf: final gradient, nothing further to propagate
        if (node.isLeaf()) {
            node.grad = node.grad ? accumulateGradient(*node.grad, grad_output)
                                  : ownedGradient(grad_output);
            continue;
        }

        const History<T>& history = *node.history;
        std::vector<T> grad_inputs = history.function->backward(history.context, grad_output);
        WEFT_CHECK(grad_inputs.size() == history.inputs.size(),
                   history.function->name() + " returned " + std::to_string(grad_inputs.size()) +
                       " gradients for " + std::to_string(history.inputs.size()) + " inputs");

        for (size_t i = 0; i < grad_inputs.size(); ++i) {
            const NodeId input = history.inputs[i];
            if (graph.node(input).isConstant()) {
                continue;
            }

            auto pending = grads.find(input);
            if (pending == grads.end()) {
                grads.emplace(input, std::move(grad_inputs[i]));
            } else {
                // Multiple paths lead to this node - accumulate
                pending->second = accumulateGradient(pending->second, grad_inputs[i]);
            }
        }
    }

    logger.debug("Backward pass completed from node {}", root);
}

template <typename T>
std::vector<NodeId> Engine<T>::topologicalSort(const Graph<T>& graph, NodeId root) {
    std::vector<NodeId> sorted;
    if (graph.node(root).isConstant()) {
        return sorted;
    }

    std::vector<bool> visited(graph.size(), false);

    // Iterative DFS: each frame is (node, index of the next input to visit)
    std::vector<std::pair<NodeId, size_t>> stack;
    stack.emplace_back(root, 0);
    visited[root] = true;

    while (!stack.empty()) {
        const NodeId id = stack.back().first;
        const size_t next = stack.back().second;
        const Node<T>& node = graph.node(id);
        const size_t num_inputs = node.history ? node.history->inputs.size() : 0;

        if (next < num_inputs) {
            ++stack.back().second;
            const NodeId input = node.history->inputs[next];
            if (!visited[input] && !graph.node(input).isConstant()) {
                visited[input] = true;
                stack.emplace_back(input, 0);
            }
            continue;
        }

        // All inputs emitted: post-order position of this node
        sorted.push_back(id);
        stack.pop_back();
    }

    // Post-order puts inputs first; consumers must come first
    std::reverse(sorted.begin(), sorted.end());
    return sorted;
}

template class Engine<double>;
template class Engine<TensorData>;

}  // namespace autograd
}  // namespace weft
