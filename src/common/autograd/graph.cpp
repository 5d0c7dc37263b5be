#include "weft/autograd/graph.h"

#include <format>

#include "weft/autograd/engine.h"
#include "weft/autograd/no_grad.h"
#include "weft/check.h"

namespace weft {
namespace autograd {

// ============================================================================
// Graph
// ============================================================================

template <typename T>
Variable<T> Graph<T>::leaf(T value) {
    return append(Node<T>{std::move(value), std::nullopt, std::nullopt, true});
}

template <typename T>
Variable<T> Graph<T>::constant(T value) {
    return append(Node<T>{std::move(value), std::nullopt, std::nullopt, false});
}

template <typename T>
Variable<T> Graph<T>::record(T value, History<T> history) {
    WEFT_CHECK(history.function != nullptr, "History must reference a function");
    for (NodeId input : history.inputs) {
        WEFT_CHECK(input < mNodes.size(),
                   std::format("History input {} does not exist in a graph of {} nodes", input,
                               mNodes.size()));
    }
    return append(Node<T>{std::move(value), std::move(history), std::nullopt, true});
}

template <typename T>
Variable<T> Graph<T>::append(Node<T> node) {
    mNodes.push_back(std::move(node));
    return Variable<T>(this, mNodes.size() - 1);
}

template <typename T>
const Node<T>& Graph<T>::node(NodeId id) const {
    WEFT_CHECK(id < mNodes.size(),
               std::format("Node {} does not exist in a graph of {} nodes", id, mNodes.size()));
    return mNodes[id];
}

template <typename T>
Node<T>& Graph<T>::node(NodeId id) {
    WEFT_CHECK(id < mNodes.size(),
               std::format("Node {} does not exist in a graph of {} nodes", id, mNodes.size()));
    return mNodes[id];
}

template <typename T>
void Graph<T>::zeroGrad() {
    for (auto& node : mNodes) {
        node.grad.reset();
    }
}

// ============================================================================
// Variable
// ============================================================================

template <typename T>
std::vector<Variable<T>> Variable<T>::parents() const {
    std::vector<Variable<T>> out;
    if (const auto& h = history()) {
        for (NodeId input : h->inputs) {
            out.emplace_back(mGraph, input);
        }
    }
    return out;
}

template <typename T>
void Variable<T>::backward() const {
    backward(seedGradient(value()));
}

template <typename T>
void Variable<T>::backward(const T& gradOutput) const {
    Engine<T>::backward(*mGraph, mId, gradOutput);
}

// ============================================================================
// Function::apply
// ============================================================================

template <typename T>
Variable<T> Function<T>::apply(const std::vector<Variable<T>>& inputs) const {
    WEFT_CHECK(inputs.size() == numInputs(),
               std::format("{} expects {} inputs, got {}", name(), numInputs(), inputs.size()));
    WEFT_CHECK(!inputs.empty(), name() + " must take at least one input");

    Graph<T>& graph = inputs.front().graph();

    std::vector<T> raw_values;
    std::vector<NodeId> ids;
    raw_values.reserve(inputs.size());
    ids.reserve(inputs.size());
    for (const auto& input : inputs) {
        WEFT_CHECK(&input.graph() == &graph, name() + ": inputs belong to different graphs");
        raw_values.push_back(input.value());
        ids.push_back(input.id());
    }

    const bool no_grad = NoGradMode::isEnabled();
    Context<T> ctx(no_grad);
    T result = forward(ctx, raw_values);

    if (no_grad) {
        return graph.constant(std::move(result));
    }
    return graph.record(std::move(result),
                        History<T>{this->shared_from_this(), std::move(ctx), std::move(ids)});
}

template class Function<double>;
template class Function<TensorData>;
template class Graph<double>;
template class Graph<TensorData>;
template class Variable<double>;
template class Variable<TensorData>;

}  // namespace autograd
}  // namespace weft
