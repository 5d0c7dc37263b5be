#pragma once

#include <deque>
#include <optional>
#include <vector>

#include "weft/autograd/function.h"
#include "weft/tensor/tensor_data.h"

namespace weft {
namespace autograd {

// ============================================================================
// Node
// ============================================================================

// One value in the computation graph.
//   leaf      - no History, requiresGrad: gradients accumulate here
//   constant  - no History, no gradient (promoted numbers, no-grad results)
//   computed  - has History: gradients are routed to its inputs
template <typename T>
struct Node {
    T value;
    std::optional<History<T>> history;
    std::optional<T> grad;
    bool requiresGrad = true;

    [[nodiscard]] bool isLeaf() const { return !history.has_value(); }
    [[nodiscard]] bool isConstant() const { return isLeaf() && !requiresGrad; }
};

// ============================================================================
// Graph
// ============================================================================

// Graph: append-only arena owning every node. Nodes are addressed by NodeId and
// never move, so ids and references stay valid for the graph's lifetime.
// Variables hold a non-owning pointer to their graph; the graph must outlive them.
template <typename T>
class Graph {
  public:
    Graph() = default;
    ~Graph() = default;

    Graph(const Graph&) = delete;
    Graph& operator=(const Graph&) = delete;
    Graph(Graph&&) = delete;
    Graph& operator=(Graph&&) = delete;

    // Value that receives a gradient during backpropagation
    Variable<T> leaf(T value);

    // Value that never receives a gradient. Used to wrap bare numbers.
    Variable<T> constant(T value);

    // Computed value. Every input id must already exist in this graph.
    Variable<T> record(T value, History<T> history);

    [[nodiscard]] const Node<T>& node(NodeId id) const;
    [[nodiscard]] Node<T>& node(NodeId id);

    [[nodiscard]] size_t size() const { return mNodes.size(); }

    // Clear every accumulated gradient
    void zeroGrad();

  private:
    Variable<T> append(Node<T> node);

    std::deque<Node<T>> mNodes;
};

// ============================================================================
// Variable
// ============================================================================

// Lightweight handle to a node: cheap to copy, compares by identity
template <typename T>
class Variable {
  public:
    Variable(Graph<T>* graph, NodeId id) : mGraph(graph), mId(id) {}

    [[nodiscard]] const T& value() const { return mGraph->node(mId).value; }

    // Accumulated gradient; empty until a backward pass reaches this leaf
    [[nodiscard]] const std::optional<T>& grad() const { return mGraph->node(mId).grad; }

    [[nodiscard]] const std::optional<History<T>>& history() const {
        return mGraph->node(mId).history;
    }

    [[nodiscard]] bool isLeaf() const { return mGraph->node(mId).isLeaf(); }
    [[nodiscard]] bool isConstant() const { return mGraph->node(mId).isConstant(); }
    [[nodiscard]] bool requiresGrad() const { return mGraph->node(mId).requiresGrad; }

    // Inputs recorded in this value's History (empty for leaves and constants)
    [[nodiscard]] std::vector<Variable<T>> parents() const;

    [[nodiscard]] NodeId id() const { return mId; }
    [[nodiscard]] Graph<T>& graph() const { return *mGraph; }

    // Backpropagate from this value. Without an argument the seed is 1 for a
    // scalar and a tensor of ones shaped like value() for a tensor.
    void backward() const;
    void backward(const T& gradOutput) const;

    friend bool operator==(const Variable& a, const Variable& b) {
        return a.mGraph == b.mGraph && a.mId == b.mId;
    }
    friend bool operator!=(const Variable& a, const Variable& b) { return !(a == b); }

  private:
    Graph<T>* mGraph;
    NodeId mId;
};

using Scalar = Variable<double>;
using Tensor = Variable<TensorData>;

extern template class Function<double>;
extern template class Function<TensorData>;
extern template class Graph<double>;
extern template class Graph<TensorData>;
extern template class Variable<double>;
extern template class Variable<TensorData>;

}  // namespace autograd
}  // namespace weft
