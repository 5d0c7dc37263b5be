/**
 * Indexing and Backpropagation Benchmarks
 *
 * - toIndex / indexToPosition: per-coordinate cost of strided access
 * - broadcastIndex: projection cost inside zip
 * - zip / sumTo: full broadcast kernels
 * - Scalar backward: engine overhead on a long chain
 */

#include <vector>

#include "weft/autograd/scalar_functions.h"
#include "weft/tensor/indexing.h"
#include "weft/tensor/tensor_ops.h"
#include <benchmark/benchmark.h>

using namespace weft;

// ============================================================================
// Index Math
// ============================================================================

static void BM_ToIndex(benchmark::State& state) {
    const Shape shape{8, 16, 32};
    const Strides strides = stridesFromShape(shape);
    const size_t size = shapeSize(shape);
    Index index;

    for (auto _ : state) {
        for (size_t ordinal = 0; ordinal < size; ++ordinal) {
            toIndex(ordinal, shape, index);
            size_t position = indexToPosition(index, strides);
            benchmark::DoNotOptimize(position);
        }
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(size));
}
BENCHMARK(BM_ToIndex);

static void BM_BroadcastIndex(benchmark::State& state) {
    const Shape big{8, 16, 32};
    const Shape small{16, 1};
    Index big_index;
    Index small_index;
    toIndex(1234, big, big_index);

    for (auto _ : state) {
        broadcastIndex(big_index, big, small, small_index);
        benchmark::DoNotOptimize(small_index.data());
    }
}
BENCHMARK(BM_BroadcastIndex);

// ============================================================================
// Kernels
// ============================================================================

static void BM_ZipBroadcast(benchmark::State& state) {
    const auto n = static_cast<size_t>(state.range(0));
    TensorData column = ops::ones({n, 1});
    TensorData row = ops::ones({n});

    for (auto _ : state) {
        TensorData out = ops::zip(column, row, [](double a, double b) { return a + b; });
        benchmark::DoNotOptimize(out.storage().data());
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(n * n));
}
BENCHMARK(BM_ZipBroadcast)->Arg(16)->Arg(64)->Arg(256);

static void BM_SumTo(benchmark::State& state) {
    const auto n = static_cast<size_t>(state.range(0));
    TensorData grad = ops::ones({n, n});

    for (auto _ : state) {
        TensorData out = ops::sumTo(grad, {n});
        benchmark::DoNotOptimize(out.storage().data());
    }
}
BENCHMARK(BM_SumTo)->Arg(16)->Arg(64)->Arg(256);

// ============================================================================
// Backpropagation
// ============================================================================

static void BM_ScalarChainBackward(benchmark::State& state) {
    const auto depth = static_cast<int>(state.range(0));

    for (auto _ : state) {
        autograd::Graph<double> graph;
        autograd::Scalar x = graph.leaf(0.5);
        autograd::Scalar y = x;
        for (int i = 0; i < depth; ++i) {
            y = autograd::sigmoid(y * x + 1.0);
        }
        y.backward();
        double grad = x.grad().value_or(0.0);
        benchmark::DoNotOptimize(grad);
    }
}
BENCHMARK(BM_ScalarChainBackward)->Arg(10)->Arg(100)->Arg(1000);
