#include <benchmark/benchmark.h>
#include <string>
#include "logbeam.hpp"

// ---------------------------------------------------------------------------
// BM_Queue_EnqueueDequeue
// Single-threaded round trip through the bounded queue.
// ---------------------------------------------------------------------------
static void BM_Queue_EnqueueDequeue(benchmark::State& state) {
    logbeam::MessageQueue queue(10000, logbeam::DiscardAction::Oldest);
    logbeam::LogMessage out;
    const std::string body(static_cast<size_t>(state.range(0)), 'x');

    for (auto _ : state) {
        queue.enqueue(logbeam::LogMessage(0, body));
        queue.dequeue(out, 0);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_Queue_EnqueueDequeue)->Arg(64)->Arg(1024)->Arg(16384);

// ---------------------------------------------------------------------------
// BM_Queue_DiscardOldest
// Enqueue into a full queue; every call evicts the head.
// ---------------------------------------------------------------------------
static void BM_Queue_DiscardOldest(benchmark::State& state) {
    logbeam::MessageQueue queue(1000, logbeam::DiscardAction::Oldest);
    for (int i = 0; i < 1000; ++i) {
        queue.enqueue(logbeam::LogMessage(0, "fill"));
    }

    for (auto _ : state) {
        queue.enqueue(logbeam::LogMessage(0, "overflow"));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Queue_DiscardOldest);

// ---------------------------------------------------------------------------
// BM_Queue_ConcurrentProducers
// Producers contend on the queue lock; thread 0 also drains.
// ---------------------------------------------------------------------------
static logbeam::MessageQueue g_sharedQueue(100000, logbeam::DiscardAction::Oldest);

static void BM_Queue_ConcurrentProducers(benchmark::State& state) {
    logbeam::LogMessage out;
    for (auto _ : state) {
        g_sharedQueue.enqueue(logbeam::LogMessage(0, "concurrent message"));
        if (state.thread_index() == 0) {
            g_sharedQueue.dequeue(out, 0);
        }
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Queue_ConcurrentProducers)->Threads(1)->Threads(4)->Threads(8);

BENCHMARK_MAIN();
