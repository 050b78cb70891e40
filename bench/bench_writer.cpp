#include <benchmark/benchmark.h>
#include <memory>
#include <string>
#include "logbeam.hpp"
#include "null_destination.hpp"

// ---------------------------------------------------------------------------
// BM_Writer_AddMessage
// Producer-side cost of addMessage() with a running writer thread.
// ---------------------------------------------------------------------------
static void BM_Writer_AddMessage(benchmark::State& state) {
    logbeam::WriterConfig config;
    config.batchDelayMs_ = 10;
    config.discardThreshold_ = 1000000;
    std::shared_ptr<logbeam::InternalLogger> quiet = std::make_shared<logbeam::StderrInternalLogger>();

    logbeam::LogWriter writer(config, logbeam::detail::make_unique<logbeam::NullDestination>(), quiet);
    writer.start();
    writer.waitUntilInitialized(1000);

    const std::string body(static_cast<size_t>(state.range(0)), 'x');
    for (auto _ : state) {
        writer.addMessage(logbeam::LogMessage(0, body));
    }
    writer.stop();
    writer.waitUntilStopped(5000);
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Writer_AddMessage)->Arg(100)->Arg(4096);

// ---------------------------------------------------------------------------
// BM_Writer_Synchronous
// Synchronous mode: every addMessage() builds and sends a one-message batch.
// ---------------------------------------------------------------------------
static void BM_Writer_Synchronous(benchmark::State& state) {
    logbeam::WriterConfig config;
    config.synchronousMode_ = true;
    std::shared_ptr<logbeam::InternalLogger> quiet = std::make_shared<logbeam::StderrInternalLogger>();

    logbeam::LogWriter writer(config, logbeam::detail::make_unique<logbeam::NullDestination>(), quiet);
    writer.start();

    for (auto _ : state) {
        writer.addMessage(logbeam::LogMessage(0, "synchronous message"));
    }
    writer.stop();
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Writer_Synchronous);

BENCHMARK_MAIN();
