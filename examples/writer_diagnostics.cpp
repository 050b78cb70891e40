// writer_diagnostics.cpp
//
// Demonstrates routing the writer's own diagnostics through a callback and
// reading its statistics. The Kinesis client here rejects every third
// record once, so the statistics show requeued messages.
//
// Compile: g++ -std=c++11 -I include examples/writer_diagnostics.cpp -o writer_diagnostics -pthread

#include "logbeam.hpp"
#include <iostream>
#include <mutex>
#include <string>

class FlakyKinesisClient : public logbeam::KinesisClient {
public:
    FlakyKinesisClient() : m_calls(0) {}

    logbeam::KinesisStreamStatus describeStreamStatus(const std::string&) override {
        return logbeam::KinesisStreamStatus::Active;
    }
    bool createStream(const std::string&, int) override { return false; }
    void setRetentionPeriod(const std::string&, int) override {}

    std::vector<size_t> putRecords(const std::string&,
                                   const std::vector<logbeam::KinesisRecord>& records) override {
        std::vector<size_t> rejected;
        if (m_calls++ == 0) {
            for (size_t i = 2; i < records.size(); i += 3) rejected.push_back(i);
        }
        return rejected;
    }

    void shutdown() override {}

private:
    int m_calls;
};

int main() {
    std::mutex printMutex;
    std::shared_ptr<logbeam::InternalLogger> diagnostics = std::make_shared<logbeam::CallbackInternalLogger>(
        [&printMutex](logbeam::InternalLogLevel level, const std::string& message, std::exception_ptr error) {
            std::lock_guard<std::mutex> lock(printMutex);
            std::cout << "[" << logbeam::getInternalLogLevelString(level) << "] " << message << std::endl;
            std::vector<std::string> chain = logbeam::detail::exceptionChain(error);
            for (size_t i = 0; i < chain.size(); ++i) {
                std::cout << "    " << chain[i] << std::endl;
            }
        });

    logbeam::KinesisWriterConfig config;
    config.setStreamName("example-stream")
          .setPartitionKey("{random}")
          .setBatchDelay(100);

    std::unique_ptr<logbeam::KinesisClient> client(new FlakyKinesisClient());
    std::unique_ptr<logbeam::LogWriter> writer =
        logbeam::makeKinesisWriter(config, std::move(client), diagnostics);

    writer->start();
    for (int i = 0; i < 9; ++i) {
        writer->addMessage(logbeam::LogMessage(logbeam::detail::currentTimeMillis(),
                                               "event " + std::to_string(i)));
    }
    writer->addMessage(logbeam::LogMessage(logbeam::detail::currentTimeMillis(), ""));

    writer->stop();
    writer->waitUntilStopped(5000);

    std::cout << writer->statistics().toJson().dump(2) << std::endl;
    return 0;
}
