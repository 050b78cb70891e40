// cloudwatch_writer.cpp
//
// Demonstrates a LogWriter sending to CloudWatch Logs through a
// CloudWatchClient. A real program plugs in an adapter over its AWS SDK;
// here a console client prints each PutLogEvents call instead.
//
// Compile: g++ -std=c++11 -I include examples/cloudwatch_writer.cpp -o cloudwatch_writer -pthread

#include "logbeam.hpp"
#include <iostream>
#include <string>

// ---------------------------------------------------------------
// A client that pretends the group and stream already exist
// ---------------------------------------------------------------
class ConsoleCloudWatchClient : public logbeam::CloudWatchClient {
public:
    ConsoleCloudWatchClient() : m_next(0) {}

    std::string findLogGroup(const std::string& name) override {
        return "arn:example:log-group:" + name;
    }
    bool createLogGroup(const std::string&) override { return false; }
    void setLogGroupRetention(const std::string&, int) override {}
    bool createLogStream(const std::string&, const std::string&) override { return false; }

    bool retrieveSequenceToken(const std::string&, const std::string&, std::string& token) override {
        token = currentToken();
        return true;
    }

    std::string putLogEvents(const std::string& group, const std::string& stream,
                             const std::string& token,
                             const std::vector<logbeam::LogMessage>& events) override {
        std::cout << "=== PutLogEvents " << group << "/" << stream
                  << " (" << events.size() << " events, token " << token << ") ===" << std::endl;
        for (size_t i = 0; i < events.size(); ++i) {
            std::cout << "  " << logbeam::detail::formatTimestamp(events[i].timestamp())
                      << " " << events[i].body() << std::endl;
        }
        ++m_next;
        return currentToken();
    }

    void shutdown() override {
        std::cout << "(client shut down)" << std::endl;
    }

private:
    std::string currentToken() const { return "seq-" + std::to_string(m_next); }

    int m_next;
};

int main() {
    logbeam::CloudWatchWriterConfig config;
    config.setLogGroupName("example-app")
          .setLogStreamName("instance-1")
          .setDedicatedWriter(true)
          .setBatchDelay(200)
          .setUseShutdownHook(true);

    std::shared_ptr<logbeam::InternalLogger> diagnostics =
        std::make_shared<logbeam::StderrInternalLogger>("example", true);

    std::unique_ptr<logbeam::CloudWatchClient> client(new ConsoleCloudWatchClient());
    std::unique_ptr<logbeam::LogWriter> writer =
        logbeam::makeCloudWatchWriter(config, std::move(client), diagnostics);

    writer->start();
    if (!writer->waitUntilInitialized(5000) || writer->state() == logbeam::WriterState::FAILED) {
        std::cerr << "writer failed to start" << std::endl;
        return 1;
    }

    for (int i = 0; i < 5; ++i) {
        writer->addMessage(logbeam::LogMessage(logbeam::detail::currentTimeMillis(),
                                               "request " + std::to_string(i) + " handled"));
    }

    writer->stop();
    writer->waitUntilStopped(5000);

    std::cout << writer->statistics().toJson().dump(2) << std::endl;
    return 0;
}
