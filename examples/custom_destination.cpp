// custom_destination.cpp
//
// Demonstrates implementing DestinationFacade directly. The destination
// below appends each batch to a local file and claims a small batch
// limit, so the writer splits the input into several batches.
//
// Compile: g++ -std=c++11 -I include examples/custom_destination.cpp -o custom_destination -pthread

#include "logbeam.hpp"
#include <fstream>
#include <iostream>
#include <string>

class FileDestination : public logbeam::DestinationFacade {
public:
    explicit FileDestination(const std::string& path) : m_path(path) {}

    logbeam::DestinationKind kind() const override { return logbeam::DestinationKind::SequencedStream; }

    bool ensureDestinationAvailable() override {
        m_out.open(m_path.c_str(), std::ios::app);
        if (!m_out.is_open()) {
            reportError("cannot open " + m_path, nullptr);
            return false;
        }
        stats().setDestinationName("path", m_path);
        return true;
    }

    size_t effectiveSize(const logbeam::LogMessage& message) const override { return message.size() + 1; }
    size_t maxMessageSize() const override { return 4096; }

    bool withinServiceLimits(size_t bytes, size_t count) const override {
        return bytes <= 65536 && count <= 4;
    }

    std::vector<logbeam::LogMessage> send(const std::vector<logbeam::LogMessage>& batch) override {
        for (size_t i = 0; i < batch.size(); ++i) {
            m_out << batch[i].body() << '\n';
        }
        m_out.flush();
        if (!m_out) {
            throw logbeam::FacadeException(logbeam::ReasonCode::UNEXPECTED_EXCEPTION, "write",
                                           "write to " + m_path + " failed");
        }
        std::cout << "wrote batch of " << batch.size() << std::endl;
        return std::vector<logbeam::LogMessage>();
    }

    void shutdown() override {
        if (m_out.is_open()) m_out.close();
    }

private:
    std::string m_path;
    std::ofstream m_out;
};

int main() {
    logbeam::WriterConfig config;
    config.batchDelayMs_ = 100;

    logbeam::LogWriter writer(config,
                              logbeam::detail::make_unique<FileDestination>("custom_destination.log"));
    writer.start();

    for (int i = 0; i < 10; ++i) {
        writer.addMessage(logbeam::LogMessage(logbeam::detail::currentTimeMillis(),
                                              "line " + std::to_string(i)));
    }

    writer.stop();
    writer.waitUntilStopped(5000);

    std::cout << "batches: " << writer.batchCount()
              << ", sent: " << writer.statistics().messagesSent() << std::endl;
    return 0;
}
