#pragma once
#include "logbeam/destination/destination_facade.hpp"
#include <atomic>

namespace logbeam {

/// Accepts every batch and drops it. Baseline for writer overhead.
class NullDestination : public DestinationFacade {
public:
    NullDestination() : m_sent(0) {}

    DestinationKind kind() const override { return DestinationKind::SequencedStream; }
    bool ensureDestinationAvailable() override { return true; }
    size_t effectiveSize(const LogMessage& message) const override { return message.size() + 26; }
    size_t maxMessageSize() const override { return 262144 - 26; }
    bool withinServiceLimits(size_t bytes, size_t count) const override {
        return bytes <= 1048576 && count <= 10000;
    }
    std::vector<LogMessage> send(const std::vector<LogMessage>& batch) override {
        m_sent.fetch_add(batch.size(), std::memory_order_relaxed);
        return std::vector<LogMessage>();
    }
    void shutdown() override {}

    size_t sent() const { return m_sent.load(std::memory_order_relaxed); }

private:
    std::atomic<size_t> m_sent;
};

} // namespace logbeam
