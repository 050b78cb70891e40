#include "test_utils.hpp"
#include <thread>
#include <chrono>
#include <stdexcept>

using namespace logbeam;

void CapturingInternalLogger::debug(const std::string& message) {
    record(InternalLogLevel::DEBUG, message, nullptr);
}

void CapturingInternalLogger::warn(const std::string& message) {
    record(InternalLogLevel::WARN, message, nullptr);
}

void CapturingInternalLogger::error(const std::string& message, std::exception_ptr error) {
    record(InternalLogLevel::ERROR, message, error);
}

void CapturingInternalLogger::record(InternalLogLevel level, const std::string& message,
                                     std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Entry entry;
    entry.level = level;
    entry.message = message;
    entry.error = error;
    m_entries.push_back(entry);
}

std::vector<std::string> CapturingInternalLogger::messages(InternalLogLevel level) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<std::string> result;
    for (size_t i = 0; i < m_entries.size(); ++i) {
        if (m_entries[i].level == level) result.push_back(m_entries[i].message);
    }
    return result;
}

std::vector<CapturingInternalLogger::Entry> CapturingInternalLogger::entries() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries;
}

bool CapturingInternalLogger::contains(InternalLogLevel level, const std::string& fragment) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (size_t i = 0; i < m_entries.size(); ++i) {
        if (m_entries[i].level == level && m_entries[i].message.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

size_t CapturingInternalLogger::count(InternalLogLevel level) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t n = 0;
    for (size_t i = 0; i < m_entries.size(); ++i) {
        if (m_entries[i].level == level) ++n;
    }
    return n;
}

TestableLogWriter::TestableLogWriter(const WriterConfig& config,
                                     std::unique_ptr<DestinationFacade> destination,
                                     std::shared_ptr<InternalLogger> logger)
    : LogWriter(config, std::move(destination), logger)
    , m_permits(0)
    , m_completed(0)
    , m_released(false) {}

TestableLogWriter::~TestableLogWriter() noexcept {
    releaseWriterThread();
    stopAndJoin();
}

void TestableLogWriter::waitForWriterThread(std::int64_t timeoutMs) {
    std::unique_lock<std::mutex> lock(m_gateMutex);
    const size_t target = m_completed + 1;
    ++m_permits;
    m_gateCV.notify_all();
    if (!m_gateCV.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                           [&] { return m_completed >= target; })) {
        throw std::runtime_error("timed out waiting for writer thread");
    }
}

void TestableLogWriter::releaseWriterThread() {
    std::lock_guard<std::mutex> lock(m_gateMutex);
    m_released = true;
    m_gateCV.notify_all();
}

size_t TestableLogWriter::completedBatches() const {
    std::lock_guard<std::mutex> lock(m_gateMutex);
    return m_completed;
}

void TestableLogWriter::processBatch(std::int64_t waitUntil) {
    {
        std::unique_lock<std::mutex> lock(m_gateMutex);
        m_gateCV.wait(lock, [this] { return m_released || m_permits > 0; });
        if (!m_released) --m_permits;
    }

    LogWriter::processBatch(waitUntil);

    std::lock_guard<std::mutex> lock(m_gateMutex);
    ++m_completed;
    m_gateCV.notify_all();
}

std::vector<LogMessage> TestUtils::makeMessages(size_t count, const std::string& prefix) {
    std::vector<LogMessage> result;
    result.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        result.push_back(LogMessage(detail::currentTimeMillis(), prefix + std::to_string(i)));
    }
    return result;
}

LogMessage TestUtils::makeMessage(const std::string& body) {
    return LogMessage(detail::currentTimeMillis(), body);
}

RetryManager::Sleeper TestUtils::noSleep() {
    return [](std::int64_t) {};
}

bool TestUtils::waitFor(const std::function<bool()>& condition, std::int64_t timeoutMs) {
    const std::int64_t deadline = detail::monotonicMillis() + timeoutMs;
    while (!condition()) {
        if (detail::monotonicMillis() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

std::exception_ptr TestUtils::facadeError(ReasonCode reason, const std::string& operation) {
    return std::make_exception_ptr(
        FacadeException(reason, operation, std::string("simulated ") + getReasonCodeString(reason)));
}
