#ifndef LOGBEAM_LOG_MESSAGE_HPP
#define LOGBEAM_LOG_MESSAGE_HPP

#include <string>
#include <cstdint>
#include <cstddef>

namespace logbeam {

    /// A single record destined for a remote log sink.
    ///
    /// The body is treated as UTF-8; size() is its length in bytes, which is
    /// what every backend limit is expressed in. Messages are immutable once
    /// constructed, and are ordered only by their position in the queue.
    class LogMessage {
    public:
        LogMessage()
            : m_timestamp(0) {}

        LogMessage(std::int64_t timestamp, std::string body)
            : m_timestamp(timestamp)
            , m_body(std::move(body)) {}

        std::int64_t timestamp() const { return m_timestamp; }
        const std::string& body() const { return m_body; }
        std::size_t size() const { return m_body.size(); }
        bool empty() const { return m_body.empty(); }

        /// Returns a copy whose body holds at most maxBytes bytes. The cut is
        /// moved back so that a multi-byte UTF-8 sequence is never split.
        LogMessage truncatedTo(std::size_t maxBytes) const {
            if (m_body.size() <= maxBytes) return *this;

            std::size_t cut = maxBytes;
            // back up over continuation bytes (10xxxxxx) to a lead byte
            while (cut > 0 && (static_cast<unsigned char>(m_body[cut]) & 0xC0) == 0x80) {
                --cut;
            }
            return LogMessage(m_timestamp, m_body.substr(0, cut));
        }

    private:
        std::int64_t m_timestamp;
        std::string m_body;
    };

} // namespace logbeam

#endif // LOGBEAM_LOG_MESSAGE_HPP
