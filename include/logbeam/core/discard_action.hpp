#ifndef LOGBEAM_DISCARD_ACTION_HPP
#define LOGBEAM_DISCARD_ACTION_HPP

#include <string>
#include <stdexcept>

namespace logbeam {

    /// Policy applied by MessageQueue when a message arrives at capacity.
    enum class DiscardAction {
        None,    ///< Drop the incoming message and count the overflow
        Oldest,  ///< Drop the head of the queue to make room
        Newest   ///< Drop the incoming message
    };

    inline const char* getDiscardActionString(DiscardAction action) {
        switch (action) {
            case DiscardAction::None: return "none";
            case DiscardAction::Oldest: return "oldest";
            case DiscardAction::Newest: return "newest";
            default: return "unknown";
        }
    }

    /// Parses the lower-case names produced by getDiscardActionString().
    /// @throws std::invalid_argument for anything else
    inline DiscardAction parseDiscardAction(const std::string& value) {
        if (value == "none") return DiscardAction::None;
        if (value == "oldest") return DiscardAction::Oldest;
        if (value == "newest") return DiscardAction::Newest;
        throw std::invalid_argument("invalid discard action: " + value);
    }

} // namespace logbeam

#endif // LOGBEAM_DISCARD_ACTION_HPP
