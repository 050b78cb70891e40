#ifndef LOGBEAM_SHUTDOWN_HOOKS_HPP
#define LOGBEAM_SHUTDOWN_HOOKS_HPP

#include <functional>
#include <mutex>
#include <vector>
#include <utility>
#include <cstdlib>
#include <cstddef>

namespace logbeam {

    /// Process-wide list of callbacks run once at normal process exit.
    ///
    /// Writers configured with useShutdownHook register here so that queued
    /// messages are flushed when main() returns or exit() is called. The
    /// std::atexit handler is installed on the first add(); since the
    /// registry is constructed before that, it is still alive when the
    /// handler runs.
    ///
    /// Hooks run outside the lock, so a hook may call remove() (a writer
    /// unregistering itself as it stops).
    class ShutdownHooks {
    public:
        using Hook = std::function<void()>;

        static ShutdownHooks& instance() {
            static ShutdownHooks hooks;
            return hooks;
        }

        /// Registers a hook; returns an id for remove() and run().
        size_t add(Hook hook) {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_installed) {
                m_installed = (std::atexit(&ShutdownHooks::onExit) == 0);
            }
            size_t id = ++m_nextId;
            m_hooks.push_back(std::make_pair(id, std::move(hook)));
            return id;
        }

        /// Returns false if the hook was not registered (or already ran).
        bool remove(size_t id) {
            Hook removed;
            return take(id, removed);
        }

        bool contains(size_t id) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (size_t i = 0; i < m_hooks.size(); ++i) {
                if (m_hooks[i].first == id) return true;
            }
            return false;
        }

        size_t size() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_hooks.size();
        }

        /// Unregisters and runs one hook, as process exit would.
        bool run(size_t id) {
            Hook hook;
            if (!take(id, hook)) return false;
            hook();
            return true;
        }

        /// Unregisters and runs every hook, in registration order.
        void runAll() {
            std::vector<std::pair<size_t, Hook> > hooks;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                hooks.swap(m_hooks);
            }
            for (size_t i = 0; i < hooks.size(); ++i) {
                hooks[i].second();
            }
        }

    private:
        ShutdownHooks()
            : m_nextId(0)
            , m_installed(false) {}

        ShutdownHooks(const ShutdownHooks&) = delete;
        ShutdownHooks& operator=(const ShutdownHooks&) = delete;

        static void onExit() {
            instance().runAll();
        }

        bool take(size_t id, Hook& out) {
            std::lock_guard<std::mutex> lock(m_mutex);
            for (size_t i = 0; i < m_hooks.size(); ++i) {
                if (m_hooks[i].first == id) {
                    out = std::move(m_hooks[i].second);
                    m_hooks.erase(m_hooks.begin() + static_cast<std::ptrdiff_t>(i));
                    return true;
                }
            }
            return false;
        }

        mutable std::mutex m_mutex;
        std::vector<std::pair<size_t, Hook> > m_hooks;
        size_t m_nextId;
        bool m_installed;
    };

} // namespace logbeam

#endif // LOGBEAM_SHUTDOWN_HOOKS_HPP
