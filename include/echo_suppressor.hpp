#ifndef _ECHO_SUPPRESSOR_HPP_
#define _ECHO_SUPPRESSOR_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

#include "history_entry.hpp"

/*
 * Tells the clipboard watcher which change notification is the echo of
 * our own paste, so a pasted entry isn't captured again.
 *
 * Expect() arms a one-shot flag right before the paste engine writes the
 * clipboard. The first notification after that consumes it.
 * The flag expires after the window, so a lost notification can't eat
 * the user's next real copy.
 * As a fallback, content with the same hash as the last write is also
 * suppressed while the window is open (some owners notify twice).
 */
class EchoSuppressor
{
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    explicit EchoSuppressor(std::chrono::milliseconds window, Clock clock = nullptr);

    void Expect(const clip_content_t& content);

    // The write failed, nothing to suppress
    void Cancel();

    bool ShouldSuppress(const clip_content_t& content);

    bool IsArmed() const;

private:
    mutable std::mutex                    m_mtx;
    std::chrono::milliseconds             m_window;
    Clock                                 m_clock;
    bool                                  m_armed = false;
    bool                                  m_has_last = false;
    EntryKind                             m_last_kind = EntryKind::Text;
    uint64_t                              m_last_hash = 0;
    std::chrono::steady_clock::time_point m_deadline;
};

#endif  // !_ECHO_SUPPRESSOR_HPP_
