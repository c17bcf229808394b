#include "echo_suppressor.hpp"

#include "util.hpp"

EchoSuppressor::EchoSuppressor(std::chrono::milliseconds window, Clock clock)
    : m_window(window), m_clock(std::move(clock))
{
    if (!m_clock)
        m_clock = [] { return std::chrono::steady_clock::now(); };
}

void EchoSuppressor::Expect(const clip_content_t& content)
{
    std::lock_guard lk(m_mtx);
    m_armed     = true;
    m_has_last  = true;
    m_last_kind = content.kind;
    m_last_hash = fnv1a64(content.data);
    m_deadline  = m_clock() + m_window;
}

void EchoSuppressor::Cancel()
{
    std::lock_guard lk(m_mtx);
    m_armed    = false;
    m_has_last = false;
}

bool EchoSuppressor::ShouldSuppress(const clip_content_t& content)
{
    std::lock_guard lk(m_mtx);
    if (!m_has_last)
        return false;

    if (m_clock() > m_deadline)
    {
        if (m_armed)
            debug("echo suppression expired without a notification");
        m_armed    = false;
        m_has_last = false;
        return false;
    }

    if (m_armed)
    {
        m_armed = false;
        return true;
    }

    return content.kind == m_last_kind && fnv1a64(content.data) == m_last_hash;
}

bool EchoSuppressor::IsArmed() const
{
    std::lock_guard lk(m_mtx);
    return m_armed && m_clock() <= m_deadline;
}
