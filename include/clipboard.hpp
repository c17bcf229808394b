#ifndef _CLIPBOARD_HPP_
#define _CLIPBOARD_HPP_

#include <string>

#include "history_entry.hpp"
#include "util.hpp"

class ClipboardBackend
{
public:
    virtual ~ClipboardBackend() = default;

    // ClipboardBusy when another client holds the clipboard,
    // UnsupportedFormat when it holds neither text nor a PNG image
    virtual Result<clip_content_t> Read() = 0;

    // ClipboardBusy when the clipboard couldn't be taken
    virtual Result<> Write(const clip_content_t& content) = 0;
};

// The real system clipboard: clip on X11, wl-copy/wl-paste on Wayland
class Clipboard : public ClipboardBackend
{
public:
    Clipboard(SessionType session) : m_session(session) {}

    Result<clip_content_t> Read() override;
    Result<>               Write(const clip_content_t& content) override;

private:
    SessionType m_session;

    Result<> CopyText(const std::string& text);
    Result<> CopyImage(const std::string& png);

    Result<clip_content_t> ReadX11();
    Result<clip_content_t> ReadWayland();
};

#endif  // !_CLIPBOARD_HPP_
