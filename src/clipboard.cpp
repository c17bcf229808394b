#include "clipboard.hpp"

#include <cstdint>

#include "clip.h"
#include "tiny-process-library/process.hpp"

static constexpr std::string_view PNG_MIME = "image/png";

static clip::format png_format()
{
    static const clip::format fmt = clip::register_format(std::string(PNG_MIME));
    return fmt;
}

// Run a wl-clipboard command, collecting what it prints.
// stdin_data is only piped when not null.
static int run_wl(const std::vector<std::string>& args, std::string* out, std::string& err,
                  const std::string* stdin_data = nullptr)
{
    TinyProcessLib::Process proc(
        args,
        "",
        out ? std::function<void(const char*, size_t)>([&](const char* b, size_t n) { out->append(b, n); })
            : nullptr,
        // wl-copy forks a background server that keeps inherited pipes open,
        // reading its stderr would block until someone else takes the clipboard
        out ? std::function<void(const char*, size_t)>([&](const char* b, size_t n) { err.append(b, n); })
            : nullptr,
        stdin_data != nullptr);

    if (stdin_data)
    {
        if (!proc.write(stdin_data->data(), stdin_data->size()))
            err = "failed to write to stdin";
        proc.close_stdin();
    }

    return proc.get_exit_status();
}

// wl-copy has no notion of a busy clipboard, when it fails it's
// missing or can't reach the compositor
static std::string wl_copy_failure(const std::string_view what, int status, const std::string& err)
{
    std::string msg = fmt::format("Failed to copy {} into clipboard: wl-copy exited with status {}, is wl-clipboard installed?",
                                  what, status);
    if (!err.empty())
        msg += fmt::format(" ({})", err);
    return msg;
}

Result<> Clipboard::CopyText(const std::string& text)
{
    if (m_session != WAYLAND)
    {
        if (clip::set_text(text))
            return Ok();
        return Err(ErrorKind::ClipboardBusy, "Failed to copy text into clipboard");
    }

    std::string err;
    // through stdin, so text starting with '-' or bigger than ARG_MAX is fine
    const int status = run_wl({ "wl-copy", "--type", "text/plain;charset=utf-8" }, nullptr, err, &text);
    if (status == 0)
        return Ok();
    return Err(wl_copy_failure("text", status, err));
}

Result<> Clipboard::CopyImage(const std::string& png)
{
    if (png.empty())
        return Err("Image is empty");

    std::string err;
    if (m_session == WAYLAND)
    {
        const int status = run_wl({ "wl-copy", "--type", std::string(PNG_MIME) }, nullptr, err, &png);
        if (status == 0)
            return Ok();
        return Err(wl_copy_failure("image", status, err));
    }

    clip::lock l;
    if (!l.locked())
        return Err(ErrorKind::ClipboardBusy, "Clipboard is locked");

    l.clear();
    if (l.set_data(png_format(), png.data(), png.size()))
        return Ok();
    return Err(ErrorKind::ClipboardBusy, "Failed to copy image into clipboard");
}

Result<> Clipboard::Write(const clip_content_t& content)
{
    if (content.kind == EntryKind::Image)
        return CopyImage(content.data);
    return CopyText(content.data);
}

Result<clip_content_t> Clipboard::Read()
{
    if (m_session == WAYLAND)
        return ReadWayland();
    return ReadX11();
}

Result<clip_content_t> Clipboard::ReadX11()
{
    // text wins when the owner offers both, browsers do that for copied images with alt text
    if (clip::has(clip::text_format()))
    {
        std::string text;
        if (!clip::get_text(text))
            return Err(ErrorKind::ClipboardBusy, "Failed to read text from clipboard");
        return clip_content_t{ EntryKind::Text, std::move(text) };
    }

    clip::lock l;
    if (!l.locked())
        return Err(ErrorKind::ClipboardBusy, "Clipboard is locked");

    if (!l.is_convertible(png_format()))
        return Err(ErrorKind::UnsupportedFormat, "Clipboard holds neither text nor a PNG image");

    const size_t len = l.get_data_length(png_format());
    std::string  png(len, '\0');
    if (len == 0 || !l.get_data(png_format(), png.data(), len))
        return Err(ErrorKind::ClipboardBusy, "Failed to read image from clipboard");

    return clip_content_t{ EntryKind::Image, std::move(png) };
}

Result<clip_content_t> Clipboard::ReadWayland()
{
    std::string types, err;
    if (const int status = run_wl({ "wl-paste", "--list-types" }, &types, err); status != 0)
    {
        // an empty clipboard is "No selection" or "Nothing is copied", depending on the version
        if (err.find("No selection") != err.npos || err.find("Nothing is copied") != err.npos)
            return Err(ErrorKind::UnsupportedFormat, "Clipboard is empty");
        return Err(trim(fmt::format("wl-paste exited with status {}, is wl-clipboard installed? {}", status, trim(err))));
    }

    bool has_text = false, has_png = false;
    for (std::string_view rest = types; !rest.empty();)
    {
        const size_t           nl   = rest.find('\n');
        const std::string_view type = rest.substr(0, nl);
        rest                        = nl == rest.npos ? std::string_view{} : rest.substr(nl + 1);

        if (type.starts_with("text/plain") || type == "UTF8_STRING" || type == "STRING" || type == "TEXT")
            has_text = true;
        else if (type == PNG_MIME)
            has_png = true;
    }

    std::string data;
    if (has_text)
    {
        if (run_wl({ "wl-paste", "--no-newline", "--type", "text" }, &data, err) != 0)
            return Err(ErrorKind::ClipboardBusy, "Failed to read text from clipboard: " + err);
        return clip_content_t{ EntryKind::Text, std::move(data) };
    }

    if (has_png)
    {
        if (run_wl({ "wl-paste", "--type", std::string(PNG_MIME) }, &data, err) != 0)
            return Err(ErrorKind::ClipboardBusy, "Failed to read image from clipboard: " + err);
        return clip_content_t{ EntryKind::Image, std::move(data) };
    }

    return Err(ErrorKind::UnsupportedFormat, "Clipboard holds neither text nor a PNG image");
}
