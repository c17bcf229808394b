#ifndef _HISTORY_ENTRY_HPP_
#define _HISTORY_ENTRY_HPP_

#include <chrono>
#include <cstdint>
#include <string>

using EntryId     = int64_t;
using timestamp_t = std::chrono::system_clock::time_point;

enum class EntryKind
{
    Text,
    Image  // PNG bytes
};

struct entry_t
{
    EntryId     id{};
    EntryKind   kind = EntryKind::Text;
    std::string content;       // text, or PNG bytes (left empty in list snapshots)
    std::string content_hash;  // fnv1a_hex() of the content
    size_t      size{};        // content size in bytes, set even when content isn't loaded
    bool        pinned = false;
    timestamp_t created_at;
    timestamp_t last_used_at;

    bool is_text() const { return kind == EntryKind::Text; }
    bool is_image() const { return kind == EntryKind::Image; }

    // Single line text preview, or "Image (N KB)"
    std::string preview(size_t max_len = 200) const;
};

// What the clipboard holds (or what we put on it)
struct clip_content_t
{
    EntryKind   kind = EntryKind::Text;
    std::string data;

    bool operator==(const clip_content_t&) const = default;
};

int64_t     to_unix_ms(timestamp_t tp);
timestamp_t from_unix_ms(int64_t ms);

#endif  // !_HISTORY_ENTRY_HPP_
