#include "history_entry.hpp"

#include "fmt/format.h"
#include "util.hpp"

std::string entry_t::preview(size_t max_len) const
{
    if (is_image())
        return fmt::format("Image ({} KB)", size / 1024);

    std::string line = utf8_truncate(content, max_len);
    line             = replace_str(line, "\r", "");
    line             = replace_str(line, "\n", " ");
    line             = replace_str(line, "\t", " ");
    return trim(line);
}

int64_t to_unix_ms(timestamp_t tp)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

timestamp_t from_unix_ms(int64_t ms)
{
    return timestamp_t(std::chrono::duration_cast<timestamp_t::duration>(std::chrono::milliseconds(ms)));
}
