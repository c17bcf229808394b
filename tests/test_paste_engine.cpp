#include <gtest/gtest.h>

#include "fakes.hpp"
#include "paste_engine.hpp"

using namespace std::chrono_literals;

class PasteEngineTest : public ::testing::Test
{
protected:
    FakeClipboard    clipboard;
    FakeWindowSystem windows{ &clipboard };
    EchoSuppressor   suppressor{ 1500ms };
    paste_options_t  options;

    PasteEngineTest()
    {
        options.clipboard_retries     = 3;
        options.clipboard_retry_delay = 1ms;
        options.paste_delay           = 0ms;
    }

    static entry_t TextEntry(const std::string& text)
    {
        entry_t e;
        e.id      = 7;
        e.kind    = EntryKind::Text;
        e.content = text;
        e.size    = text.size();
        return e;
    }
};

TEST_F(PasteEngineTest, WritesClipboardBeforeTheKeystroke)
{
    PasteEngine engine(clipboard, windows, suppressor, options);

    const Result<>& res = engine.Paste(TextEntry("from history"), 0x200);
    ASSERT_TRUE(res.ok()) << res.error();

    EXPECT_EQ(windows.focused, (std::vector<window_handle_t>{ 0x200 }));
    ASSERT_EQ(windows.Keystrokes(), 1);
    ASSERT_EQ(windows.clipboard_at_paste.size(), 1u);
    EXPECT_EQ(windows.clipboard_at_paste[0], (clip_content_t{ EntryKind::Text, "from history" }));
}

TEST_F(PasteEngineTest, ArmsEchoSuppression)
{
    PasteEngine engine(clipboard, windows, suppressor, options);

    ASSERT_TRUE(engine.Paste(TextEntry("from history"), 0x100).ok());
    EXPECT_TRUE(suppressor.IsArmed());
}

TEST_F(PasteEngineTest, ClosedWindowGetsNoKeystroke)
{
    PasteEngine engine(clipboard, windows, suppressor, options);

    const Result<>& res = engine.Paste(TextEntry("orphan"), 0xdead);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.kind(), ErrorKind::WindowGone);

    EXPECT_EQ(windows.Keystrokes(), 0);
    // still there for a manual paste
    EXPECT_EQ(clipboard.Current(), (clip_content_t{ EntryKind::Text, "orphan" }));
}

TEST_F(PasteEngineTest, NoTargetSkipsFocus)
{
    PasteEngine engine(clipboard, windows, suppressor, options);

    ASSERT_TRUE(engine.Paste(TextEntry("wayland"), 0).ok());
    EXPECT_TRUE(windows.focused.empty());
    EXPECT_EQ(windows.Keystrokes(), 1);
}

TEST_F(PasteEngineTest, BusyClipboardIsRetried)
{
    clipboard.busy_writes = 2;
    PasteEngine engine(clipboard, windows, suppressor, options);

    ASSERT_TRUE(engine.Paste(TextEntry("eventually"), 0x100).ok());
    EXPECT_EQ(clipboard.write_attempts, 3);
    EXPECT_EQ(windows.Keystrokes(), 1);
}

TEST_F(PasteEngineTest, BusyClipboardGivesUpWithoutTyping)
{
    clipboard.busy_writes = 10;
    PasteEngine engine(clipboard, windows, suppressor, options);

    const Result<>& res = engine.Paste(TextEntry("never"), 0x100);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.kind(), ErrorKind::ClipboardBusy);
    EXPECT_EQ(clipboard.write_attempts, 3);

    EXPECT_EQ(windows.Keystrokes(), 0);
    EXPECT_TRUE(windows.focused.empty());
    // the user's next copy must not be swallowed
    EXPECT_FALSE(suppressor.IsArmed());
}

TEST_F(PasteEngineTest, ImageWithoutBytesIsRefused)
{
    PasteEngine engine(clipboard, windows, suppressor, options);

    entry_t image;
    image.id   = 3;
    image.kind = EntryKind::Image;
    image.size = 4096;

    EXPECT_FALSE(engine.Paste(image, 0x100).ok());
    EXPECT_EQ(clipboard.write_attempts, 0);
    EXPECT_EQ(windows.Keystrokes(), 0);
}

TEST_F(PasteEngineTest, PastesImages)
{
    PasteEngine engine(clipboard, windows, suppressor, options);

    entry_t image;
    image.id      = 3;
    image.kind    = EntryKind::Image;
    image.content = "\x89PNG fake";
    image.size    = image.content.size();

    ASSERT_TRUE(engine.Paste(image, 0x100).ok());
    EXPECT_EQ(clipboard.Current(), (clip_content_t{ EntryKind::Image, "\x89PNG fake" }));
}
