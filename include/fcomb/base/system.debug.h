#pragma once

#include <fcomb/base/fwd/messages.h>

#include <fcomb/base/strings.h>

#include <atomic>

namespace fcomb::Debug
{
    extern std::atomic<bool> g_debugging;

    template<class... Args>
    void print(const Args&... args)
    {
        if (g_debugging) msg::write_unlocalized_text_to_stderr(Color::none, Strings::concat("[DEBUG] ", args...));
    }
    template<class... Args>
    void println(const Args&... args)
    {
        if (g_debugging)
            msg::write_unlocalized_text_to_stderr(Color::none, Strings::concat("[DEBUG] ", args..., '\n'));
    }
}
