// term_utils.hpp: terminal size + SIGWINCH/SIGINT flags (POSIX)
#pragma once
#include <atomic>
#include <cstdlib>

#if defined(_WIN32)
  #include <windows.h>
#else
  #include <unistd.h>
  #include <sys/ioctl.h>
  #include <signal.h>
#endif

namespace io {

struct TermSize { int cols{80}; int rows{24}; };

inline TermSize get_terminal_size() {
    TermSize ts;
#if defined(_WIN32)
    HANDLE h = GetStdHandle(STD_OUTPUT_HANDLE);
    if (h == INVALID_HANDLE_VALUE) return ts;
    CONSOLE_SCREEN_BUFFER_INFO info{};
    if (!GetConsoleScreenBufferInfo(h, &info)) return ts;
    ts.cols = (int)(info.srWindow.Right - info.srWindow.Left + 1);
    ts.rows = (int)(info.srWindow.Bottom - info.srWindow.Top + 1);
#else
    winsize w{};
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &w) == 0 && w.ws_col > 0) {
        ts.cols = (int)w.ws_col;
        if (w.ws_row > 0) ts.rows = (int)w.ws_row;
    }
    if (const char* env = std::getenv("COLUMNS")) {
        int c = std::atoi(env); if (c > 0) ts.cols = c;
    }
#endif
    return ts;
}

inline std::atomic<bool>& terminal_resized_flag() { static std::atomic<bool> f{false}; return f; }
inline std::atomic<bool>& interrupt_flag()        { static std::atomic<bool> f{false}; return f; }

#if !defined(_WIN32)
inline void install_signal_handlers() {
    static bool installed = false; if (installed) return; installed = true;
    struct sigaction wa{}; wa.sa_handler = [](int){ terminal_resized_flag().store(true, std::memory_order_relaxed); };
    sigemptyset(&wa.sa_mask); wa.sa_flags = SA_RESTART; sigaction(SIGWINCH, &wa, nullptr);
    struct sigaction ia{}; ia.sa_handler = [](int){ interrupt_flag().store(true, std::memory_order_relaxed); };
    sigemptyset(&ia.sa_mask); ia.sa_flags = SA_RESTART; sigaction(SIGINT, &ia, nullptr);
}
#else
inline void install_signal_handlers() {}
#endif

} // namespace io
