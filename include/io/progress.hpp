// progress.hpp: single-bar progress for batch runs (p-ranav/indicators)
#pragma once

#include <cstddef>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

#include <indicators/progress_bar.hpp>
#include <indicators/cursor_control.hpp>

#include "io/term_utils.hpp"

namespace io {

class BatchProgress {
private:
    std::size_t total_ = 100;
    std::size_t last_shown_ = 0;
    std::mutex mu_;
    indicators::ProgressBar bar_;

    static std::size_t bar_width() {
        const int cols = get_terminal_size().cols;
        return cols > 70 ? static_cast<std::size_t>(cols - 50) : 20;
    }

    static std::string format_count(unsigned long long v) {
        static const char* suf[] = {"", "K", "M", "B", "T", "P", "E"};
        int si = 0;
        double x = static_cast<double>(v);
        while (x >= 1000.0 && si < 6) { x /= 1000.0; ++si; }
        std::ostringstream oss;
        if (si == 0) oss << v;
        else if (x >= 100.0) oss << std::fixed << std::setprecision(0) << x << suf[si];
        else if (x >= 10.0)  oss << std::fixed << std::setprecision(1) << x << suf[si];
        else                 oss << std::fixed << std::setprecision(2) << x << suf[si];
        return oss.str();
    }

public:
    BatchProgress(const std::string& label, std::size_t total)
    : total_(total == 0 ? 1 : total),
      bar_(indicators::option::BarWidth{bar_width()},
           indicators::option::Start{"["},
           indicators::option::Fill{"="},
           indicators::option::Lead{">"},
           indicators::option::Remainder{" "},
           indicators::option::End{"]"},
           indicators::option::ForegroundColor{indicators::Color::green},
           indicators::option::ShowPercentage{true},
           indicators::option::ShowElapsedTime{true},
           indicators::option::MaxProgress{total == 0 ? 1 : total},
           indicators::option::PrefixText{label + " "},
           indicators::option::Stream{std::cerr}) {
        indicators::show_console_cursor(false);
    }

    ~BatchProgress() { indicators::show_console_cursor(true); }

    BatchProgress(const BatchProgress&) = delete;
    BatchProgress& operator=(const BatchProgress&) = delete;

    // Safe to call from worker threads; redraws at most ~200 times per run.
    void tick(std::size_t done) {
        std::lock_guard<std::mutex> lk(mu_);
        if (done < total_ && (done <= last_shown_ || done - last_shown_ < total_ / 200 + 1)) return;
        last_shown_ = done;
        bar_.set_option(indicators::option::PostfixText{format_count(done) + "/" + format_count(total_)});
        bar_.set_progress(done);
    }

    void complete() {
        std::lock_guard<std::mutex> lk(mu_);
        if (!bar_.is_completed()) bar_.mark_as_completed();
    }
};

} // namespace io
