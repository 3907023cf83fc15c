//
// Copyright (c) 2024-2025 JLGxy
//

#pragma once

#include <sys/ioctl.h>
#include <unistd.h>

#include <cstddef>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include "fmt/core.h"
#include "fmt/format.h"

#define GRIDSCORE_FMT_COMPILE 0

#if GRIDSCORE_FMT_COMPILE
#include "fmt/compile.h"
#define GRIDSCORE_FMT FMT_COMPILE
#else
#define GRIDSCORE_FMT FMT_STRING
#endif

namespace gridscore::gl {

// Console output of the whole process. While a batch is running on a terminal the last line holds
// a progress bar and everything printed goes above it.
class ProgressBar {
  public:
    ProgressBar() : is_tty_(isatty(STDOUT_FILENO) != 0) {}
    ProgressBar(const ProgressBar &) = delete;
    ProgressBar &operator=(const ProgressBar &) = delete;
    ~ProgressBar() { finish(); }

    void init(std::size_t total) {
        const std::lock_guard guard(lock_);
        done_ = 0;
        total_ = total;
        if (!is_tty_ || shown_) return;
        shown_ = true;
        std::cout << "\033[?25l" << std::nounitbuf;
        draw();
    }
    void finish() {
        const std::lock_guard guard(lock_);
        if (!shown_) return;
        erase();
        std::cout << "\033[?25h" << std::flush;
        shown_ = false;
    }

    template <typename... Args>
    void println(fmt::format_string<Args...> format, Args &&...args) {
        auto line = fmt::format(format, std::forward<Args>(args)...);
        const std::lock_guard guard(lock_);
        erase();
        std::cout << line << '\n';
        draw();
    }

    // one more unit of work is done
    void step() {
        const std::lock_guard guard(lock_);
        if (done_ < total_) done_++;
        erase();
        draw();
    }

  private:
    const bool is_tty_;
    bool shown_ = false;
    std::size_t done_ = 0, total_ = 0;
    std::mutex lock_;

    void draw() const {
        if (!shown_) return;
        winsize sz{};
        if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &sz) == -1) return;

        const auto counter = fmt::format(GRIDSCORE_FMT(" {}/{}"), done_, total_);
        const std::size_t width = sz.ws_col;
        if (width <= counter.size() + 8) {
            std::cout << "\033[0m" << counter << std::flush;
            return;
        }
        const std::size_t len = width - counter.size() - 3;
        const std::size_t fill = total_ == 0 ? len : len * done_ / total_;
        std::cout << "\033[0m["
                  << fmt::format(GRIDSCORE_FMT("{:#<{}}{:.<{}}"), "", fill, "", len - fill)
                  << "]\033[42m" << counter << "\033[0m" << std::flush;
    }
    void erase() const {
        if (!shown_) return;
        std::cout << "\033[2K\r" << std::flush;
    }
};

inline gl::ProgressBar prog;

// Shows the bar for `total` units of work until destroyed.
class ProgressBarWrapper {
  public:
    explicit ProgressBarWrapper(std::size_t total) { prog.init(total); }
    ProgressBarWrapper(const ProgressBarWrapper &) = delete;
    ProgressBarWrapper &operator=(const ProgressBarWrapper &) = delete;
    ~ProgressBarWrapper() { prog.finish(); }
};

inline void print_warning(std::string_view what_arg) {
    prog.println(GRIDSCORE_FMT("\033[35m\033[1mwarning:\033[0m {}"), what_arg);
}

}  // namespace gridscore::gl
