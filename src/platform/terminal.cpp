#include "terminal.hpp"
#include <iostream>
#include <termios.h>
#include <unistd.h>

namespace platform {

// ── NoEchoGuard ──────────────────────────────────────────────

struct NoEchoGuard::Impl {
    struct termios old_term;
};

NoEchoGuard::NoEchoGuard() {
    if (!isatty(STDIN_FILENO)) return;

    impl_ = new Impl;
    if (tcgetattr(STDIN_FILENO, &impl_->old_term) != 0) {
        delete impl_;
        impl_ = nullptr;
        return;
    }
    struct termios quiet = impl_->old_term;
    quiet.c_lflag &= ~ECHO;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &quiet);
}

NoEchoGuard::~NoEchoGuard() {
    if (impl_) {
        tcsetattr(STDIN_FILENO, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

// ── read_secret ──────────────────────────────────────────────

bool read_secret(const std::string& prompt, std::string& out) {
    std::cout << prompt << std::flush;
    bool ok;
    {
        NoEchoGuard guard;
        ok = static_cast<bool>(std::getline(std::cin, out));
    }
    // The user's Enter was not echoed
    std::cout << "\n";
    return ok;
}

} // namespace platform
