#include "interrupt.hpp"
#include <csignal>

namespace platform {

static volatile std::sig_atomic_t g_interrupted = 0;

static void interrupt_handler(int) {
    g_interrupted = 1;
}

#ifdef _WIN32

struct InterruptGuard::Impl {
    void (*old_int)(int) = SIG_DFL;
    void (*old_term)(int) = SIG_DFL;
};

InterruptGuard::InterruptGuard() : impl_(new Impl) {
    g_interrupted = 0;
    impl_->old_int = std::signal(SIGINT, interrupt_handler);
    impl_->old_term = std::signal(SIGTERM, interrupt_handler);
}

InterruptGuard::~InterruptGuard() {
    std::signal(SIGINT, impl_->old_int);
    std::signal(SIGTERM, impl_->old_term);
    delete impl_;
}

#else

struct InterruptGuard::Impl {
    struct sigaction old_int;
    struct sigaction old_term;
    struct sigaction old_quit;
};

InterruptGuard::InterruptGuard() : impl_(new Impl) {
    g_interrupted = 0;

    struct sigaction sa;
    sa.sa_handler = interrupt_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, &impl_->old_int);
    sigaction(SIGTERM, &sa, &impl_->old_term);
    sigaction(SIGQUIT, &sa, &impl_->old_quit);
}

InterruptGuard::~InterruptGuard() {
    sigaction(SIGINT, &impl_->old_int, nullptr);
    sigaction(SIGTERM, &impl_->old_term, nullptr);
    sigaction(SIGQUIT, &impl_->old_quit, nullptr);
    delete impl_;
}

#endif

bool InterruptGuard::triggered() const {
    return g_interrupted != 0;
}

void InterruptGuard::reset() {
    g_interrupted = 0;
}

} // namespace platform
