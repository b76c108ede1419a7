#pragma once
#include <csignal>

namespace sigq {

// Blocks a set of signals on the calling thread for the lifetime of the object
// and puts the previous mask back on destruction.
class SignalBlocker {
public:
    // Throws std::system_error if pthread_sigmask() fails.
    explicit SignalBlocker(const sigset_t &set);
    ~SignalBlocker();

    // mask that was active before the block
    const sigset_t &previous() const { return old_set_; }

    SignalBlocker(const SignalBlocker &) = delete;
    SignalBlocker &operator=(const SignalBlocker &) = delete;
    SignalBlocker(SignalBlocker &&) = delete;
    SignalBlocker &operator=(SignalBlocker &&) = delete;

private:
    sigset_t old_set_{};
};

} // namespace sigq
