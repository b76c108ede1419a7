#include "signal_blocker.hpp"
#include <pthread.h>
#include <system_error>

namespace sigq {

SignalBlocker::SignalBlocker(const sigset_t &set)
{
    // pthread_sigmask() returns the error number instead of setting errno
    if (int rc = pthread_sigmask(SIG_BLOCK, &set, &old_set_); rc != 0)
        throw std::system_error(rc, std::system_category(), "pthread_sigmask(SIG_BLOCK) failed");
}


SignalBlocker::~SignalBlocker()
{
    // cannot fail: old_set_ came from the kernel and SIG_SETMASK is valid
    pthread_sigmask(SIG_SETMASK, &old_set_, nullptr);
}

} // namespace sigq
