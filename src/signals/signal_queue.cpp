#include "signal_queue.hpp"
#include "pending_queue.hpp"
#include "signal_blocker.hpp"
#include "utils/string.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <system_error>
#include <unistd.h>

namespace sigq {

namespace {

// Written by async_handler(), read and trimmed by SignalQueue with the managed
// signals blocked.
PendingQueue pending;

[[noreturn]] void die(const char *msg) noexcept
{
    [[maybe_unused]] const auto rc = write(STDERR_FILENO, msg, std::strlen(msg));
    std::abort();
}


// Runs with every managed signal blocked (see Session::action.sa_mask), so it
// never nests with itself. Only async-signal-safe calls below.
void async_handler(int signo, siginfo_t *, void *)
{
    const int saved_errno = errno;

    struct sigaction ignore{};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    if (sigaction(signo, &ignore, nullptr) != 0)
        die("sigqueue: failed to disarm signal handler\n");

    if (!pending.push(signo))
        die("sigqueue: pending signal queue overflow\n");

    errno = saved_errno;
}


std::system_error sigaction_error(int err, const std::string &signal_name)
{
    return std::system_error(err, std::system_category(), fmt::format("sigaction({}) failed", signal_name));
}

} // namespace


void SignalQueue::init(const std::vector<std::string> &signal_names, const InitOptions &options)
{
    init(signal_names, options, SignalTable::platform());
}


void SignalQueue::init(const std::vector<std::string> &signal_names, const InitOptions &options,
                       const SignalTable &table)
{
    if (table.empty())
        throw config_unavailable();
    if (session_)
        throw already_initialized();
    if ((options.extra_flags & ~accepted_flags) != 0)
        throw invalid_options(fmt::format("unexpected sa_flags: {:#x}", options.extra_flags & ~accepted_flags));

    Session s{table, {}, {}, {}, {}};
    std::vector<std::string> bad_names;
    for (const auto &name: signal_names) {
        const auto signo = table.number(name);
        if (!signo)
            bad_names.push_back(name);
        else if (std::find(s.signals.begin(), s.signals.end(), *signo) == s.signals.end())
            s.signals.push_back(*signo);
    }

    if (!bad_names.empty())
        throw unknown_signal("unrecognized signal name: " + utils::string::join(bad_names, " "));
    if (s.signals.empty())
        throw no_signals();

    sigemptyset(&s.mask);
    for (int signo: s.signals)
        sigaddset(&s.mask, signo);

    s.action.sa_sigaction = async_handler;
    s.action.sa_mask = s.mask;
    s.action.sa_flags = SA_SIGINFO | options.extra_flags;

    {
        // nothing gets delivered halfway through the installation
        SignalBlocker blocker(s.mask);
        for (int signo: s.signals) {
            try {
                s.dispositions.install(signo, s.action);
            } catch (const std::system_error &e) {
                spdlog::error("Failed to install handler for signal {}: {}", signo, e.what());
                restore_dispositions(s.dispositions);
                throw;
            }
        }
        session_.emplace(std::move(s));
    }

    spdlog::debug("Signal queue initialized: {}", utils::string::join(managed_signals(), ", "));
}


std::string SignalQueue::wait_for_signal()
{
    const Session &s = session();
    int signo = 0;

    {
        SignalBlocker blocker(s.mask);

        // sigsuspend() unblocks and waits in one step; a signal cannot slip in
        // between the emptiness check and the wait
        while (pending.empty()) {
            if (sigsuspend(&blocker.previous()) != 0 && errno != EINTR)
                throw std::system_error(errno, std::system_category(), "sigsuspend() failed");
        }

        signo = pending.pop();
        if (sigaction(signo, &s.action, nullptr) != 0)
            throw sigaction_error(errno, s.table.name(signo).value_or(std::to_string(signo)));
    }

    auto name = s.table.name(signo);
    if (!name)
        throw std::logic_error(fmt::format("dequeued unknown signal {}", signo));

    spdlog::trace("Dequeued signal {}", *name);
    return *name;
}


bool SignalQueue::is_ready() const
{
    session();
    return !pending.empty();
}


void SignalQueue::ignore(const std::string &signal_name)
{
    const Session &s = session();

    const auto signo = s.table.number(signal_name);
    if (!signo || sigismember(&s.mask, *signo) != 1)
        throw unknown_or_unmanaged_signal(fmt::format("unexpected signal name: {}", signal_name));

    SignalBlocker blocker(s.mask);

    struct sigaction ignore_action{};
    ignore_action.sa_handler = SIG_IGN;
    sigemptyset(&ignore_action.sa_mask);
    if (sigaction(*signo, &ignore_action, nullptr) != 0)
        throw sigaction_error(errno, signal_name);

    if (pending.remove(*signo))
        spdlog::debug("Dropped queued signal {}", signal_name);
}


std::vector<std::string> SignalQueue::deinit()
{
    if (!session_)
        throw not_initialized();

    std::vector<int> remaining;
    {
        SignalBlocker blocker(session_->mask);
        restore_dispositions(session_->dispositions);
        remaining = pending.drain();
    }

    std::vector<std::string> names;
    names.reserve(remaining.size());
    for (int signo: remaining)
        names.push_back(session_->table.name(signo).value_or(std::to_string(signo)));

    session_.reset();
    spdlog::debug("Signal queue deinitialized, {} signal(s) left in queue", names.size());
    return names;
}


std::vector<std::string> SignalQueue::managed_signals() const
{
    const Session &s = session();

    std::vector<std::string> names;
    names.reserve(s.signals.size());
    for (int signo: s.signals)
        names.push_back(s.table.name(signo).value_or(std::to_string(signo)));
    return names;
}


const SignalQueue::Session &SignalQueue::session() const
{
    if (!session_)
        throw not_initialized();
    return *session_;
}


void SignalQueue::restore_dispositions(DispositionStore &dispositions)
{
    for (int signo: dispositions.signals()) {
        try {
            dispositions.restore(signo);
        } catch (const std::system_error &e) {
            spdlog::error("Failed to restore disposition of signal {}: {}", signo, e.what());
        }
    }
}

} // namespace sigq
