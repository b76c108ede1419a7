#pragma once
#include "disposition_store.hpp"
#include "signal_queue_exception.hpp"
#include "signal_table.hpp"
#include <csignal>
#include <optional>
#include <string>
#include <vector>

namespace sigq {

struct InitOptions {
    // extra sa_flags OR'ed into the handler's flags; SA_SIGINFO is always set
    int extra_flags = 0;
};


// Queue of received POSIX signals, for event loops that handle one signal per
// iteration.
//
// init() installs a handler for each requested signal. On delivery the handler
// sets the signal to SIG_IGN and appends it to the queue, so an unconsumed
// signal is queued at most once and further deliveries are dropped.
// wait_for_signal() takes the oldest signal off the queue and re-arms its
// handler.
//
// Signal dispositions are process-wide, hence a single session per process.
// All operations are meant to be called from one thread. Signals directed at
// the process may be delivered to any thread not blocking them: other threads
// should block the managed signals or wait_for_signal() may not wake up.
class SignalQueue {
public:
    // flags accepted in InitOptions::extra_flags
    static constexpr int accepted_flags = SA_RESTART | SA_NOCLDSTOP | SA_NOCLDWAIT | SA_ONSTACK | SA_NODEFER;

    SignalQueue(const SignalQueue &) = delete;
    SignalQueue &operator=(const SignalQueue &) = delete;

    static SignalQueue &inst()
    {
        static SignalQueue q;
        return q;
    }

    // Starts a session for the given signal names using the platform table.
    void init(const std::vector<std::string> &signal_names, const InitOptions &options = {});
    void init(const std::vector<std::string> &signal_names, const InitOptions &options, const SignalTable &table);

    // Blocks until a signal is queued, then removes and returns the oldest one.
    std::string wait_for_signal();

    // true if wait_for_signal() would return without blocking
    bool is_ready() const;

    // Ignores a managed signal until deinit() and drops it from the queue.
    void ignore(const std::string &signal_name);

    // Restores the dispositions found by init() and returns the signals still
    // queued, oldest first.
    std::vector<std::string> deinit();

    bool initialized() const { return session_.has_value(); }
    std::vector<std::string> managed_signals() const;

private:
    SignalQueue() = default;

    struct Session {
        SignalTable table;
        std::vector<int> signals; // in init() order
        sigset_t mask{};
        struct sigaction action{};
        DispositionStore dispositions;
    };

    const Session &session() const;
    static void restore_dispositions(DispositionStore &dispositions);

    std::optional<Session> session_;
};

} // namespace sigq
