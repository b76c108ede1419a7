#include "master.hpp"
#include "cfg/cfg.hpp"
#include "master_exception.hpp"
#include "signals/signal_queue.hpp"
#include "utils/string.hpp"
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fmt/core.h>
#include <initializer_list>
#include <spdlog/spdlog.h>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace sigq {

namespace {

// Ends the queue session when run() leaves, whichever way it leaves.
class queue_session {
public:
    queue_session(SignalQueue &queue, int sa_flags)
        : queue_(queue)
    {
        queue_.init({"ALRM", "CHLD", "TERM", "QUIT"}, InitOptions{sa_flags});
    }

    ~queue_session()
    {
        // a pending alarm would hit the restored default action
        alarm(0);
        try {
            const auto remaining = queue_.deinit();
            if (!remaining.empty())
                spdlog::info("Signals left unhandled: {}", utils::string::join(remaining));
        } catch (const std::exception &e) {
            spdlog::error("Failed to deinitialize signal queue: {}", e.what());
        }
    }

    queue_session(const queue_session &) = delete;
    queue_session &operator=(const queue_session &) = delete;

private:
    SignalQueue &queue_;
};

} // namespace


master_options master_options::from_cfg(const cfg::cfg &cfg)
{
    const auto m = cfg.section(cfg::MASTER_SECTION);

    master_options options;
    options.spawn_interval = m->get<unsigned int>("spawn_interval");
    options.worker_min_seconds = m->get<unsigned int>("worker_min_seconds");
    options.worker_max_seconds = m->get<unsigned int>("worker_max_seconds");
    options.max_workers = m->get<unsigned int>("max_workers");
    options.sa_flags = m->get<int>("sa_flags");
    return options;
}


master::master(const master_options &options)
    : options_(options), rng_(std::random_device{}())
{
    if (options_.spawn_interval == 0)
        throw master_exception("spawn interval must be at least 1 second");
    if (options_.worker_max_seconds < options_.worker_min_seconds)
        throw master_exception("worker_max_seconds is lower than worker_min_seconds");
}


master_stats master::run()
{
    auto &queue = SignalQueue::inst();
    queue_session session(queue, options_.sa_flags);

    // first worker right away
    if (raise(SIGALRM) != 0)
        throw master_exception(fmt::format("raise(SIGALRM) failed: {}", utils::string::str_err(errno)));

    while (active_ || !workers_.empty()) {
        spdlog::debug("Number of workers: {}", workers_.size());

        const std::string sig_name = queue.wait_for_signal();
        if (sig_name == "ALRM")
            on_alarm();
        else if (sig_name == "CHLD")
            on_child();
        else if (sig_name == "TERM")
            on_terminate();
        else if (sig_name == "QUIT")
            on_quit();
        else
            spdlog::warn("Unexpected signal {}", sig_name);
    }

    spdlog::info("Master done: {} worker(s) spawned, {} reaped", stats_.spawned, stats_.reaped);
    return stats_;
}


void master::on_alarm()
{
    alarm(options_.spawn_interval);

    if (options_.max_workers != 0 && workers_.size() >= options_.max_workers) {
        spdlog::debug("Worker limit ({}) reached, not spawning", options_.max_workers);
        return;
    }

    spawn_worker();
}


void master::on_child()
{
    // CHLD is SIG_IGN between delivery and re-arm, and children exiting in that
    // window are reaped by the kernel. Poll every worker so those are noticed
    // too; wait_for_signal() has re-armed CHLD by now.
    for (auto it = workers_.begin(); it != workers_.end();) {
        const pid_t pid = *it;
        int status = 0;
        const pid_t rc = waitpid(pid, &status, WNOHANG);

        if (rc == 0) {
            ++it;
            continue;
        }

        if (rc == -1) {
            if (errno == EINTR)
                continue;
            if (errno != ECHILD)
                throw master_exception(fmt::format("waitpid({}) failed: {}", pid, utils::string::str_err(errno)));
            spdlog::info("Worker {} exited, status unavailable", pid);
        } else if (WIFEXITED(status)) {
            spdlog::info("Worker {} exited with status {}", pid, WEXITSTATUS(status));
        } else if (WIFSIGNALED(status)) {
            spdlog::info("Worker {} killed by signal {}", pid, WTERMSIG(status));
        }

        it = workers_.erase(it);
        ++stats_.reaped;
    }
}


void master::on_terminate()
{
    spdlog::info("TERM received, waiting for {} worker(s) to finish", workers_.size());
    SignalQueue::inst().ignore("ALRM");
    active_ = false;
}


void master::on_quit()
{
    spdlog::info("QUIT received, terminating {} worker(s)", workers_.size());
    auto &queue = SignalQueue::inst();
    queue.ignore("ALRM");
    queue.ignore("TERM");

    if (kill(0, SIGTERM) != 0)
        throw master_exception(fmt::format("kill() failed: {}", utils::string::str_err(errno)));

    active_ = false;
}


void master::spawn_worker()
{
    std::uniform_int_distribution<unsigned int> dist(options_.worker_min_seconds, options_.worker_max_seconds);
    const unsigned int seconds = dist(rng_);

    const pid_t pid = fork();
    if (pid == -1)
        throw master_exception(fmt::format("fork() failed: {}", utils::string::str_err(errno)));
    if (pid == 0)
        worker_main(seconds);

    workers_.insert(pid);
    ++stats_.spawned;
    spdlog::info("Spawned worker {} ({} seconds)", pid, seconds);
}


void master::worker_main(unsigned int seconds)
{
    // the worker must not inherit the master's queue handlers
    for (int signo: {SIGTERM, SIGQUIT, SIGCHLD}) {
        if (std::signal(signo, SIG_DFL) == SIG_ERR)
            _exit(EXIT_FAILURE);
    }

    std::this_thread::sleep_for(std::chrono::seconds(seconds));
    _exit(EXIT_SUCCESS);
}

} // namespace sigq
