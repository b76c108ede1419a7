#pragma once
#include <random>
#include <set>
#include <sys/types.h>

namespace sigq {

namespace cfg {
class cfg;
}

struct master_options {
    unsigned int spawn_interval = 5;
    unsigned int worker_min_seconds = 3;
    unsigned int worker_max_seconds = 17;
    unsigned int max_workers = 0; // 0 means unlimited
    int sa_flags = 0;

    // reads the "master" section
    static master_options from_cfg(const cfg::cfg &cfg);
};


struct master_stats {
    unsigned int spawned = 0;
    unsigned int reaped = 0;
};


// Pre-forking style master driven by the signal queue:
// - ALRM: spawn a worker, re-arm the alarm
// - CHLD: reap finished workers
// - TERM: stop spawning, exit after the last worker is gone
// - QUIT: like TERM, and send TERM to the whole process group
class master {
public:
    explicit master(const master_options &options);

    master(const master &) = delete;
    master &operator=(const master &) = delete;

    // Runs until shut down and every worker has been reaped.
    master_stats run();

private:
    void on_alarm();
    void on_child();
    void on_terminate();
    void on_quit();

    void spawn_worker();
    [[noreturn]] void worker_main(unsigned int seconds);

    master_options options_;
    std::mt19937_64 rng_;
    std::set<pid_t> workers_;
    bool active_ = true;
    master_stats stats_;
};

} // namespace sigq
