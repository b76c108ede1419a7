#include "signal_table.hpp"
#include "signal_queue_exception.hpp"
#include <csignal>
#include <fmt/core.h>

namespace sigq {

namespace {

std::vector<SignalTable::entry_type> platform_entries()
{
    std::vector<SignalTable::entry_type> entries = {
        {"HUP", SIGHUP},   {"INT", SIGINT},   {"QUIT", SIGQUIT}, {"ILL", SIGILL},   {"TRAP", SIGTRAP},
        {"ABRT", SIGABRT}, {"BUS", SIGBUS},   {"FPE", SIGFPE},   {"KILL", SIGKILL}, {"USR1", SIGUSR1},
        {"SEGV", SIGSEGV}, {"USR2", SIGUSR2}, {"PIPE", SIGPIPE}, {"ALRM", SIGALRM}, {"TERM", SIGTERM},
#ifdef SIGSTKFLT
        {"STKFLT", SIGSTKFLT},
#endif
        {"CHLD", SIGCHLD}, {"CONT", SIGCONT}, {"STOP", SIGSTOP}, {"TSTP", SIGTSTP}, {"TTIN", SIGTTIN},
        {"TTOU", SIGTTOU}, {"URG", SIGURG},   {"XCPU", SIGXCPU}, {"XFSZ", SIGXFSZ}, {"VTALRM", SIGVTALRM},
        {"PROF", SIGPROF}, {"WINCH", SIGWINCH},
#ifdef SIGIO
        {"IO", SIGIO},
#endif
#ifdef SIGPWR
        {"PWR", SIGPWR},
#endif
        {"SYS", SIGSYS},
    };

#if defined(SIGRTMIN) && defined(SIGRTMAX)
    // SIGRTMIN/SIGRTMAX are runtime values on glibc
    const int rtmin = SIGRTMIN;
    const int rtmax = SIGRTMAX;
    if (rtmin > 0 && rtmax >= rtmin) {
        entries.emplace_back("RTMIN", rtmin);
        for (int signo = rtmin + 1; signo < rtmax; ++signo)
            entries.emplace_back(fmt::format("NUM{}", signo), signo);
        if (rtmax > rtmin)
            entries.emplace_back("RTMAX", rtmax);
    }
#endif

    // aliases go last so they never become the canonical name
    entries.emplace_back("IOT", SIGIOT);
    entries.emplace_back("CLD", SIGCHLD);
#ifdef SIGPOLL
    entries.emplace_back("POLL", SIGPOLL);
#endif

    return entries;
}

} // namespace


SignalTable::SignalTable(const std::vector<entry_type> &entries)
{
    for (const auto &[name, signo]: entries) {
        if (name.empty() || signo <= 0)
            continue;
        if (!numbers_.emplace(name, signo).second)
            continue;
        names_.emplace(signo, name);
        entries_.emplace_back(name, signo);
    }
}


const SignalTable &SignalTable::platform()
{
    static const SignalTable table{platform_entries()};
    if (table.empty())
        throw config_unavailable();
    return table;
}


std::optional<int> SignalTable::number(const std::string &name) const
{
    if (const auto it = numbers_.find(name); it != numbers_.end())
        return it->second;
    return std::nullopt;
}


std::optional<std::string> SignalTable::name(int signo) const
{
    if (const auto it = names_.find(signo); it != names_.end())
        return it->second;
    return std::nullopt;
}


bool SignalTable::contains(const std::string &name) const
{
    return numbers_.find(name) != numbers_.end();
}


std::vector<std::string> SignalTable::names() const
{
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto &entry: entries_)
        result.push_back(entry.first);
    return result;
}

} // namespace sigq
