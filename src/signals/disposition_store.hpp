#pragma once
#include <csignal>
#include <map>
#include <vector>

namespace sigq {

// Remembers the sigaction each signal had before we replaced it.
class DispositionStore {
public:
    // Installs action for signo. The previous action is remembered the first
    // time a signal is installed; later installs keep that original entry.
    // Throws std::system_error if sigaction() fails.
    void install(int signo, const struct sigaction &action);

    // Puts back the remembered action and forgets it. Throws std::out_of_range
    // for a signal that was never installed, std::system_error if sigaction()
    // fails (the entry is kept in that case).
    void restore(int signo);

    bool contains(int signo) const { return saved_.find(signo) != saved_.end(); }
    std::vector<int> signals() const;
    bool empty() const { return saved_.empty(); }
    std::size_t size() const { return saved_.size(); }

private:
    std::map<int, struct sigaction> saved_;
};

} // namespace sigq
