#pragma once
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace sigq {

// Bidirectional mapping between short signal names ("HUP", "USR1", ...) and
// signal numbers. Names resolve to numbers through aliases too ("CLD" -> SIGCHLD),
// while a number always resolves to the first name listed for it.
class SignalTable {
public:
    using entry_type = std::pair<std::string, int>;

    SignalTable() = default;
    explicit SignalTable(const std::vector<entry_type> &entries);

    // Table of the signals known to this platform, built on first use.
    // Throws config_unavailable if the platform yields no signals.
    static const SignalTable &platform();

    std::optional<int> number(const std::string &name) const;
    std::optional<std::string> name(int signo) const;
    bool contains(const std::string &name) const;

    // all names, aliases included, in listing order
    std::vector<std::string> names() const;
    bool empty() const { return entries_.empty(); }

private:
    std::vector<entry_type> entries_;
    std::map<std::string, int> numbers_;
    std::map<int, std::string> names_;
};

} // namespace sigq
