#include "disposition_store.hpp"
#include <cerrno>
#include <fmt/core.h>
#include <stdexcept>
#include <system_error>

namespace sigq {

void DispositionStore::install(int signo, const struct sigaction &action)
{
    struct sigaction old_action{};
    if (sigaction(signo, &action, &old_action) != 0)
        throw std::system_error(errno, std::system_category(), fmt::format("sigaction({}) failed", signo));

    saved_.emplace(signo, old_action);
}


void DispositionStore::restore(int signo)
{
    const auto it = saved_.find(signo);
    if (it == saved_.end())
        throw std::out_of_range(fmt::format("no saved disposition for signal {}", signo));

    if (sigaction(signo, &it->second, nullptr) != 0)
        throw std::system_error(errno, std::system_category(), fmt::format("sigaction({}) failed", signo));

    saved_.erase(it);
}


std::vector<int> DispositionStore::signals() const
{
    std::vector<int> result;
    result.reserve(saved_.size());
    for (const auto &[signo, action]: saved_)
        result.push_back(signo);
    return result;
}

} // namespace sigq
