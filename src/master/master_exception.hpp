#pragma once
#include <stdexcept>

namespace sigq {

class master_exception : public std::runtime_error {
public:
    explicit master_exception(const std::string &desc)
        : runtime_error{desc}
    { }
};

} // namespace sigq
