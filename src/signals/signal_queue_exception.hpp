#pragma once
#include <stdexcept>
#include <string>

namespace sigq {

class signal_queue_exception : public std::runtime_error {
public:
    explicit signal_queue_exception(const std::string &desc)
        : runtime_error{desc}
    { }
};


// the platform signal-name table is missing or empty
class config_unavailable : public signal_queue_exception {
public:
    config_unavailable()
        : signal_queue_exception{"signal name table is not available"}
    { }
};


class already_initialized : public signal_queue_exception {
public:
    already_initialized()
        : signal_queue_exception{"signal queue already initialized"}
    { }
};


class not_initialized : public signal_queue_exception {
public:
    not_initialized()
        : signal_queue_exception{"signal queue not initialized"}
    { }
};


class invalid_options : public signal_queue_exception {
public:
    explicit invalid_options(const std::string &desc)
        : signal_queue_exception{desc}
    { }
};


class unknown_signal : public signal_queue_exception {
public:
    explicit unknown_signal(const std::string &desc)
        : signal_queue_exception{desc}
    { }
};


class no_signals : public signal_queue_exception {
public:
    no_signals()
        : signal_queue_exception{"no signals given"}
    { }
};


class unknown_or_unmanaged_signal : public signal_queue_exception {
public:
    explicit unknown_or_unmanaged_signal(const std::string &desc)
        : signal_queue_exception{desc}
    { }
};

} // namespace sigq
