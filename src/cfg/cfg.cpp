#include "cfg.hpp"
#include "logger/logger.hpp"
#include <boost/algorithm/string.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/ptree.hpp>
#include <csignal>
#include <fmt/core.h>
#include <istream>
#include <map>
#include <memory>
#include <set>
#include <string>

namespace sigq::cfg {

section_handler::section_handler(std::string name, const boost::property_tree::ptree &pt)
    : section_name_(std::move(name)), pt_(pt)
{
    // this maps several values to "0" and "1", which will be
    // converted to int or bool by means of T get<T>()
    bool_map_ = {{"true", "1"}, {"on", "1"}, {"false", "0"}, {"off", "0"}};
}


void section_handler::validate()
{
    using boost::algorithm::to_lower_copy;

    std::set<std::string> existing_opts;

    for (const auto &[key, value]: pt_) {
        std::string name = to_lower_copy(key);
        if (auto it = option_handlers_.find(name); it != option_handlers_.end()) {
            it->second(value.data());
            existing_opts.insert(name);
        } else {
            throw cfg_exception(fmt::format(R"(section "{}", invalid option "{}")", section_name_, name));
        }
    }

    fill_defaults(existing_opts);
}


void section_handler::fill_defaults(const std::set<std::string> &opts)
{
    for (const auto &[key, handler]: option_handlers_) {
        if (opts.find(key) == opts.end()) {
            if (const auto dflt = defaults_.find(key); dflt != defaults_.end())
                handler(dflt->second);
        }
    }
}


void section_handler::process_unsigned(const std::string &optname, const std::string &optval)
{
    const auto value = boost::trim_copy(optval);

    // lexical_cast<unsigned int> wraps "-1" around instead of failing
    bool valid = !value.empty() && value.front() != '-';
    if (valid) {
        try {
            boost::lexical_cast<unsigned int>(value);
        } catch (const boost::bad_lexical_cast &e) {
            valid = false;
        }
    }

    if (!valid)
        throw cfg_exception(fmt::format(R"(section "{}", invalid value for "{}" ({}). Integer expected.)",
                                        section_name_, optname, optval));

    options_[optname] = value;
}


general_section_handler::general_section_handler(const std::string &name, const boost::property_tree::ptree &pt)
    : section_handler(name, pt)
{
    using boost::lexical_cast;
    using std::string;

    // defaults
    defaults_["daemonize"] = "false";
    defaults_["log_type"] = "console";
    defaults_["log_facility"] = "daemon";
    defaults_["log_priority"] = "info";

    // set processors for general options
    option_handlers_["daemonize"] = [this](auto &&arg) { process_daemonize(std::forward<decltype(arg)>(arg)); };
    option_handlers_["log_type"] = [this](auto &&arg) { process_log_type(std::forward<decltype(arg)>(arg)); };
    log_type_map_ = {
        {"console", lexical_cast<string>(logger::console)},
        {"syslog", lexical_cast<string>(logger::syslog)},
    };
    option_handlers_["log_facility"] = [this](auto &&arg) { process_log_facility(std::forward<decltype(arg)>(arg)); };
    log_facility_map_ = {
        {"user", lexical_cast<string>(logger::facility_user)},
        {"mail", lexical_cast<string>(logger::facility_mail)},
        {"news", lexical_cast<string>(logger::facility_news)},
        {"uucp", lexical_cast<string>(logger::facility_uucp)},
        {"daemon", lexical_cast<string>(logger::facility_daemon)},
        {"auth", lexical_cast<string>(logger::facility_auth)},
        {"cron", lexical_cast<string>(logger::facility_cron)},
        {"lpr", lexical_cast<string>(logger::facility_lpr)},
        {"local0", lexical_cast<string>(logger::facility_local0)},
        {"local1", lexical_cast<string>(logger::facility_local1)},
        {"local2", lexical_cast<string>(logger::facility_local2)},
        {"local3", lexical_cast<string>(logger::facility_local3)},
        {"local4", lexical_cast<string>(logger::facility_local4)},
        {"local5", lexical_cast<string>(logger::facility_local5)},
        {"local6", lexical_cast<string>(logger::facility_local6)},
        {"local7", lexical_cast<string>(logger::facility_local7)},
    };
    option_handlers_["log_priority"] = [this](auto &&arg) { process_log_priority(std::forward<decltype(arg)>(arg)); };
    log_priority_map_ = {
        {"trace", lexical_cast<string>(logger::priority_trace)},
        {"debug", lexical_cast<string>(logger::priority_debug)},
        {"info", lexical_cast<string>(logger::priority_info)},
        {"warning", lexical_cast<string>(logger::priority_warn)},
        {"error", lexical_cast<string>(logger::priority_err)},
        {"critical", lexical_cast<string>(logger::priority_critical)},
    };
}


void general_section_handler::process_daemonize(const std::string &optval)
{
    const auto it = bool_map_.find(boost::to_lower_copy(optval));
    if (it == bool_map_.end())
        throw cfg_exception(
            fmt::format(R"(section "{}", invalid value for "daemonize" ({}))", GENERAL_SECTION, optval));

    options_["daemonize"] = it->second;
}


void general_section_handler::process_log_type(const std::string &optval)
{
    const auto it = log_type_map_.find(boost::to_lower_copy(optval));
    if (it == log_type_map_.end())
        throw cfg_exception(fmt::format(R"(section "{}", invalid value for "log_type" ({}))", GENERAL_SECTION, optval));

    options_["log_type"] = it->second;
}


void general_section_handler::process_log_facility(const std::string &optval)
{
    const auto it = log_facility_map_.find(boost::to_lower_copy(optval));
    if (it == log_facility_map_.end())
        throw cfg_exception(
            fmt::format(R"(section "{}", invalid value for "log_facility" ({}))", GENERAL_SECTION, optval));

    options_["log_facility"] = it->second;
}


void general_section_handler::process_log_priority(const std::string &optval)
{
    const auto it = log_priority_map_.find(boost::to_lower_copy(optval));
    if (it == log_priority_map_.end())
        throw cfg_exception(
            fmt::format(R"(section "{}", invalid value for "log_priority" ({}))", GENERAL_SECTION, optval));

    options_["log_priority"] = it->second;
}


master_section_handler::master_section_handler(const std::string &name, const boost::property_tree::ptree &pt)
    : section_handler(name, pt)
{
    defaults_["spawn_interval"] = "5";
    defaults_["worker_min_seconds"] = "3";
    defaults_["worker_max_seconds"] = "17";
    defaults_["max_workers"] = "0"; // unlimited
    defaults_["sa_flags"] = "";

    option_handlers_["spawn_interval"] = [this](auto &&arg) {
        process_spawn_interval(std::forward<decltype(arg)>(arg));
    };
    option_handlers_["worker_min_seconds"] = [this](auto &&arg) {
        process_unsigned("worker_min_seconds", std::forward<decltype(arg)>(arg));
    };
    option_handlers_["worker_max_seconds"] = [this](auto &&arg) {
        process_unsigned("worker_max_seconds", std::forward<decltype(arg)>(arg));
    };
    option_handlers_["max_workers"] = [this](auto &&arg) {
        process_unsigned("max_workers", std::forward<decltype(arg)>(arg));
    };
    option_handlers_["sa_flags"] = [this](auto &&arg) { process_sa_flags(std::forward<decltype(arg)>(arg)); };
    sa_flags_map_ = {
        {"restart", SA_RESTART},
        {"nocldstop", SA_NOCLDSTOP},
        {"onstack", SA_ONSTACK},
        {"nodefer", SA_NODEFER},
    };
}


void master_section_handler::process_spawn_interval(const std::string &optval)
{
    process_unsigned("spawn_interval", optval);
    if (get<unsigned int>("spawn_interval") == 0)
        throw cfg_exception(
            fmt::format(R"(section "{}", "spawn_interval" must be at least 1 second)", section_name_));
}


void master_section_handler::process_sa_flags(const std::string &optval)
{
    int flags = 0;
    std::vector<std::string> names;

    if (!boost::trim_copy(optval).empty()) {
        boost::split(names, optval, boost::is_any_of(","));
        for (auto &v: names) {
            boost::trim(v);
            boost::to_lower(v);
            const auto it = sa_flags_map_.find(v);
            if (it == sa_flags_map_.end())
                throw cfg_exception(
                    fmt::format(R"(section "{}", invalid value for "sa_flags" ({}))", section_name_, v));
            flags |= it->second;
        }
    }

    // keep the names for logging, the combined value for get<int>()
    options_["sa_flags"] = boost::lexical_cast<std::string>(flags);
    options_split_["sa_flags"] = names;
}


void cfg::init(const std::string &filename)
{
    try {
        boost::property_tree::read_ini(filename, pt_);
    } catch (const boost::property_tree::ptree_error &e) {
        // convert boost::property_tree exceptions to cfg_exception
        throw cfg_exception(e.what());
    }

    build_sections();
}


void cfg::load(std::istream &stream)
{
    try {
        boost::property_tree::read_ini(stream, pt_);
    } catch (const boost::property_tree::ptree_error &e) {
        throw cfg_exception(e.what());
    }

    build_sections();
}


void cfg::build_sections()
{
    general_section_.reset();
    master_section_.reset();

    for (const auto &[key, node]: pt_) {
        if (node.empty() && !node.data().empty())
            throw cfg_exception(fmt::format("configuration option outside of a section: {} = {}", key, node.data()));

        auto section = make_section(key, node);
        section->validate();

        if (boost::iequals(key, GENERAL_SECTION))
            general_section_ = section;
        else
            master_section_ = section;
    }

    // read_ini() drops sections without options; those run on defaults
    if (general_section_ == nullptr) {
        general_section_ = make_section(GENERAL_SECTION, boost::property_tree::ptree{});
        general_section_->validate();
    }
    if (master_section_ == nullptr) {
        master_section_ = make_section(MASTER_SECTION, boost::property_tree::ptree{});
        master_section_->validate();
    }

    if (master_section_->get<unsigned int>("worker_max_seconds") <
        master_section_->get<unsigned int>("worker_min_seconds"))
        throw cfg_exception(fmt::format(R"(section "{}", "worker_max_seconds" is lower than "worker_min_seconds")",
                                        MASTER_SECTION));
}


std::shared_ptr<section_handler> cfg::section(const std::string &sectionname) const
{
    if (boost::iequals(sectionname, GENERAL_SECTION) && general_section_)
        return general_section_;
    if (boost::iequals(sectionname, MASTER_SECTION) && master_section_)
        return master_section_;

    throw cfg_exception(fmt::format("section \"{}\" does not exist", sectionname));
}


std::shared_ptr<section_handler> cfg::make_section(const std::string &name, const boost::property_tree::ptree &pt)
{
    if (boost::iequals(name, GENERAL_SECTION))
        return std::make_shared<general_section_handler>(name, pt);
    else if (boost::iequals(name, MASTER_SECTION))
        return std::make_shared<master_section_handler>(name, pt);
    else
        throw cfg_exception(fmt::format("unknown section \"{}\"", name));
}

} // namespace sigq::cfg
