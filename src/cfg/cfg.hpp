#pragma once
#include <boost/lexical_cast.hpp>
#include <boost/property_tree/ptree.hpp>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace sigq::cfg {

inline const std::string GENERAL_SECTION = "general";
inline const std::string MASTER_SECTION = "master";


class cfg_exception : public std::runtime_error {
public:
    cfg_exception()
        : runtime_error{"N/A"}
    { }

    explicit cfg_exception(const std::string &what)
        : runtime_error{what}
    { }
};


// base class for section handlers
class section_handler {
public:
    using OptionHandler = std::function<void(const std::string &)>;

    section_handler(std::string name, const boost::property_tree::ptree &pt);
    virtual ~section_handler() = default;

    void validate();
    template<typename T> T get(const std::string &optname) const;
    std::string name() const;

private:
    void fill_defaults(const std::set<std::string> &opts);

protected:
    // accepts a non-negative integer, stored as is
    void process_unsigned(const std::string &optname, const std::string &optval);

    std::string section_name_;
    boost::property_tree::ptree pt_;

    // map holding the options. All values are stored as strings.
    std::map<std::string, std::string> options_;
    // map holding the options as a vector of strings
    // optimization for options that accept a list of comma separated values
    std::map<std::string, std::vector<std::string>> options_split_;

    // map of valid options and the associated handler for the value
    std::map<std::string, OptionHandler> option_handlers_;
    // map holding default values
    std::map<std::string, std::string> defaults_;

    // --- helper maps
    // map used for true/false options
    std::map<std::string, std::string> bool_map_;
};


class general_section_handler final : public section_handler {
public:
    general_section_handler(const std::string &name, const boost::property_tree::ptree &pt);

private:
    void process_daemonize(const std::string &optval);
    void process_log_type(const std::string &optval);
    void process_log_facility(const std::string &optval);
    void process_log_priority(const std::string &optval);

private:
    // helper maps
    std::map<std::string, std::string> log_type_map_;
    std::map<std::string, std::string> log_facility_map_;
    std::map<std::string, std::string> log_priority_map_;
};


class master_section_handler final : public section_handler {
public:
    master_section_handler(const std::string &name, const boost::property_tree::ptree &pt);

private:
    void process_spawn_interval(const std::string &optval);
    void process_sa_flags(const std::string &optval);

private:
    std::map<std::string, int> sa_flags_map_;
};


class cfg {
public:
    cfg() = default;
    cfg(const cfg &) = delete;
    cfg &operator=(const cfg &) = delete;

    void init(const std::string &filename);
    void load(std::istream &stream);

    std::shared_ptr<section_handler> section(const std::string &sectionname) const;

private:
    void build_sections();
    static std::shared_ptr<section_handler> make_section(const std::string &name,
                                                         const boost::property_tree::ptree &pt);

private:
    boost::property_tree::ptree pt_;
    std::shared_ptr<section_handler> general_section_;
    std::shared_ptr<section_handler> master_section_;
};


template<typename T> T section_handler::get(const std::string &optname) const
{
    const auto it = options_.find(optname);
    if (it == options_.end())
        throw cfg_exception("Option \"" + optname + "\" is invalid in section \"" + section_name_ + "\"");

    return boost::lexical_cast<T>(it->second);
}


template<> inline std::vector<std::string> section_handler::get(const std::string &optname) const
{
    const auto it = options_split_.find(optname);
    if (it == options_split_.end())
        throw cfg_exception("Option \"" + optname + "\" is invalid in section \"" + section_name_ + "\"");

    return it->second;
}


inline std::string section_handler::name() const
{
    return section_name_;
}

} // namespace sigq::cfg
