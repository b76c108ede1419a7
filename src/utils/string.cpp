#include "string.hpp"
#include <string>
#include <system_error>

namespace sigq::utils::string {

std::string str_err(int errnum)
{
    return std::system_category().message(errnum);
}


std::string join(const std::vector<std::string> &src, const std::string &separator)
{
    std::string result;
    for (auto it = src.begin(); it != src.end();) {
        result += *it;
        if (++it != src.end())
            result += separator;
    }
    return result;
}

} // namespace sigq::utils::string
