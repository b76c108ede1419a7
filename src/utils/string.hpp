#pragma once
#include <string>
#include <vector>

namespace sigq::utils::string {

std::string str_err(int errnum);

std::string join(const std::vector<std::string> &src, const std::string &separator = ", ");

} // namespace sigq::utils::string
