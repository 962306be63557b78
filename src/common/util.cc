#include "util.h"
#include <sstream>
#include <string>
#include <vector>

std::vector<std::string> split_path(const std::string &path) {
    std::vector<std::string> result;
    if (path.empty() || path == "/") {
        return result;
    }

    std::istringstream iss(path);
    std::string token;
    while (std::getline(iss, token, '/')) {
        if (!token.empty()) {
            result.push_back(token);
        }
    }

    return result;
}

bool is_valid_name(const std::string &name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos &&
           name.find('\0') == std::string::npos;
}

bool has_prefix(const std::string &s, const std::string &prefix) {
    return s.size() >= prefix.size() &&
           s.compare(0, prefix.size(), prefix) == 0;
}
