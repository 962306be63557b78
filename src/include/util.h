#ifndef URLFS_UTIL_H
#define URLFS_UTIL_H

#include <string>
#include <vector>

// Non-empty components of path; "/" and "" yield none.
std::vector<std::string> split_path(const std::string &path);

// A valid entry name is a single, non-empty path component.
bool is_valid_name(const std::string &name);

bool has_prefix(const std::string &s, const std::string &prefix);

#endif // URLFS_UTIL_H
