#include "file_registry.h"

#include <algorithm>
#include <butil/logging.h>
#include <mutex>

std::pair<std::string, bool>
FileRegistry::resolve(const std::string &name) const {
    std::shared_lock lk(mu_);
    auto it = files_.find(name);
    if (it == files_.end()) {
        return {"", false};
    }
    return {it->second, true};
}

uint64_t FileRegistry::assign_inode(const std::string &name) {
    std::unique_lock lk(mu_);
    return assign_inode_unlocked(name);
}

std::pair<Status, uint64_t>
FileRegistry::assign_known_inode(const std::string &name) {
    std::unique_lock lk(mu_);
    if (files_.find(name) == files_.end()) {
        return {Status::NotFound("No URL registered for " + name), 0};
    }
    return {Status::OK(), assign_inode_unlocked(name)};
}

std::pair<bool, uint64_t>
FileRegistry::find_inode(const std::string &name) const {
    std::shared_lock lk(mu_);
    auto it = inodes_.find(name);
    if (it == inodes_.end()) {
        return {false, 0};
    }
    return {true, it->second};
}

std::vector<std::string> FileRegistry::names() const {
    std::vector<std::string> result;
    result.reserve(files_.size());
    for (const auto &kv : files_) {
        result.push_back(kv.first);
    }
    std::sort(result.begin(), result.end());
    return result;
}

// Caller holds mu_ exclusively.
uint64_t FileRegistry::assign_inode_unlocked(const std::string &name) {
    auto it = inodes_.find(name);
    if (it != inodes_.end()) {
        return it->second;
    }

    uint64_t inode = next_inode_++;
    inodes_.emplace(name, inode);
    VLOG(1) << "Assigned inode " << inode << " to '" << name << "'";
    return inode;
}
