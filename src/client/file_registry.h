#ifndef FILE_REGISTRY_H
#define FILE_REGISTRY_H

#include "status.h"

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Inode of the mount root (FUSE_ROOT_ID). Never handed out by the registry.
constexpr uint64_t kRootInode = 1;
// First inode the registry assigns to a file.
constexpr uint64_t kFirstInode = 2;

// Entry name -> backing URL.
using FileMap = std::unordered_map<std::string, std::string>;

/**
 * Identity registry of one mount session.
 *
 * Holds the name -> URL map the mount was started with and the lazily built
 * name -> inode map. The URL map is never modified after construction. The
 * inode map only grows, and inodes are never reused for another name.
 */
class FileRegistry {
  public:
    explicit FileRegistry(FileMap files)
        : files_(std::move(files)), next_inode_(kFirstInode) {}

    FileRegistry(const FileRegistry &) = delete;
    FileRegistry &operator=(const FileRegistry &) = delete;

    // Returns the backing URL of name and whether name is known.
    std::pair<std::string, bool> resolve(const std::string &name) const;

    // Returns the inode of name, assigning the next free one on first use.
    // Does not consult the URL map: callers must resolve name first.
    uint64_t assign_inode(const std::string &name);

    // Same as assign_inode, but fails with NotFound for names that have no
    // URL instead of registering them.
    std::pair<Status, uint64_t> assign_known_inode(const std::string &name);

    // Current inode of name, without assigning one.
    std::pair<bool, uint64_t> find_inode(const std::string &name) const;

    // All configured names, sorted.
    std::vector<std::string> names() const;

    size_t size() const { return files_.size(); }

  private:
    mutable std::shared_mutex mu_;

    const FileMap files_;
    std::unordered_map<std::string, uint64_t> inodes_;
    uint64_t next_inode_;

    uint64_t assign_inode_unlocked(const std::string &name);
};

#endif // FILE_REGISTRY_H
