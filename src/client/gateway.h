#ifndef GATEWAY_H
#define GATEWAY_H

#include "attributes.h"
#include "attributes.pb.h"
#include "file_registry.h"
#include "remote_source.h"
#include "size_cache.h"
#include "slice.h"
#include "status.h"

#include <cstdint>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <sys/types.h>
#include <utility>
#include <vector>

// State of one open() on a file. Owned by the kernel via fuse_file_info::fh
// between open and release.
struct OpenFile {
    std::string name;
    std::string url;
    uint64_t inode;
    // True when the size reported by getattr is the real, nonzero length.
    bool size_known;
};

/**
 * One mount session: the registry of the mount's files, the attribute
 * synthesizer and the remote backend.
 *
 * Paths are mount-relative ("/" or "/<name>"). The namespace is flat, so
 * any deeper path does not exist.
 */
class Gateway {
  public:
    // source may be null, in which case sizes are not probed and reads fail.
    // With probe_size false no HEAD request is ever sent.
    Gateway(FileMap files, std::unique_ptr<RemoteSource> source,
            bool probe_size);
    ~Gateway() = default;

    Status getattr(const std::string &path, struct stat *stbuf);
    std::pair<Status, std::vector<Dirent>> readdir(const std::string &path);
    std::pair<Status, OpenFile *> open(const std::string &path, int flags);
    std::pair<Status, size_t> read(OpenFile *of, Slice &dst, off_t offset);
    Status release(OpenFile *of);

    const FileRegistry &registry() const { return registry_; }

  private:
    FileRegistry registry_;
    std::unique_ptr<RemoteSource> source_;
    // Null unless sizes are probed.
    std::unique_ptr<SizeCache> sizes_;
    AttributeSynthesizer synthesizer_;

    // Resolves "/<name>", assigns its inode and builds its attributes.
    std::pair<Status, Attributes> lookup(const std::string &path);
};

#endif // GATEWAY_H
