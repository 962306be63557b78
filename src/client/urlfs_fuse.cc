#include "urlfs_fuse.h"
#include "attributes.h"
#include "fuse_mapping.h"
#include "gateway.h"
#include "slice.h"
#include "status.h"

#include <butil/logging.h>
#include <cerrno>
#include <fcntl.h>
#include <sys/types.h>

static MountContext *mount_context() {
    return static_cast<MountContext *>(fuse_get_context()->private_data);
}

void *urlfs_init(struct fuse_conn_info * /*conn*/, struct fuse_config *cfg) {
    MountContext *ctx = mount_context();
    // Report the registry's inode numbers instead of libfuse's own.
    cfg->use_ino = 1;
    cfg->entry_timeout = ctx->options.attr_timeout_sec;
    cfg->attr_timeout = ctx->options.attr_timeout_sec;
    cfg->negative_timeout = 0;
    LOG(INFO) << "Mounted " << ctx->options.fsname << " with "
              << ctx->gateway->registry().size() << " files";
    return ctx;
}

int urlfs_getattr(const char *path, struct stat *stbuf,
                  struct fuse_file_info * /*fi*/) {
    Status s = mount_context()->gateway->getattr(path, stbuf);
    // Lookups of absent names are routine; only log real failures.
    if (!s.ok() && !s.is_not_found()) {
        LOG(ERROR) << "getattr " << path << ": " << s.ToString();
    }
    return status_to_errno(s);
}

int urlfs_access(const char * /*path*/, int mask) {
    // Permission bits are the only access model; writes are never allowed.
    if (mask & W_OK) {
        return -EACCES;
    }
    return 0;
}

int urlfs_readdir(const char *path, void *buf, fuse_fill_dir_t filler,
                  off_t /*offset*/, struct fuse_file_info * /*fi*/,
                  enum fuse_readdir_flags /*flags*/) {
    auto [s, entries] = mount_context()->gateway->readdir(path);
    if (!s.ok()) {
        LOG(ERROR) << "readdir " << path << ": " << s.ToString();
        return readdir_errno(s);
    }

    for (const auto &entry : entries) {
        struct stat st;
        attr_to_stat(entry.attributes(), &st);
        if (filler(buf, entry.name().c_str(), &st, 0,
                   static_cast<fuse_fill_dir_flags>(0))) {
            break;
        }
    }
    return 0;
}

int urlfs_open(const char *path, struct fuse_file_info *fi) {
    if (fi == NULL) {
        LOG(ERROR) << "File info is null for path: " << path;
        return -EINVAL;
    }

    auto [s, of] = mount_context()->gateway->open(path, fi->flags);
    if (!s.ok()) {
        LOG(WARNING) << "open " << path << ": " << s.ToString();
        return status_to_errno(s);
    }

    fi->fh = reinterpret_cast<uint64_t>(of);
    OpenMode mode = open_mode(*of);
    fi->direct_io = mode.direct_io ? 1 : 0;
    fi->keep_cache = mode.keep_cache ? 1 : 0;
    return 0;
}

int urlfs_read(const char *path, char *buf, size_t size, off_t offset,
               struct fuse_file_info *fi) {
    if (fi == NULL || fi->fh == 0) {
        LOG(ERROR) << "read on unopened file: " << path;
        return -EBADF;
    }

    OpenFile *of = reinterpret_cast<OpenFile *>(fi->fh);
    Slice result(buf, size);
    auto [s, n] = mount_context()->gateway->read(of, result, offset);
    if (!s.ok()) {
        LOG(ERROR) << "Error reading " << path << ": " << s.ToString();
        return status_to_errno(s);
    }
    return static_cast<int>(n);
}

int urlfs_release(const char *path, struct fuse_file_info *fi) {
    OpenFile *of = reinterpret_cast<OpenFile *>(fi->fh);
    Status s = mount_context()->gateway->release(of);
    if (!s.ok()) {
        LOG(ERROR) << "release " << path << ": " << s.ToString();
        return status_to_errno(s);
    }

    fi->fh = 0; // Reset file handle
    return 0;
}
