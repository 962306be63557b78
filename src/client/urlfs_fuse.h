#ifndef URLFS_FUSE_H
#define URLFS_FUSE_H

#include <fuse.h>
#include <string.h>
#include <sys/stat.h>
#include <unistd.h>

#include "options.h"

// Passed to fuse_main as private_data.
class Gateway;
struct MountContext {
    Gateway *gateway;
    Options options;
};

void *urlfs_init(struct fuse_conn_info *conn, struct fuse_config *cfg);
int urlfs_getattr(const char *path, struct stat *stbuf,
                  struct fuse_file_info *fi);
int urlfs_access(const char *path, int mask);
int urlfs_readdir(const char *path, void *buf, fuse_fill_dir_t filler,
                  off_t offset, struct fuse_file_info *fi,
                  enum fuse_readdir_flags flags);
int urlfs_open(const char *path, struct fuse_file_info *fi);
int urlfs_read(const char *path, char *buf, size_t size, off_t offset,
               struct fuse_file_info *fi);
int urlfs_release(const char *path, struct fuse_file_info *fi);

// Read-only: every mutating operation is left NULL.
static const struct fuse_operations urlfs_oper = {.getattr = urlfs_getattr,
                                                  .readlink = NULL,
                                                  .mknod = NULL,
                                                  .mkdir = NULL,
                                                  .unlink = NULL,
                                                  .rmdir = NULL,
                                                  .symlink = NULL,
                                                  .rename = NULL,
                                                  .link = NULL,
                                                  .chmod = NULL,
                                                  .chown = NULL,
                                                  .truncate = NULL,
                                                  .open = urlfs_open,
                                                  .read = urlfs_read,
                                                  .write = NULL,
                                                  .statfs = NULL,
                                                  .flush = NULL,
                                                  .release = urlfs_release,
                                                  .fsync = NULL,
                                                  .setxattr = NULL,
                                                  .getxattr = NULL,
                                                  .listxattr = NULL,
                                                  .removexattr = NULL,
                                                  .opendir = NULL,
                                                  .readdir = urlfs_readdir,
                                                  .releasedir = NULL,
                                                  .fsyncdir = NULL,
                                                  .init = urlfs_init,
                                                  .destroy = NULL,
                                                  .access = urlfs_access,
                                                  .create = NULL,
                                                  .lock = NULL,
                                                  .utimens = NULL,
                                                  .bmap = NULL,
                                                  .ioctl = NULL,
                                                  .poll = NULL,
                                                  .write_buf = NULL,
                                                  .read_buf = NULL,
                                                  .flock = NULL,
                                                  .fallocate = NULL,
                                                  .copy_file_range = NULL,
                                                  .lseek = NULL};
#endif // URLFS_FUSE_H
