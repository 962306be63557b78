#include "fuse_mapping.h"

#include <cerrno>

int status_to_errno(const Status &s) {
    switch (s.code()) {
    case Status::kOk:
        return 0;
    case Status::kNotFound:
        return -ENOENT;
    case Status::kInvalidArgument:
        return -EINVAL;
    case Status::kPermissionDenied:
        return -EACCES;
    case Status::kIOError:
    case Status::kCorruption:
    default:
        return -EIO;
    }
}

int readdir_errno(const Status &s) {
    if (s.is_invalid_argument()) {
        return -ENOTDIR;
    }
    return status_to_errno(s);
}

OpenMode open_mode(const OpenFile &of) {
    if (of.size_known) {
        return {false, true};
    }
    return {true, false};
}
