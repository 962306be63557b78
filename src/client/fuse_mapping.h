#pragma once
#include "gateway.h"
#include "status.h"

// Negative errno for a failed operation; 0 for OK.
int status_to_errno(const Status &s);

// readdir on a file answers ENOTDIR rather than EINVAL.
int readdir_errno(const Status &s);

// Kernel page-cache policy for an open file.
struct OpenMode {
    bool direct_io;
    bool keep_cache;
};

// Files without a known length bypass the page cache, otherwise the kernel
// clips reads at the zero size getattr reported.
OpenMode open_mode(const OpenFile &of);
