#pragma once
#include "size_probe.h"
#include "slice.h"
#include "status.h"

#include <string>
#include <sys/types.h>
#include <utility>

// Remote backend of the mount: size discovery plus ranged content reads.
class RemoteSource : public SizeProbe {
  public:
    // Reads up to dst.size() bytes of url starting at offset into dst and
    // returns the number of bytes produced. Zero means end of file.
    virtual std::pair<Status, size_t> read(const std::string &url, Slice &dst,
                                           off_t offset) = 0;
};
