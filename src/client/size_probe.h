#pragma once
#include "status.h"

#include <cstdint>
#include <string>
#include <utility>

// Discovers the content length of a remote resource.
class SizeProbe {
  public:
    virtual ~SizeProbe() = default;
    virtual std::pair<Status, uint64_t> probe_size(const std::string &url) = 0;
};
