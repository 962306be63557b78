#ifndef SIZE_CACHE_H
#define SIZE_CACHE_H

#include "size_probe.h"
#include "status.h"

#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>

/**
 * SizeProbe that asks the wrapped probe at most once per URL for the
 * lifetime of the mount. Failures are remembered as well as sizes, so an
 * unreachable URL costs one request and not one per getattr.
 */
class SizeCache : public SizeProbe {
  public:
    explicit SizeCache(SizeProbe *probe) : probe_(probe) {}

    std::pair<Status, uint64_t> probe_size(const std::string &url) override;

  private:
    SizeProbe *probe_; // Not owned.

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::pair<Status, uint64_t>> results_;
};

#endif // SIZE_CACHE_H
