#include "size_cache.h"

#include <butil/logging.h>
#include <mutex>

std::pair<Status, uint64_t> SizeCache::probe_size(const std::string &url) {
    {
        std::shared_lock lk(mu_);
        auto it = results_.find(url);
        if (it != results_.end()) {
            return it->second;
        }
    }

    // Concurrent first lookups of one URL may both reach the source; the
    // first stored result wins.
    auto result = probe_->probe_size(url);
    std::unique_lock lk(mu_);
    auto [it, inserted] = results_.emplace(url, result);
    if (inserted && !result.first.ok()) {
        LOG(WARNING) << "Size of " << url
                     << " unknown for this mount: " << result.first.ToString();
    }
    return it->second;
}
