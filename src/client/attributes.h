#ifndef ATTRIBUTES_H
#define ATTRIBUTES_H

#include "attributes.pb.h"
#include "file_registry.h"
#include "size_probe.h"
#include "status.h"

#include <cstdint>
#include <string>
#include <sys/stat.h>
#include <utility>

// Preferred I/O size reported for every entry.
constexpr uint32_t kBlockSize = 4096;

/**
 * Builds the attribute records served for the mount root and its files.
 *
 * Timestamps are the wall clock at query time and ownership is the
 * process's effective uid/gid. File sizes are reported as 0 unless a size
 * probe is attached and succeeds.
 */
class AttributeSynthesizer {
  public:
    AttributeSynthesizer(const FileRegistry &registry,
                         SizeProbe *probe = nullptr)
        : registry_(registry), probe_(probe) {}

    Attributes root_attributes() const;

    // Fails with NotFound if name has not been assigned an inode yet.
    std::pair<Status, Attributes> file_attributes(const std::string &name) const;

  private:
    const FileRegistry &registry_;
    SizeProbe *probe_; // Not owned, may be null.

    void fill_common(Attributes *a) const;
    uint64_t probed_size(const std::string &name) const;
};

void attr_to_stat(const Attributes &a, struct stat *st);

#endif // ATTRIBUTES_H
