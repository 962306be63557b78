#include "attributes.h"

#include <butil/logging.h>
#include <cstring>
#include <time.h>
#include <unistd.h>

Attributes AttributeSynthesizer::root_attributes() const {
    Attributes a;
    fill_common(&a);
    a.set_inode(kRootInode);
    a.set_mode(S_IFDIR | 0755);
    a.set_nlink(2);
    a.set_size(0);
    a.set_blocks(0);
    return a;
}

std::pair<Status, Attributes>
AttributeSynthesizer::file_attributes(const std::string &name) const {
    auto [found, inode] = registry_.find_inode(name);
    if (!found) {
        return {Status::NotFound("No inode assigned to " + name), Attributes()};
    }

    Attributes a;
    fill_common(&a);
    a.set_inode(inode);
    a.set_mode(S_IFREG | 0444);
    a.set_nlink(1);

    // Zero unless the remote length can be discovered.
    uint64_t size = probed_size(name);
    a.set_size(size);
    a.set_blocks((size + 511) / 512);
    return {Status::OK(), a};
}

void AttributeSynthesizer::fill_common(Attributes *a) const {
    struct timespec now;
    clock_gettime(CLOCK_REALTIME, &now);

    a->set_block_size(kBlockSize);
    a->set_user_id(geteuid());
    a->set_group_id(getegid());
    a->set_access_time(now.tv_sec);
    a->set_access_time_nsec(now.tv_nsec);
    a->set_modification_time(now.tv_sec);
    a->set_modification_time_nsec(now.tv_nsec);
    a->set_change_time(now.tv_sec);
    a->set_change_time_nsec(now.tv_nsec);
}

uint64_t AttributeSynthesizer::probed_size(const std::string &name) const {
    if (probe_ == nullptr) {
        return 0;
    }
    auto [url, found] = registry_.resolve(name);
    if (!found) {
        return 0;
    }
    auto [s, size] = probe_->probe_size(url);
    if (!s.ok()) {
        LOG(WARNING) << "Size probe for '" << name
                     << "' failed: " << s.ToString();
        return 0;
    }
    return size;
}

void attr_to_stat(const Attributes &a, struct stat *st) {
    memset(st, 0, sizeof(struct stat));
    st->st_ino = a.inode();
    st->st_mode = a.mode();
    st->st_nlink = a.nlink();
    st->st_size = a.size();
    st->st_blocks = a.blocks();
    st->st_blksize = a.block_size();
    st->st_uid = a.user_id();
    st->st_gid = a.group_id();
    st->st_atim.tv_sec = a.access_time();
    st->st_atim.tv_nsec = a.access_time_nsec();
    st->st_mtim.tv_sec = a.modification_time();
    st->st_mtim.tv_nsec = a.modification_time_nsec();
    st->st_ctim.tv_sec = a.change_time();
    st->st_ctim.tv_nsec = a.change_time_nsec();
}
