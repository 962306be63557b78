#include "gateway.h"
#include "util.h"

#include <butil/logging.h>
#include <fcntl.h>
#include <initializer_list>

Gateway::Gateway(FileMap files, std::unique_ptr<RemoteSource> source,
                 bool probe_size)
    : registry_(std::move(files)), source_(std::move(source)),
      sizes_(probe_size && source_ != nullptr
                 ? std::make_unique<SizeCache>(source_.get())
                 : nullptr),
      synthesizer_(registry_, sizes_.get()) {}

Status Gateway::getattr(const std::string &path, struct stat *stbuf) {
    if (split_path(path).empty()) {
        attr_to_stat(synthesizer_.root_attributes(), stbuf);
        return Status::OK();
    }

    auto [s, attr] = lookup(path);
    if (!s.ok()) {
        return s;
    }
    attr_to_stat(attr, stbuf);
    return Status::OK();
}

std::pair<Status, std::vector<Dirent>>
Gateway::readdir(const std::string &path) {
    std::vector<Dirent> entries;
    if (!split_path(path).empty()) {
        auto [s, attr] = lookup(path);
        if (!s.ok()) {
            return {s, entries};
        }
        return {Status::InvalidArgument(path + " is not a directory"),
                entries};
    }

    Attributes root = synthesizer_.root_attributes();
    for (const char *dot : {".", ".."}) {
        Dirent d;
        d.set_name(dot);
        *d.mutable_attributes() = root;
        entries.push_back(std::move(d));
    }

    for (const auto &name : registry_.names()) {
        auto [s, attr] = lookup("/" + name);
        if (!s.ok()) {
            LOG(ERROR) << "readdir: skipping '" << name
                       << "': " << s.ToString();
            continue;
        }
        Dirent d;
        d.set_name(name);
        *d.mutable_attributes() = std::move(attr);
        entries.push_back(std::move(d));
    }
    return {Status::OK(), std::move(entries)};
}

std::pair<Status, OpenFile *> Gateway::open(const std::string &path,
                                            int flags) {
    if ((flags & O_ACCMODE) != O_RDONLY) {
        return {Status::PermissionDenied("Read-only filesystem: " + path),
                nullptr};
    }
    auto parts = split_path(path);
    if (parts.empty()) {
        return {Status::InvalidArgument("Cannot open the root as a file"),
                nullptr};
    }
    if (parts.size() > 1) {
        return {Status::NotFound(path), nullptr};
    }

    auto [s, attr] = lookup(path);
    if (!s.ok()) {
        return {s, nullptr};
    }
    const std::string &name = parts[0];
    auto [url, found] = registry_.resolve(name);

    // Same size the kernel got from getattr, so reads are clipped at the
    // real length or not at all.
    bool size_known = sizes_ != nullptr && attr.size() > 0;

    auto *of = new OpenFile{name, url, attr.inode(), size_known};
    VLOG(1) << "open: '" << name << "' inode=" << attr.inode()
            << " size_known=" << size_known;
    return {Status::OK(), of};
}

std::pair<Status, size_t> Gateway::read(OpenFile *of, Slice &dst,
                                        off_t offset) {
    if (of == nullptr) {
        return {Status::InvalidArgument("Read on a file that is not open"), 0};
    }
    if (source_ == nullptr) {
        return {Status::IOError("No remote source for " + of->url), 0};
    }
    return source_->read(of->url, dst, offset);
}

Status Gateway::release(OpenFile *of) {
    if (of == nullptr) {
        return Status::InvalidArgument("Release of a file that is not open");
    }
    delete of;
    return Status::OK();
}

std::pair<Status, Attributes> Gateway::lookup(const std::string &path) {
    auto parts = split_path(path);
    if (parts.size() != 1) {
        return {Status::NotFound(path), Attributes()};
    }

    const std::string &name = parts[0];
    auto [url, found] = registry_.resolve(name);
    if (!found) {
        return {Status::NotFound(path), Attributes()};
    }
    auto [s, inode] = registry_.assign_known_inode(name);
    if (!s.ok()) {
        return {s, Attributes()};
    }
    return synthesizer_.file_attributes(name);
}
