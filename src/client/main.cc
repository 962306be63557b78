#include "gateway.h"
#include "http_source.h"
#include "manifest.h"
#include "options.h"
#include "urlfs_fuse.h"

#include <butil/logging.h>
#include <gflags/gflags.h>
#include <memory>
#include <string>
#include <utility>
#include <vector>

DEFINE_string(manifest, "", "JSON file mapping file names to URLs");
DEFINE_string(fsname, "urlfs", "Filesystem name shown in the mount table");
DEFINE_int32(http_timeout_ms, 5000, "Timeout of a single HTTP request");
DEFINE_int32(max_redirects, 10, "Maximum number of redirects to follow");
DEFINE_bool(probe_size, true,
            "Discover file sizes with HEAD requests instead of reporting 0");
DEFINE_double(attr_timeout_sec, 1.0,
              "How long the kernel may cache attributes and entries");

int main(int argc, char *argv[]) {
    gflags::SetUsageMessage("urlfs --manifest=<files.json> [fuse options] "
                            "<mountpoint>");
    gflags::ParseCommandLineFlags(&argc, &argv, /*remove_flags=*/true);

    Options options;
    options.manifest_path = FLAGS_manifest;
    options.fsname = FLAGS_fsname;
    options.http_timeout_ms = FLAGS_http_timeout_ms;
    options.max_redirects = FLAGS_max_redirects;
    options.probe_size = FLAGS_probe_size;
    options.attr_timeout_sec = FLAGS_attr_timeout_sec;

    if (options.manifest_path.empty()) {
        LOG(ERROR) << "--manifest is required";
        return 1;
    }

    auto [s, files] = load_manifest(options.manifest_path);
    if (!s.ok()) {
        LOG(ERROR) << "Failed to load manifest: " << s.ToString();
        return 1;
    }

    auto gateway = std::make_unique<Gateway>(
        std::move(files),
        std::make_unique<HttpSource>(options.http_timeout_ms,
                                     options.max_redirects),
        options.probe_size);
    MountContext ctx{gateway.get(), options};

    std::vector<char *> fuse_argv(argv, argv + argc);
    std::string mount_opts = "ro,fsname=" + options.fsname;
    fuse_argv.push_back(const_cast<char *>("-o"));
    fuse_argv.push_back(const_cast<char *>(mount_opts.c_str()));

    int ret = fuse_main(static_cast<int>(fuse_argv.size()), fuse_argv.data(),
                        &urlfs_oper, &ctx);
    LOG(INFO) << "Unmounted " << options.fsname;
    return ret;
}
