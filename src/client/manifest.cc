#include "manifest.h"
#include "attributes.pb.h"
#include "util.h"

#include <butil/logging.h>
#include <fstream>
#include <google/protobuf/util/json_util.h>
#include <sstream>

std::pair<Status, FileMap> parse_manifest(const std::string &json) {
    Manifest manifest;
    auto st = google::protobuf::util::JsonStringToMessage(json, &manifest);
    if (!st.ok()) {
        return {Status::Corruption("Malformed manifest: " + st.ToString()),
                FileMap()};
    }
    if (manifest.files().empty()) {
        return {Status::InvalidArgument("Manifest lists no files"), FileMap()};
    }

    FileMap files;
    for (const auto &entry : manifest.files()) {
        const std::string &name = entry.first;
        const std::string &url = entry.second;
        if (!is_valid_name(name)) {
            return {Status::InvalidArgument("Invalid file name '" + name + "'"),
                    FileMap()};
        }
        if (!has_prefix(url, "http://") && !has_prefix(url, "https://")) {
            return {Status::InvalidArgument("Unsupported URL for '" + name +
                                            "': " + url),
                    FileMap()};
        }
        files.emplace(name, url);
    }
    return {Status::OK(), std::move(files)};
}

std::pair<Status, FileMap> load_manifest(const std::string &path) {
    std::ifstream in(path);
    if (!in) {
        return {Status::IOError("Cannot open manifest " + path), FileMap()};
    }
    std::stringstream buf;
    buf << in.rdbuf();
    if (in.bad()) {
        return {Status::IOError("Cannot read manifest " + path), FileMap()};
    }

    auto [s, files] = parse_manifest(buf.str());
    if (!s.ok()) {
        return {s, FileMap()};
    }
    LOG(INFO) << "Loaded " << files.size() << " entries from " << path;
    return {Status::OK(), std::move(files)};
}
