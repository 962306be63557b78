#include "http_source.h"
#include "util.h"

#include <brpc/channel.h>
#include <brpc/errno.pb.h>
#include <brpc/http_status_code.h>
#include <butil/logging.h>
#include <cerrno>
#include <cstdlib>
#include <mutex>

std::pair<Status, uint64_t> HttpSource::probe_size(const std::string &url) {
    brpc::Controller cntl;
    Status s = call(url, brpc::HTTP_METHOD_HEAD, "", &cntl);
    if (!s.ok()) {
        return {s, 0};
    }

    int code = cntl.http_response().status_code();
    if (code == brpc::HTTP_STATUS_NOT_FOUND) {
        return {Status::NotFound("HEAD " + url + " returned 404"), 0};
    }
    if (code < 200 || code >= 300) {
        return {Status::IOError("HEAD " + url + " returned " +
                                std::to_string(code)),
                0};
    }

    const std::string *length = cntl.http_response().GetHeader("Content-Length");
    if (length == nullptr) {
        return {Status::NotFound("HEAD " + url + " has no Content-Length"), 0};
    }
    auto [ps, size] = parse_content_length(*length);
    if (!ps.ok()) {
        return {ps, 0};
    }

    LOG(INFO) << "Size of " << url << " is " << size << " bytes";
    return {Status::OK(), size};
}

std::pair<Status, size_t> HttpSource::read(const std::string &url, Slice &dst,
                                           off_t offset) {
    if (offset < 0) {
        return {Status::InvalidArgument("Negative read offset"), 0};
    }
    if (dst.empty()) {
        return {Status::OK(), 0};
    }

    brpc::Controller cntl;
    Status s = call(url, brpc::HTTP_METHOD_GET,
                    range_header(offset, dst.size()), &cntl);
    if (!s.ok()) {
        return {s, 0};
    }

    const butil::IOBuf &body = cntl.response_attachment();
    int code = cntl.http_response().status_code();
    size_t n = 0;
    if (code == brpc::HTTP_STATUS_PARTIAL_CONTENT) {
        n = body.copy_to(dst.data(), dst.size());
    } else if (code == brpc::HTTP_STATUS_OK) {
        // Range ignored by the server: the whole entity came back.
        note_range_ignored(url);
        n = body.copy_to(dst.data(), dst.size(), static_cast<size_t>(offset));
    } else if (code == brpc::HTTP_STATUS_REQUESTED_RANGE_NOT_SATISFIABLE) {
        n = 0;
    } else if (code == brpc::HTTP_STATUS_NOT_FOUND) {
        return {Status::NotFound("GET " + url + " returned 404"), 0};
    } else {
        return {Status::IOError("GET " + url + " returned " +
                                std::to_string(code)),
                0};
    }

    dst.set_size(n);
    return {Status::OK(), n};
}

Status HttpSource::call(const std::string &url, brpc::HttpMethod method,
                        const std::string &range, brpc::Controller *cntl) {
    std::string target = effective_url(url);

    for (int hop = 0; hop <= max_redirects_; ++hop) {
        brpc::ChannelOptions options;
        options.protocol = brpc::PROTOCOL_HTTP;
        options.timeout_ms = timeout_ms_;
        options.max_retry = 0;
        if (has_prefix(target, "https://")) {
            options.mutable_ssl_options()->sni_name = url_host(target);
        }

        brpc::Channel channel;
        if (channel.Init(target.c_str(), "", &options) != 0) {
            return Status::IOError("Failed to initialize channel to " + target);
        }

        cntl->Reset();
        cntl->http_request().uri() = target;
        cntl->http_request().set_method(method);
        if (!range.empty()) {
            cntl->http_request().SetHeader("Range", range);
        }
        channel.CallMethod(nullptr, cntl, nullptr, nullptr, nullptr);

        // brpc fails the call on any non-2xx status; those are still valid
        // HTTP answers and are left to the caller.
        if (cntl->Failed() && cntl->ErrorCode() != brpc::EHTTP) {
            return Status::IOError(std::string(brpc::HttpMethod2Str(method)) +
                                   " " + target + " failed: " +
                                   cntl->ErrorText());
        }

        int code = cntl->http_response().status_code();
        if (!is_redirect(code)) {
            remember_redirect(url, target);
            return Status::OK();
        }

        const std::string *location = cntl->http_response().GetHeader("Location");
        if (location == nullptr || location->empty()) {
            return Status::IOError("Redirect from " + target +
                                   " without Location");
        }
        std::string next = resolve_location(target, *location);
        VLOG(1) << "Redirect " << code << ": " << target << " -> " << next;
        target = next;
    }

    return Status::IOError("Too many redirects for " + url);
}

std::string HttpSource::effective_url(const std::string &url) const {
    std::shared_lock lk(mu_);
    auto it = redirects_.find(url);
    if (it == redirects_.end()) {
        return url;
    }
    return it->second;
}

void HttpSource::remember_redirect(const std::string &url,
                                   const std::string &target) {
    if (url == target) {
        return;
    }
    std::unique_lock lk(mu_);
    redirects_[url] = target;
}

bool HttpSource::note_range_ignored(const std::string &url) {
    std::unique_lock lk(mu_);
    if (!range_ignored_.insert(url).second) {
        return false;
    }
    LOG(WARNING) << url << " ignores Range requests; every read of it "
                 << "downloads the whole resource";
    return true;
}

std::string HttpSource::range_header(uint64_t offset, uint64_t size) {
    return "bytes=" + std::to_string(offset) + "-" +
           std::to_string(offset + size - 1);
}

bool HttpSource::is_redirect(int status_code) {
    switch (status_code) {
    case 301:
    case 302:
    case 303:
    case 307:
    case 308:
        return true;
    default:
        return false;
    }
}

std::pair<Status, uint64_t>
HttpSource::parse_content_length(const std::string &value) {
    if (value.empty()) {
        return {Status::Corruption("Empty Content-Length"), 0};
    }
    for (char c : value) {
        if (c < '0' || c > '9') {
            return {Status::Corruption("Malformed Content-Length: " + value),
                    0};
        }
    }
    errno = 0;
    unsigned long long v = strtoull(value.c_str(), nullptr, 10);
    if (errno == ERANGE) {
        return {Status::Corruption("Content-Length out of range: " + value),
                0};
    }
    return {Status::OK(), static_cast<uint64_t>(v)};
}

std::string HttpSource::resolve_location(const std::string &base,
                                         const std::string &location) {
    if (location.find("://") != std::string::npos) {
        return location;
    }

    size_t scheme_end = base.find("://");
    if (scheme_end == std::string::npos) {
        return location;
    }
    size_t authority_end = base.find('/', scheme_end + 3);
    std::string origin = authority_end == std::string::npos
                             ? base
                             : base.substr(0, authority_end);

    if (location.compare(0, 2, "//") == 0) {
        return base.substr(0, scheme_end + 1) + location;
    }
    if (!location.empty() && location[0] == '/') {
        return origin + location;
    }

    // Relative to the directory of the base path.
    std::string path = authority_end == std::string::npos
                           ? "/"
                           : base.substr(authority_end);
    size_t query = path.find_first_of("?#");
    if (query != std::string::npos) {
        path.resize(query);
    }
    path.resize(path.find_last_of('/') + 1);
    return origin + path + location;
}

std::string HttpSource::url_host(const std::string &url) {
    size_t start = url.find("://");
    start = (start == std::string::npos) ? 0 : start + 3;
    size_t end = url.find_first_of(":/?#", start);
    if (end == std::string::npos) {
        end = url.size();
    }
    return url.substr(start, end - start);
}
