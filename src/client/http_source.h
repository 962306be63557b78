#ifndef HTTP_SOURCE_H
#define HTTP_SOURCE_H

#include "remote_source.h"
#include "status.h"

#include <brpc/controller.h>
#include <brpc/http_method.h>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

/**
 * RemoteSource over plain HTTP(S), using brpc's HTTP client.
 *
 * Redirects are followed by hand up to max_redirects hops. Redirect targets
 * are remembered for the lifetime of the source; content is never kept.
 */
class HttpSource : public RemoteSource {
  public:
    HttpSource(int timeout_ms, int max_redirects)
        : timeout_ms_(timeout_ms), max_redirects_(max_redirects) {}
    ~HttpSource() override = default;

    std::pair<Status, uint64_t> probe_size(const std::string &url) override;
    std::pair<Status, size_t> read(const std::string &url, Slice &dst,
                                   off_t offset) override;

    // "bytes=<offset>-<offset + size - 1>"
    static std::string range_header(uint64_t offset, uint64_t size);
    static bool is_redirect(int status_code);
    static std::pair<Status, uint64_t>
    parse_content_length(const std::string &value);
    // Resolves a Location header against the URL that produced it.
    static std::string resolve_location(const std::string &base,
                                        const std::string &location);
    // "https://host:port/path" -> "host"
    static std::string url_host(const std::string &url);

    // Records that url answered a ranged GET with 200. Logs a WARNING and
    // returns true the first time only.
    bool note_range_ignored(const std::string &url);

  private:
    int timeout_ms_;
    int max_redirects_;

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::string> redirects_;
    std::unordered_set<std::string> range_ignored_;

    // Issues method against url, following redirects. On success cntl holds
    // the final, non-redirect response whatever its status code.
    Status call(const std::string &url, brpc::HttpMethod method,
                const std::string &range, brpc::Controller *cntl);

    std::string effective_url(const std::string &url) const;
    void remember_redirect(const std::string &url, const std::string &target);
};

#endif // HTTP_SOURCE_H
