#pragma once

#include <cstddef>
#include <functional>
#include <string>

namespace dock {
namespace utils {

// Called after every received chunk with (bytes so far, total bytes or 0 if unknown).
// Returns bool: true = continue download, false = cancel download
using ProgressCallback = std::function<bool(size_t, size_t)>;

struct DownloadOptions {
    int connect_timeout = 30;  // seconds
    int read_timeout = 60;     // seconds without data before giving up
};

struct DownloadResult {
    bool success = false;
    bool cancelled = false;
    int status_code = 0;
    size_t bytes_downloaded = 0;
    size_t bytes_total = 0;
    std::string error_message;
};

class HttpClient {
public:
    // Stream a GET response body straight into output_path (truncating it).
    // Redirects are followed. Never throws for network errors; see DownloadResult.
    static DownloadResult download_file(const std::string& url,
                                        const std::string& output_path,
                                        ProgressCallback progress_callback = nullptr,
                                        const DownloadOptions& options = DownloadOptions());

    // True if GET url answers with a 2xx status within timeout_ms
    static bool is_reachable(const std::string& url, int timeout_ms = 1000);

    // Split "scheme://host[:port]/path?query" into ("scheme://host[:port]", "/path?query").
    // Returns false if the URL has no scheme or host.
    static bool split_url(const std::string& url, std::string& base, std::string& path);
};

} // namespace utils
} // namespace dock
