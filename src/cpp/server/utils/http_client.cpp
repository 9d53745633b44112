#include "dock/utils/http_client.h"
#include <chrono>
#include <fstream>
#include <httplib.h>

namespace dock {
namespace utils {

bool HttpClient::split_url(const std::string& url, std::string& base, std::string& path) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos || scheme_end == 0) {
        return false;
    }

    size_t host_start = scheme_end + 3;
    size_t path_start = url.find('/', host_start);
    if (path_start == std::string::npos) {
        base = url;
        path = "/";
    } else {
        base = url.substr(0, path_start);
        path = url.substr(path_start);
    }
    return base.size() > host_start;
}

DownloadResult HttpClient::download_file(const std::string& url,
                                         const std::string& output_path,
                                         ProgressCallback progress_callback,
                                         const DownloadOptions& options) {
    DownloadResult result;

    std::string base;
    std::string path;
    if (!split_url(url, base, path)) {
        result.error_message = "Invalid URL: " + url;
        return result;
    }

    httplib::Client client(base);
    if (!client.is_valid()) {
        result.error_message = "Unsupported URL scheme: " + url;
        return result;
    }
    client.set_follow_location(true);
    client.set_connection_timeout(options.connect_timeout, 0);
    client.set_read_timeout(options.read_timeout, 0);

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        result.error_message = "Failed to open " + output_path + " for writing";
        return result;
    }

    bool bad_status = false;
    bool write_failed = false;

    auto response = client.Get(
        path, httplib::Headers(),
        [&](const httplib::Response& res) {
            result.status_code = res.status;
            if (res.status < 200 || res.status >= 300) {
                bad_status = true;
                return false;
            }
            if (res.has_header("Content-Length")) {
                try {
                    result.bytes_total = std::stoull(res.get_header_value("Content-Length"));
                } catch (const std::exception&) {
                    result.bytes_total = 0;
                }
            }
            return true;
        },
        [&](const char* data, size_t length) {
            out.write(data, static_cast<std::streamsize>(length));
            if (!out) {
                write_failed = true;
                return false;
            }
            result.bytes_downloaded += length;
            if (progress_callback && !progress_callback(result.bytes_downloaded, result.bytes_total)) {
                result.cancelled = true;
                return false;
            }
            return true;
        });

    out.close();

    if (result.cancelled) {
        result.error_message = "Download cancelled";
        return result;
    }
    if (bad_status) {
        result.error_message = "Server responded with HTTP " + std::to_string(result.status_code);
        return result;
    }
    if (write_failed) {
        result.error_message = "Failed writing to " + output_path;
        return result;
    }
    if (!response) {
        result.error_message = "Request failed: " + httplib::to_string(response.error());
        return result;
    }
    if (result.bytes_total > 0 && result.bytes_downloaded != result.bytes_total) {
        result.error_message = "Connection closed after " + std::to_string(result.bytes_downloaded) +
                               " of " + std::to_string(result.bytes_total) + " bytes";
        return result;
    }

    result.success = true;
    return result;
}

bool HttpClient::is_reachable(const std::string& url, int timeout_ms) {
    std::string base;
    std::string path;
    if (!split_url(url, base, path)) {
        return false;
    }

    httplib::Client client(base);
    if (!client.is_valid()) {
        return false;
    }
    auto timeout = std::chrono::milliseconds(timeout_ms);
    client.set_connection_timeout(timeout);
    client.set_read_timeout(timeout);

    auto response = client.Get(path);
    return response && response->status >= 200 && response->status < 300;
}

} // namespace utils
} // namespace dock
