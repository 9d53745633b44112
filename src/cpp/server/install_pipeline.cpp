#include "dock/install_pipeline.h"
#include "dock/error_types.h"
#include <algorithm>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace dock {

static constexpr double BYTES_PER_MB = 1024.0 * 1024.0;

static std::string format_megabytes(size_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << (bytes / BYTES_PER_MB) << " MB";
    return oss.str();
}

// Stamps events with the model id and keeps the reported progress non-decreasing
class InstallPipeline::ProgressReporter {
public:
    ProgressReporter(const std::string& model_id, IEventSink& sink)
        : model_id_(model_id), sink_(sink) {}

    bool report(InstallStatus status, int progress, const std::string& message,
                bool indeterminate = false) {
        InstallProgress event;
        event.model_id = model_id_;
        event.status = status;
        event.progress = std::max(last_progress_, std::min(progress, 100));
        event.message = message;
        event.indeterminate = indeterminate;
        last_progress_ = event.progress;
        return sink_.on_install_progress(event);
    }

    void fail(const std::exception& error) {
        json payload = ErrorResponse::from_exception(error);

        InstallProgress event;
        event.model_id = model_id_;
        event.status = InstallStatus::ERROR;
        event.progress = last_progress_;
        event.message = payload["error"]["message"].get<std::string>();
        event.error_code = payload["error"]["code"].get<std::string>();
        sink_.on_install_progress(event);
    }

private:
    std::string model_id_;
    IEventSink& sink_;
    int last_progress_ = 0;
};

InstallPipeline::InstallPipeline(ModelStore& store, DependencyEnvironment& environment)
    : store_(store), environment_(environment) {}

void InstallPipeline::install(const ModelDescriptor& model, IEventSink& sink) {
    ProgressReporter reporter(model.id, sink);

    if (store_.is_installed(model)) {
        std::cout << "[InstallPipeline] " << model.id << " already installed, skipping" << std::endl;
        reporter.report(InstallStatus::COMPLETED, 100, "Already installed");
        return;
    }

    {
        std::lock_guard<std::mutex> lock(in_progress_mutex_);
        if (!in_progress_.insert(model.id).second) {
            InvalidRequestException error("Model " + model.id + " is already being installed");
            reporter.fail(error);
            throw error;
        }
    }

    try {
        run_stages(model, reporter);
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lock(in_progress_mutex_);
            in_progress_.erase(model.id);
        }
        std::cerr << "[InstallPipeline] Install of " << model.id << " failed: " << e.what() << std::endl;
        reporter.fail(e);
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(in_progress_mutex_);
        in_progress_.erase(model.id);
    }

    std::cout << "[InstallPipeline] " << model.id << " installed" << std::endl;
    reporter.report(InstallStatus::COMPLETED, 100, "Installation finished! Ready to launch.");
}

void InstallPipeline::run_stages(const ModelDescriptor& model, ProgressReporter& reporter) {
    if (!environment_.exists()) {
        reporter.report(InstallStatus::INSTALLING_DEPS, 0, "Creating dependency environment...");
        environment_.ensure_created();
    }

    if (store_.has_weights(model)) {
        std::cout << "[InstallPipeline] " << model.id << " weights present, resuming at dependencies" << std::endl;
        reporter.report(InstallStatus::DOWNLOADING, 100, "Weights already downloaded");
    } else {
        download_weights(model, reporter);
    }

    if (!model.dependencies.empty()) {
        reporter.report(InstallStatus::INSTALLING_DEPS, 100, "Installing dependencies...");
        environment_.install_packages(model.dependencies);
    }

    store_.mark_dependencies_installed(model);
}

void InstallPipeline::download_weights(const ModelDescriptor& model, ProgressReporter& reporter) {
    std::string weights_path = store_.weights_path(model);
    std::string partial_path = store_.partial_path(model);

    std::error_code ec;
    fs::create_directories(store_.weights_dir(model), ec);
    if (ec) {
        throw DownloadException("Failed to create " + store_.weights_dir(model) + ": " + ec.message());
    }

    std::cout << "[InstallPipeline] Downloading " << model.source.url << std::endl;
    std::cout << "[InstallPipeline] Destination: " << weights_path << std::endl;

    if (!reporter.report(InstallStatus::DOWNLOADING, 0, "Starting download...")) {
        throw DownloadException("Download cancelled");
    }

    int last_percent = 0;
    size_t last_mb = 0;
    auto on_progress = [&](size_t downloaded, size_t total) -> bool {
        if (total > 0) {
            int percent = static_cast<int>(std::min<size_t>(downloaded * 100 / total, 100));
            if (percent == last_percent) {
                return true;
            }
            last_percent = percent;
            return reporter.report(InstallStatus::DOWNLOADING, percent,
                                   format_megabytes(downloaded) + " / " + format_megabytes(total));
        }

        size_t mb = downloaded / static_cast<size_t>(BYTES_PER_MB);
        if (mb == last_mb) {
            return true;
        }
        last_mb = mb;
        return reporter.report(InstallStatus::DOWNLOADING, 0,
                               format_megabytes(downloaded) + " downloaded", true);
    };

    auto result = utils::HttpClient::download_file(model.source.url, partial_path,
                                                   on_progress, download_options_);
    if (!result.success) {
        if (fs::exists(partial_path, ec)) {
            std::cerr << "[InstallPipeline] Partial download left at " << partial_path << std::endl;
        }
        throw DownloadException("Failed to download " + model.source.url + ": " + result.error_message);
    }

    if (last_percent != 100) {
        reporter.report(InstallStatus::DOWNLOADING, 100, "Download complete (" +
                        format_megabytes(result.bytes_downloaded) + ")");
    }

    fs::rename(partial_path, weights_path, ec);
    if (ec) {
        throw DownloadException("Failed to move download into place at " + weights_path +
                                ": " + ec.message());
    }
}

} // namespace dock
