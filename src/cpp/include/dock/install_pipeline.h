#pragma once

#include <mutex>
#include <set>
#include <string>
#include "dependency_environment.h"
#include "events.h"
#include "model_store.h"
#include "model_types.h"
#include "utils/http_client.h"

namespace dock {

// Turns a catalog entry into weights on disk plus a ready dependency environment.
//
// Stages run in order and the first failure stops the pipeline:
//   1. create the shared dependency environment (skipped if present)
//   2. stream the weights file to disk (skipped if the weights are already there)
//   3. install the model's packages into the environment
//   4. write the store's deps marker
//
// Every install emits install-progress events with non-decreasing progress and
// ends with exactly one `completed` or `error` event. A model the store reports
// as INSTALLED produces a single `completed` event and nothing else, so a run
// whose package step failed is picked up again on the next install.
class InstallPipeline {
public:
    InstallPipeline(ModelStore& store, DependencyEnvironment& environment);

    // Throws the stage's DockException after the `error` event has been emitted
    void install(const ModelDescriptor& model, IEventSink& sink);

    void set_download_options(const utils::DownloadOptions& options) { download_options_ = options; }

private:
    class ProgressReporter;

    void run_stages(const ModelDescriptor& model, ProgressReporter& reporter);
    void download_weights(const ModelDescriptor& model, ProgressReporter& reporter);

    ModelStore& store_;
    DependencyEnvironment& environment_;
    utils::DownloadOptions download_options_;

    std::mutex in_progress_mutex_;
    std::set<std::string> in_progress_;
};

} // namespace dock
