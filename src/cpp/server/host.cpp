#include "dock/host.h"
#include "dock/error_types.h"
#include "dock/utils/path_utils.h"
#include <iostream>

namespace dock {

static std::unique_ptr<Catalog> open_catalog(const std::string& catalog_path) {
    if (catalog_path.empty()) {
        return std::make_unique<Catalog>(Catalog::builtin());
    }
    std::cout << "[Host] Loading catalog from " << catalog_path << std::endl;
    return std::make_unique<Catalog>(Catalog::load_from_file(catalog_path));
}

Host::Host(const HostOptions& options, engine::EngineFactoryFn engine_factory)
    : log_level_(options.log_level) {
    std::string data_dir = options.data_dir.empty() ? utils::get_default_data_dir() : options.data_dir;

    catalog_ = open_catalog(options.catalog_path);
    store_ = std::make_unique<ModelStore>(data_dir);
    environment_ = std::make_unique<DependencyEnvironment>(store_->environment_dir(), options.python);
    pipeline_ = std::make_unique<InstallPipeline>(*store_, *environment_);
    pipeline_->set_download_options(options.download);

    SupervisorOptions supervisor_options = options.supervisor;
    if (is_debug()) {
        supervisor_options.inherit_output = true;
    }
    supervisor_ = std::make_unique<ProcessSupervisor>(*store_, supervisor_options);
    session_ = std::make_unique<InferenceSession>(options.session, std::move(engine_factory));
    system_info_ = options.system_info ? options.system_info : std::shared_ptr<SystemInfo>(create_system_info());

    if (is_debug()) {
        std::cout << "[Host] Data directory: " << data_dir << std::endl;
        std::cout << "[Host] Catalog has " << catalog_->models().size() << " models" << std::endl;
    }
}

Host::~Host() {
    // Backing process first, the engine second
    supervisor_.reset();
    session_.reset();
}

json Host::list_models() {
    const SystemSpecs& specs = system_specs();

    json models = json::array();
    for (const auto& model : catalog_->models()) {
        json entry = model;
        entry["state"] = installation_state_to_string(store_->installation_state(model));

        Compatibility compatibility = check_compatibility(model.requirements, specs);
        entry["compatible"] = compatibility.compatible;
        entry["reason"] = compatibility.reason;
        models.push_back(entry);
    }
    return models;
}

const SystemSpecs& Host::system_specs() {
    std::call_once(specs_once_, [this]() {
        specs_ = system_info_->get_specs();
        if (is_debug()) {
            std::cout << "[Host] " << specs_.os_name << " " << specs_.os_version << ", "
                      << specs_.cpu_cores << " cores, " << specs_.gpus.size() << " GPU(s)" << std::endl;
        }
    });
    return specs_;
}

void Host::install(const std::string& model_id, IEventSink& sink) {
    if (!catalog_->contains(model_id)) {
        NotFoundException error("Model not found: " + model_id);
        InstallProgress event;
        event.model_id = model_id;
        event.status = InstallStatus::ERROR;
        event.message = error.what();
        event.error_code = error_code_to_string(error.code());
        sink.on_install_progress(event);
        throw error;
    }
    pipeline_->install(catalog_->get(model_id), sink);
}

int Host::launch(const std::string& model_id) {
    return supervisor_->launch(catalog_->get(model_id));
}

void Host::load(const std::string& model_id) {
    session_->load_model(catalog_->get(model_id), *store_);
}

GenerationResult Host::generate(const std::string& prompt, IEventSink& sink, int max_tokens) {
    GenerationResult result = session_->generate(prompt, sink, max_tokens);
    result.rethrow_if_error();
    return result;
}

void Host::stop() {
    supervisor_->stop();
}

json Host::status() {
    json service = {
        {"state", service_state_to_string(supervisor_->state())},
        {"model", supervisor_->running_model()},
        {"port", supervisor_->port()}
    };

    // One read of the session; an empty path means nothing is loaded
    std::string loaded_path = session_->loaded_model_path();
    std::string loaded_model;
    for (const auto& model : catalog_->models()) {
        if (!loaded_path.empty() && store_->weights_path(model) == loaded_path) {
            loaded_model = model.id;
            break;
        }
    }
    json session = {
        {"loaded", !loaded_path.empty()},
        {"model", loaded_model}
    };

    return {
        {"service", service},
        {"session", session},
        {"data_dir", store_->data_dir()}
    };
}

void Host::remove(const std::string& model_id) {
    const ModelDescriptor& model = catalog_->get(model_id);

    if (supervisor_->running_model() == model_id) {
        throw InvalidRequestException("Model " + model_id + " is running, stop it before removing");
    }
    if (session_->is_loaded() && session_->loaded_model_path() == store_->weights_path(model)) {
        throw InvalidRequestException("Model " + model_id + " is loaded, it cannot be removed");
    }

    if (!store_->remove(model)) {
        throw NotFoundException("Model " + model_id + " is not installed");
    }
    std::cout << "[Host] Removed " << model_id << std::endl;
}

} // namespace dock
