#include "sandbox/container.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <thread>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runbox {
using namespace std;

string to_string(container_mode mode) {
    switch (mode) {
        case container_mode::EPHEMERAL: return "ephemeral";
        case container_mode::PERSISTENT: return "persistent";
    }
    return "unknown";
}

container_mode parse_container_mode(const string &name) {
    if (name == "ephemeral") return container_mode::EPHEMERAL;
    if (name == "persistent") return container_mode::PERSISTENT;
    throw validation_error("Unknown container mode " + name);
}

ephemeral_container_provider::ephemeral_container_provider(docker::container_engine &engine, const sandbox_config &config)
    : engine(engine), prefix(config.container_prefix), limits(config.limits), stop_timeout(config.stop_timeout) {}

string ephemeral_container_provider::make_name(const string &language) const {
    auto timestamp = chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("{}-{}-{}-{}", prefix, language, timestamp, random_suffix(9));
}

void ephemeral_container_provider::remove_stale(const string &name) {
    try {
        engine.inspect(name);
    } catch (engine_error &ex) {
        if (!ex.is_not_found())
            LOG(WARNING) << "Error checking existing container " << name << ": " << ex.what();
        return;
    }
    LOG(INFO) << "Removing existing container: " << name;
    engine.remove(name, true);
}

container_handle ephemeral_container_provider::acquire(const language_profile &profile) {
    container_handle handle;
    handle.name = make_name(profile.name);
    handle.mode = container_mode::EPHEMERAL;
    handle.workdir = WORKDIR;
    handle.language = profile.name;

    remove_stale(handle.name);

    docker::container_spec spec;
    spec.image = profile.image;
    spec.cmd = {"sh", "-c", "while true; do sleep 1; done"};
    spec.working_dir = WORKDIR;
    spec.memory_bytes = limits.memory_bytes;
    spec.cpu_quota = limits.cpu_quota;
    spec.cpu_period = limits.cpu_period;
    spec.network_disabled = limits.network_disabled;
    spec.tmpfs = {{WORKDIR, limits.tmpfs_options}};

    handle.id = engine.create(handle.name, spec);
    try {
        engine.start(handle.id);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to start container " << handle.name << ": " << ex.what();
        try {
            engine.remove(handle.id, true);
        } catch (std::exception &cleanup_ex) {
            LOG(WARNING) << "Unable to remove container " << handle.name << ": " << cleanup_ex.what();
        }
        throw;
    }

    LOG(INFO) << "Container started: " << handle.name << " (" << profile.image << ")";
    return handle;
}

void ephemeral_container_provider::release(const container_handle &handle) {
    if (DEBUG) {
        LOG(INFO) << "Debug mode, container " << handle.name << " is kept";
        return;
    }

    const string &target = handle.id.empty() ? handle.name : handle.id;
    try {
        engine.stop(target, stop_timeout);
    } catch (engine_error &ex) {
        // 即使停止失败，强制删除也会杀掉容器
        if (!ex.is_not_found())
            LOG(WARNING) << "Unable to stop container " << handle.name << ": " << ex.what();
    } catch (runbox_exception &ex) {
        LOG(WARNING) << "Unable to stop container " << handle.name << ": " << ex.what();
    }

    try {
        engine.remove(target, true);
    } catch (engine_error &ex) {
        if (!ex.is_not_found()) throw;
        return;
    }
    LOG(INFO) << "Container removed: " << handle.name;
}

persistent_container_provider::persistent_container_provider(docker::container_engine &engine, const map<string, string> &registry, chrono::milliseconds settle)
    : engine(engine), registry(registry), settle(settle) {}

container_handle persistent_container_provider::acquire(const language_profile &profile) {
    auto it = registry.find(profile.name);
    if (it == registry.end())
        throw container_missing("", fmt::format("No persistent container is configured for language {}", profile.name));
    const string &name = it->second;

    docker::container_state state;
    try {
        state = engine.inspect(name);
    } catch (engine_error &ex) {
        if (ex.is_not_found())
            throw container_missing(name, fmt::format("Container {} not found. Please run: docker compose up -d", name));
        throw;
    }

    if (!state.running) {
        LOG(INFO) << "Starting container: " << name;
        engine.start(state.id);
        this_thread::sleep_for(settle);
    }

    container_handle handle;
    handle.name = name;
    handle.id = state.id;
    handle.mode = container_mode::PERSISTENT;
    handle.workdir = WORKDIR;
    handle.language = profile.name;
    return handle;
}

void persistent_container_provider::release(const container_handle &) {
}

}  // namespace runbox
