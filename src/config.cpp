#include "config.hpp"
#include <fmt/core.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace runbox {
using namespace std;
using namespace nlohmann;

bool DEBUG = false;

template <typename T>
static void get_optional(const json &j, const char *key, T &value) {
    if (j.count(key) && !j.at(key).is_null())
        j.at(key).get_to(value);
}

static void get_milliseconds(const json &j, const char *key, chrono::milliseconds &value) {
    if (j.count(key) && !j.at(key).is_null())
        value = chrono::milliseconds(j.at(key).get<long long>());
}

void from_json(const json &j, container_limits &limits) {
    get_optional(j, "memory", limits.memory_bytes);
    get_optional(j, "cpu_quota", limits.cpu_quota);
    get_optional(j, "cpu_period", limits.cpu_period);
    get_optional(j, "network_disabled", limits.network_disabled);
    get_optional(j, "tmpfs", limits.tmpfs_options);
}

void from_json(const json &j, sandbox_config &config) {
    get_optional(j, "docker_socket", config.docker_socket);
    get_optional(j, "api_version", config.api_version);
    get_optional(j, "container_prefix", config.container_prefix);
    get_optional(j, "limits", config.limits);
    get_optional(j, "images", config.images);
    get_optional(j, "persistent_containers", config.persistent_containers);
    get_milliseconds(j, "execution_timeout_ms", config.execution_timeout);
    get_milliseconds(j, "project_timeout_ms", config.project_timeout);
    get_milliseconds(j, "test_case_timeout_ms", config.test_case_timeout);
    get_milliseconds(j, "start_settle_ms", config.start_settle);
    get_milliseconds(j, "stdin_settle_ms", config.stdin_settle);
    get_optional(j, "stop_timeout", config.stop_timeout);
    get_optional(j, "max_code_length", config.max_code_length);

    if (config.max_code_length > MAX_CODE_LENGTH_LIMIT)
        throw validation_error(fmt::format("max_code_length must not exceed {} bytes", MAX_CODE_LENGTH_LIMIT));
}

sandbox_config load_config(const string &path) {
    sandbox_config config;
    try {
        json::parse(read_file_content(path)).get_to(config);
    } catch (json::exception &ex) {
        throw validation_error("Configuration file " + path + " is malformed: " + ex.what());
    }
    return config;
}

}  // namespace runbox
