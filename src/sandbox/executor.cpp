#include "sandbox/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <future>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace runbox {
using namespace std;
using namespace nlohmann;

const char *const NO_OUTPUT_MESSAGE = "Code executed successfully (no output)";

string to_string(execution_status status) {
    switch (status) {
        case execution_status::SUCCESS: return "success";
        case execution_status::RUNTIME_ERROR: return "runtime_error";
        case execution_status::TIMEOUT: return "timeout";
        case execution_status::UNSUPPORTED_LANGUAGE: return "unsupported_language";
        case execution_status::CONTAINER_MISSING: return "container_missing";
        case execution_status::INTERNAL_ERROR: return "internal_error";
    }
    return "internal_error";
}

static optional<string> optional_text(const json &j, const char *key) {
    if (j.count(key) && !j.at(key).is_null())
        return j.at(key).get<string>();
    return nullopt;
}

static container_mode mode_of(const json &j) {
    if (j.count("mode") && !j.at("mode").is_null())
        return parse_container_mode(j.at("mode").get<string>());
    return container_mode::EPHEMERAL;
}

void from_json(const json &j, execution_request &request) {
    j.at("code").get_to(request.code);
    j.at("language").get_to(request.language);
    request.stdin_text = optional_text(j, "stdin");
    request.mode = mode_of(j);
}

void from_json(const json &j, source_file &file) {
    j.at("name").get_to(file.name);
    j.at("content").get_to(file.content);
}

void from_json(const json &j, project_request &request) {
    j.at("files").get_to(request.files);
    j.at("mainFile").get_to(request.main_file);
    j.at("language").get_to(request.language);
    request.stdin_text = optional_text(j, "stdin");
    request.mode = mode_of(j);
}

void to_json(json &j, const execution_result &result) {
    j = {{"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"elapsedMs", result.elapsed_ms},
         {"status", to_string(result.status)},
         {"exitCode", result.exit_code}};
}

void to_json(json &j, const engine_status &status) {
    j = {{"available", status.available},
         {"message", status.message}};
}

static execution_result failure(execution_status status, const string &message) {
    execution_result result;
    result.status = status;
    result.stderr_text = message;
    return result;
}

sandbox_executor::sandbox_executor(docker::container_engine &engine,
                                   const language_table &languages,
                                   container_provider &ephemeral,
                                   container_provider &persistent,
                                   const sandbox_config &config)
    : engine(engine),
      table(languages),
      ephemeral(ephemeral),
      persistent(persistent),
      injector(engine),
      max_code_length(config.max_code_length),
      execution_timeout(config.execution_timeout),
      project_timeout(config.project_timeout),
      stdin_settle(config.stdin_settle) {}

container_provider &sandbox_executor::provider(container_mode mode) {
    return mode == container_mode::PERSISTENT ? persistent : ephemeral;
}

void sandbox_executor::validate_code(const string &code, const string &what) const {
    if (code.size() > max_code_length)
        throw validation_error(fmt::format("{} is too long (maximum {} bytes allowed)", what, max_code_length));
}

execution_result sandbox_executor::execute(const execution_request &request) {
    elapsed_time timer;

    if (boost::algorithm::trim_copy(request.code).empty())
        throw validation_error("Code is required");
    validate_code(request.code, "Code");

    run_plan plan;
    try {
        plan.profile = &table.find(request.language);
    } catch (unsupported_language &ex) {
        LOG(WARNING) << ex.what();
        execution_result result = failure(execution_status::UNSUPPORTED_LANGUAGE, ex.what());
        result.elapsed_ms = timer.milliseconds();
        return result;
    }

    plan.main_file = plan.profile->file_name(request.code);
    plan.files = {{plan.main_file, request.code}};
    plan.stdin_text = request.stdin_text;
    plan.mode = request.mode;
    plan.timeout = execution_timeout;
    return run(plan, timer);
}

execution_result sandbox_executor::execute_project(const project_request &request) {
    elapsed_time timer;

    if (request.files.empty())
        throw validation_error("At least one file is required");

    bool has_main = false;
    for (auto &file : request.files) {
        assert_safe_path(file.name);
        validate_code(file.content, "File " + file.name);
        if (file.name == request.main_file) has_main = true;
    }
    if (!has_main)
        throw validation_error("Main file " + request.main_file + " is not one of the project files");

    run_plan plan;
    try {
        plan.profile = &table.find(request.language);
    } catch (unsupported_language &ex) {
        LOG(WARNING) << ex.what();
        execution_result result = failure(execution_status::UNSUPPORTED_LANGUAGE, ex.what());
        result.elapsed_ms = timer.milliseconds();
        return result;
    }

    plan.files = request.files;
    plan.main_file = request.main_file;
    plan.stdin_text = request.stdin_text;
    plan.mode = request.mode;
    plan.timeout = project_timeout;
    return run(plan, timer);
}

execution_result sandbox_executor::run(const run_plan &plan, const elapsed_time &timer) {
    execution_result result;
    container_provider &containers = provider(plan.mode);
    container_handle handle;
    bool acquired = false;
    vector<string> written;

    defer {
        if (acquired) cleanup(containers, handle, plan, written);
    };

    try {
        handle = containers.acquire(*plan.profile);
        acquired = true;

        for (auto &file : plan.files) {
            // 写入失败时文件也可能已经部分写入
            written.push_back(file.name);
            injector.write(handle, file);
        }

        string command = plan.profile->build_command(handle.workdir, plan.main_file);
        LOG(INFO) << "Executing in " << handle.name << ": " << command;

        docker::exec_spec spec;
        spec.cmd = {"sh", "-c", command};
        spec.attach_stdin = plan.stdin_text.has_value();
        spec.working_dir = handle.workdir;
        string exec_id = engine.create_exec(handle.id, spec);
        auto stream = engine.start_exec(exec_id);

        auto output = collect(*stream, plan.stdin_text, plan.timeout);
        if (!output) {
            LOG(INFO) << "Execution in " << handle.name << " timed out after " << plan.timeout.count() << "ms";
            result = failure(execution_status::TIMEOUT,
                             fmt::format("Execution timed out (maximum {:g} seconds allowed)", plan.timeout.count() / 1000.0));
        } else {
            result.stdout_text = boost::algorithm::trim_right_copy(output->stdout_text);
            result.stderr_text = boost::algorithm::trim_right_copy(output->stderr_text);
            result.exit_code = exit_code_of(exec_id);

            bool succeeded = result.exit_code == 0 || (result.exit_code < 0 && result.stderr_text.empty());
            result.status = succeeded ? execution_status::SUCCESS : execution_status::RUNTIME_ERROR;
            if (succeeded && result.stdout_text.empty() && result.stderr_text.empty())
                result.stdout_text = NO_OUTPUT_MESSAGE;
        }
    } catch (container_missing &ex) {
        LOG(ERROR) << ex.what();
        result = failure(execution_status::CONTAINER_MISSING, ex.what());
    } catch (std::exception &ex) {
        LOG(ERROR) << "Code execution error: " << ex.what();
        result = failure(execution_status::INTERNAL_ERROR, ex.what());
    }

    result.elapsed_ms = timer.milliseconds();
    return result;
}

optional<docker::demuxed_output> sandbox_executor::collect(docker::exec_stream &stream, const optional<string> &stdin_text, chrono::milliseconds timeout) {
    chrono::milliseconds settle = stdin_settle;
    future<docker::demuxed_output> output = async(launch::async, [&stream, &stdin_text, settle] {
        if (stdin_text) {
            // 等待进程启动后再写入
            this_thread::sleep_for(settle);
            try {
                stream.write(*stdin_text + "\n");
                stream.close_write();
            } catch (network_error &ex) {
                // 程序可能不读 stdin 就已经结束了，此时仍然需要读取它的输出
                LOG(WARNING) << "Unable to write stdin: " << ex.what();
            }
        }
        return docker::demultiplex(stream);
    });

    if (output.wait_for(timeout) == future_status::timeout) {
        stream.cancel();
        try {
            output.get();
        } catch (std::exception &ex) {
            LOG(INFO) << "Output collection stopped: " << ex.what();
        }
        return nullopt;
    }
    return output.get();
}

int sandbox_executor::exit_code_of(const string &exec_id) {
    try {
        return engine.inspect_exec(exec_id);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to read exit code of exec " << exec_id << ": " << ex.what();
        return -1;
    }
}

void sandbox_executor::cleanup(container_provider &containers, const container_handle &handle, const run_plan &plan, const vector<string> &written) {
    if (handle.mode == container_mode::PERSISTENT) {
        try {
            injector.remove(handle, written, plan.profile->artifacts(plan.main_file));
        } catch (std::exception &ex) {
            LOG(WARNING) << "Cleanup warning: " << ex.what();
        }
    }

    try {
        containers.release(handle);
    } catch (std::exception &ex) {
        LOG(WARNING) << "Unable to release container " << handle.name << ": " << ex.what();
    }
}

engine_status sandbox_executor::ping() {
    try {
        if (engine.ping())
            return {true, "Docker is running"};
        return {false, "Docker did not answer the ping"};
    } catch (std::exception &ex) {
        LOG(ERROR) << "Docker is not available: " << ex.what();
        return {false, fmt::format("Docker is not available: {}", ex.what())};
    }
}

vector<string> sandbox_executor::languages() const {
    return table.names();
}

}  // namespace runbox
