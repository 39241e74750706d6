#include "sandbox/injector.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <filesystem>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runbox {
using namespace std;
namespace fs = std::filesystem;

source_injector::source_injector(docker::container_engine &engine)
    : engine(engine) {}

string source_injector::write_command(const string &workdir, const source_file &file) {
    fs::path path = fs::path(workdir) / file.name;
    return fmt::format("mkdir -p {} && printf '%s' {} | base64 -d > {}",
                       shell_quote(path.parent_path().string()),
                       shell_quote(base64_encode(file.content)),
                       shell_quote(path.string()));
}

string source_injector::cleanup_command(const string &workdir, const vector<string> &file_names, const vector<string> &artifacts) {
    string command = "cd " + shell_quote(workdir) + " && rm -rf";
    for (auto &name : file_names)
        command += " " + shell_quote(name);
    for (auto &artifact : artifacts)
        command += " " + artifact;
    return command;
}

int source_injector::run(const container_handle &handle, const string &command, docker::demuxed_output &output) {
    docker::exec_spec spec;
    spec.cmd = {"sh", "-c", command};
    spec.working_dir = handle.workdir;

    string exec_id = engine.create_exec(handle.id, spec);
    auto stream = engine.start_exec(exec_id);
    output = docker::demultiplex(*stream);
    return engine.inspect_exec(exec_id);
}

void source_injector::write(const container_handle &handle, const source_file &file) {
    docker::demuxed_output output;
    int exit_code = run(handle, write_command(handle.workdir, file), output);
    if (exit_code != 0)
        throw internal_error(fmt::format("Unable to write {} into container {} (exit code {}): {}",
                                         file.name, handle.name, exit_code, output.stderr_text));
    DLOG(INFO) << "Wrote " << file.content.size() << " bytes to " << handle.name << ":" << handle.workdir << "/" << file.name;
}

void source_injector::remove(const container_handle &handle, const vector<string> &file_names, const vector<string> &artifacts) {
    if (file_names.empty() && artifacts.empty()) return;

    docker::demuxed_output output;
    int exit_code = run(handle, cleanup_command(handle.workdir, file_names, artifacts), output);
    if (exit_code != 0)
        throw internal_error(fmt::format("Unable to clean up container {} (exit code {}): {}",
                                         handle.name, exit_code, output.stderr_text));
}

}  // namespace runbox
