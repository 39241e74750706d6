#include "docker/docker_engine.hpp"
#include <fmt/core.h>
#include <poll.h>
#include <sys/socket.h>
#include <cerrno>
#include <cstring>
#include "common/exceptions.hpp"

namespace runbox::docker {
using namespace std;
using namespace nlohmann;

static constexpr size_t MAX_HEAD_SIZE = 64 * 1024;

hijacked_exec_stream::hijacked_exec_stream(const string &socket_path)
    : socket_path(socket_path) {}

hijacked_exec_stream::~hijacked_exec_stream() {
    if (curl) curl_easy_cleanup(curl);
}

void hijacked_exec_stream::open(const string &request) {
    curl = curl_easy_init();
    if (!curl)
        throw network_error("unable to initialize curl");

    curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, socket_path.c_str());
    curl_easy_setopt(curl, CURLOPT_URL, "http://localhost/");
    curl_easy_setopt(curl, CURLOPT_CONNECT_ONLY, 1L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl);
    if (res != CURLE_OK)
        throw network_error(fmt::format("unable to connect to {}: {}", socket_path, curl_easy_strerror(res)));

    res = curl_easy_getinfo(curl, CURLINFO_ACTIVESOCKET, &fd);
    if (res != CURLE_OK || fd == CURL_SOCKET_BAD)
        throw network_error("unable to get socket of " + socket_path);

    write(request);

    string data;
    size_t head_end;
    while ((head_end = data.find("\r\n\r\n")) == string::npos) {
        if (data.size() > MAX_HEAD_SIZE)
            throw network_error("HTTP response head too large");
        if (receive(data) == 0)
            throw network_error("connection closed before exec was started");
    }

    http_head head = parse_http_head(data.substr(0, head_end));
    pending = data.substr(head_end + 4);

    // 旧版本的 API 不支持 Upgrade，会直接返回 200 并在之后传输原始数据流
    if (head.status != 101 && head.status != 200)
        throw engine_error(head.status, "Unable to start exec: " + error_message(pending));
}

bool hijacked_exec_stream::wait_socket(short events) {
    while (!cancelled) {
        struct pollfd pfd = {fd, events, 0};
        int ret = ::poll(&pfd, 1, 100);
        if (ret > 0) return true;
        if (ret < 0 && errno != EINTR)
            throw network_error(fmt::format("poll on exec stream failed: {}", strerror(errno)));
    }
    return false;
}

size_t hijacked_exec_stream::receive(string &buffer) {
    char chunk[16384];
    while (!cancelled) {
        size_t n = 0;
        CURLcode res = curl_easy_recv(curl, chunk, sizeof(chunk), &n);
        if (res == CURLE_OK) {
            buffer.append(chunk, n);
            return n;
        } else if (res == CURLE_AGAIN) {
            if (!wait_socket(POLLIN)) break;
        } else {
            if (cancelled) break;
            throw network_error(fmt::format("read from exec stream failed: {}", curl_easy_strerror(res)));
        }
    }
    return 0;
}

size_t hijacked_exec_stream::read_some(string &buffer) {
    if (!pending.empty()) {
        size_t n = pending.size();
        buffer.append(pending);
        pending.clear();
        return n;
    }
    return receive(buffer);
}

void hijacked_exec_stream::write(const string &data) {
    size_t offset = 0;
    while (offset < data.size()) {
        if (cancelled)
            throw network_error("exec stream has been cancelled");
        size_t sent = 0;
        CURLcode res = curl_easy_send(curl, data.data() + offset, data.size() - offset, &sent);
        if (res == CURLE_OK) {
            offset += sent;
        } else if (res == CURLE_AGAIN) {
            wait_socket(POLLOUT);
        } else {
            throw network_error(fmt::format("write to exec stream failed: {}", curl_easy_strerror(res)));
        }
    }
}

void hijacked_exec_stream::close_write() {
    if (fd != CURL_SOCKET_BAD)
        ::shutdown(fd, SHUT_WR);
}

void hijacked_exec_stream::cancel() {
    cancelled = true;
    if (fd != CURL_SOCKET_BAD)
        ::shutdown(fd, SHUT_RDWR);
}

string error_message(const string &body) {
    json j = json::parse(body, nullptr, false);
    if (j.is_object() && j.count("message") && j.at("message").is_string())
        return j.at("message").get<string>();
    return body;
}

json to_create_body(const container_spec &spec) {
    json host_config = {
        {"AutoRemove", false}};
    if (spec.memory_bytes > 0) {
        host_config["Memory"] = spec.memory_bytes;
        host_config["MemorySwap"] = spec.memory_bytes;  // 禁用 swap
    }
    if (spec.cpu_quota > 0) {
        host_config["CpuQuota"] = spec.cpu_quota;
        host_config["CpuPeriod"] = spec.cpu_period;
    }
    if (spec.network_disabled)
        host_config["NetworkMode"] = "none";
    if (!spec.tmpfs.empty())
        host_config["Tmpfs"] = spec.tmpfs;

    json body = {
        {"Image", spec.image},
        {"Cmd", spec.cmd},
        {"Tty", false},
        {"OpenStdin", false},
        {"AttachStdin", false},
        {"AttachStdout", false},
        {"AttachStderr", false},
        {"NetworkDisabled", spec.network_disabled},
        {"HostConfig", host_config}};
    if (!spec.working_dir.empty())
        body["WorkingDir"] = spec.working_dir;
    return body;
}

docker_engine::docker_engine(const string &socket_path, const string &api_version)
    : client(socket_path), api_version(api_version) {}

string docker_engine::api(const string &path) const {
    return api_version.empty() ? path : "/" + api_version + path;
}

void docker_engine::expect(const http_response &response, initializer_list<long> accepted, const string &what) const {
    for (long status : accepted)
        if (response.status == status) return;
    throw engine_error(response.status, fmt::format("{}: {} (HTTP {})", what, error_message(response.body), response.status));
}

bool docker_engine::ping() {
    http_response response = client.request("GET", api("/_ping"));
    return response.status == 200;
}

container_state docker_engine::inspect(const string &name) {
    http_response response = client.request("GET", api("/containers/" + name + "/json"));
    expect(response, {200}, "Unable to inspect container " + name);

    json j = json::parse(response.body);
    container_state state;
    j.at("Id").get_to(state.id);
    state.name = j.value("Name", name);
    if (!state.name.empty() && state.name.front() == '/')
        state.name.erase(0, 1);
    state.running = j.at("State").value("Running", false);
    return state;
}

string docker_engine::create(const string &name, const container_spec &spec) {
    http_response response = client.request("POST", api("/containers/create?name=" + name), to_create_body(spec).dump());
    expect(response, {201}, "Unable to create container " + name);
    return json::parse(response.body).at("Id").get<string>();
}

void docker_engine::start(const string &id) {
    // 304 表示容器已经在运行了
    expect(client.request("POST", api("/containers/" + id + "/start")), {204, 304}, "Unable to start container " + id);
}

void docker_engine::stop(const string &id, int timeout_seconds) {
    expect(client.request("POST", api(fmt::format("/containers/{}/stop?t={}", id, timeout_seconds))), {204, 304}, "Unable to stop container " + id);
}

void docker_engine::remove(const string &id, bool force) {
    expect(client.request("DELETE", api(fmt::format("/containers/{}?force={}", id, force ? "true" : "false"))), {204}, "Unable to remove container " + id);
}

string docker_engine::create_exec(const string &container_id, const exec_spec &spec) {
    json body = {
        {"AttachStdin", spec.attach_stdin},
        {"AttachStdout", spec.attach_stdout},
        {"AttachStderr", spec.attach_stderr},
        {"Tty", false},
        {"Cmd", spec.cmd}};
    if (!spec.working_dir.empty())
        body["WorkingDir"] = spec.working_dir;

    http_response response = client.request("POST", api("/containers/" + container_id + "/exec"), body.dump());
    expect(response, {201}, "Unable to create exec in container " + container_id);
    return json::parse(response.body).at("Id").get<string>();
}

unique_ptr<exec_stream> docker_engine::start_exec(const string &exec_id) {
    string payload = json{{"Detach", false}, {"Tty", false}}.dump();
    string request = fmt::format(
        "POST {} HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Content-Type: application/json\r\n"
        "Connection: Upgrade\r\n"
        "Upgrade: tcp\r\n"
        "Content-Length: {}\r\n"
        "\r\n"
        "{}",
        api("/exec/" + exec_id + "/start"), payload.size(), payload);

    auto stream = make_unique<hijacked_exec_stream>(client.socket());
    stream->open(request);
    return stream;
}

int docker_engine::inspect_exec(const string &exec_id) {
    http_response response = client.request("GET", api("/exec/" + exec_id + "/json"));
    expect(response, {200}, "Unable to inspect exec " + exec_id);

    json j = json::parse(response.body);
    if (j.value("Running", false) || !j.count("ExitCode") || j.at("ExitCode").is_null())
        return -1;
    return j.at("ExitCode").get<int>();
}

}  // namespace runbox::docker
