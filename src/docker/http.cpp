#include "docker/http.hpp"
#include <curl/curl.h>
#include <fmt/core.h>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <memory>
#include <sstream>
#include <vector>
#include "common/exceptions.hpp"

namespace runbox::docker {
using namespace std;

http_head parse_http_head(const string &head) {
    istringstream in(head);
    string line;
    if (!getline(in, line))
        throw network_error("empty HTTP response");
    boost::trim_right_if(line, boost::is_any_of("\r"));

    // HTTP/1.1 101 UPGRADED
    vector<string> parts;
    boost::split(parts, line, boost::is_any_of(" "), boost::token_compress_on);
    if (parts.size() < 2 || !boost::starts_with(parts[0], "HTTP/"))
        throw network_error("malformed HTTP status line: " + line);

    http_head result;
    try {
        result.status = boost::lexical_cast<long>(parts[1]);
    } catch (boost::bad_lexical_cast &) {
        throw network_error("malformed HTTP status line: " + line);
    }
    if (line.size() > parts[0].size() + parts[1].size() + 2)
        result.reason = line.substr(parts[0].size() + parts[1].size() + 2);

    while (getline(in, line)) {
        boost::trim_right_if(line, boost::is_any_of("\r"));
        if (line.empty()) break;
        auto colon = line.find(':');
        if (colon == string::npos) continue;
        string key = boost::to_lower_copy(line.substr(0, colon));
        string value = boost::trim_copy(line.substr(colon + 1));
        result.headers[key] = value;
    }
    return result;
}

static size_t write_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

unix_socket_client::unix_socket_client(const string &socket_path)
    : socket_path(socket_path) {}

http_response unix_socket_client::request(const string &method, const string &path, const string &body) const {
    unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl)
        throw network_error("unable to initialize curl");

    // 主机名没有意义，但是 URL 必须合法
    string url = "http://localhost" + path;
    http_response response;

    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(headers, curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, socket_path.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    if (!body.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    } else if (method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, "");
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, 0L);
    }

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK)
        throw network_error(fmt::format("{} {} via {} failed: {}", method, path, socket_path, curl_easy_strerror(res)));

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

const string &unix_socket_client::socket() const {
    return socket_path;
}

}  // namespace runbox::docker
