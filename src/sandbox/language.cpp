#include "sandbox/language.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/case_conv.hpp>
#include <filesystem>
#include <regex>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runbox {
using namespace std;
namespace fs = std::filesystem;

string detect_java_class(const string &code) {
    static const regex matcher(R"(public\s+class\s+(\w+))");
    smatch matches;
    if (regex_search(code, matches, matcher))
        return matches[1].str();
    return "Main";
}

static string join_path(const string &workdir, const string &file_name) {
    return (fs::path(workdir) / file_name).string();
}

static string strip_extension(const string &file_name) {
    return fs::path(file_name).replace_extension().string();
}

static language_profile python_profile() {
    language_profile profile;
    profile.name = "python";
    profile.image = "python:3.10-slim";
    profile.file_name = [](const string &) { return string("main.py"); };
    profile.build_command = [](const string &workdir, const string &file_name) {
        // -u: 关闭输出缓冲
        return fmt::format("python3 -u {}", shell_quote(join_path(workdir, file_name)));
    };
    profile.artifacts = [](const string &) { return vector<string>(); };
    return profile;
}

static language_profile javascript_profile() {
    language_profile profile;
    profile.name = "javascript";
    profile.image = "node:18-alpine";
    profile.file_name = [](const string &) { return string("main.js"); };
    profile.build_command = [](const string &workdir, const string &file_name) {
        return fmt::format("node {}", shell_quote(join_path(workdir, file_name)));
    };
    profile.artifacts = [](const string &) { return vector<string>(); };
    return profile;
}

static language_profile cpp_profile() {
    language_profile profile;
    profile.name = "cpp";
    profile.image = "gcc:13";
    profile.file_name = [](const string &) { return string("main.cpp"); };
    profile.build_command = [](const string &workdir, const string &file_name) {
        string binary = strip_extension(file_name);
        return fmt::format("cd {} && g++ -std=c++20 -O2 -o {} {} && ./{}",
                           shell_quote(workdir), shell_quote(binary), shell_quote(file_name), shell_quote(binary));
    };
    profile.artifacts = [](const string &file_name) {
        return vector<string>{shell_quote(strip_extension(file_name))};
    };
    return profile;
}

static language_profile java_profile() {
    language_profile profile;
    profile.name = "java";
    profile.image = "eclipse-temurin:17-jdk";
    profile.file_name = [](const string &code) { return detect_java_class(code) + ".java"; };
    profile.build_command = [](const string &workdir, const string &file_name) {
        string class_name = fs::path(file_name).stem().string();
        return fmt::format("cd {} && javac {} && java -cp {} {}",
                           shell_quote(workdir), shell_quote(file_name), shell_quote(workdir), shell_quote(class_name));
    };
    profile.artifacts = [](const string &) { return vector<string>{"*.class"}; };
    return profile;
}

language_table::language_table(const map<string, string> &images) {
    for (auto profile : {python_profile(), javascript_profile(), java_profile(), cpp_profile()}) {
        if (auto it = images.find(profile.name); it != images.end())
            profile.image = it->second;
        profiles.insert({profile.name, profile});
    }
    aliases["c++"] = "cpp";
}

const language_profile *language_table::lookup(const string &name) const {
    string key = boost::algorithm::to_lower_copy(name);
    if (auto alias = aliases.find(key); alias != aliases.end())
        key = alias->second;
    auto it = profiles.find(key);
    return it == profiles.end() ? nullptr : &it->second;
}

const language_profile &language_table::find(const string &name) const {
    if (auto profile = lookup(name))
        return *profile;
    throw unsupported_language(name);
}

bool language_table::supports(const string &name) const {
    return lookup(name) != nullptr;
}

vector<string> language_table::names() const {
    vector<string> result;
    for (auto &[name, profile] : profiles)
        result.push_back(name);
    return result;
}

}  // namespace runbox
