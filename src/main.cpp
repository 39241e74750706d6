#include <curl/curl.h>
#include <glog/logging.h>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/program_options.hpp>
#include <csignal>
#include <filesystem>
#include <iostream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "docker/docker_engine.hpp"
#include "sandbox/container.hpp"
#include "sandbox/executor.hpp"
#include "sandbox/language.hpp"
#include "sandbox/test_harness.hpp"
using namespace std;

static void print_json(const nlohmann::json &j) {
    cout << j.dump(2) << endl;
}

static string docker_socket_from_env() {
    if (getenv("DOCKER_SOCKET"))
        return getenv("DOCKER_SOCKET");

    string host = runbox::get_env("DOCKER_HOST", "");
    if (boost::algorithm::starts_with(host, "unix://"))
        return host.substr(7);
    if (!host.empty())
        LOG(WARNING) << "DOCKER_HOST " << host << " is not a unix socket, ignored";
    return "";
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    // 写入一个已经关闭的 exec 流时，不能让 SIGPIPE 结束整个进程
    signal(SIGPIPE, SIG_IGN);

    namespace po = boost::program_options;
    po::options_description desc("runbox options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load sandbox configuration from the given JSON file. You can either pass it from environ RUNBOX_CONFIG")
        ("docker-socket", po::value<string>(), "set the unix socket of docker engine, default to /var/run/docker.sock. You can either pass it from environ DOCKER_SOCKET or DOCKER_HOST=unix://...")
        ("api-version", po::value<string>(), "set the docker engine API version, default to v1.41")
        ("language", po::value<string>(), "language of the code: python, javascript, java, cpp")
        ("code-file", po::value<string>(), "file containing the code to run")
        ("stdin-file", po::value<string>(), "file whose content is passed to the program as standard input")
        ("tests", po::value<string>(), "run the code against test cases in the given JSON file instead of running it once")
        ("project", po::value<string>(), "run a multi-file project described by the given JSON file")
        ("persistent", "run in the pre-provisioned persistent container of the language instead of a new container")
        ("timeout", po::value<long long>(), "set the wall-clock time limit of a single run in milliseconds, default to 10000")
        ("ping", "check whether docker engine is available")
        ("languages", "list supported languages")
        ("debug", "turn on the debug mode to keep ephemeral containers after execution")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error &e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "runbox: run untrusted code in disposable docker containers" << endl
             << "Usage: " << argv[0] << " --language python --code-file main.py [--stdin-file input.txt] [--tests cases.json]" << endl
             << "       " << argv[0] << " --project project.json" << endl
             << "       " << argv[0] << " --ping | --languages" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "runbox 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug") || getenv("DEBUG")) {
        runbox::DEBUG = true;
    }

    runbox::sandbox_config config;
    try {
        if (vm.count("config")) {
            config = runbox::load_config(vm.at("config").as<string>());
        } else if (getenv("RUNBOX_CONFIG")) {
            config = runbox::load_config(getenv("RUNBOX_CONFIG"));
        }
    } catch (runbox::runbox_exception &ex) {
        LOG(ERROR) << boost::diagnostic_information(ex);
        cerr << ex.what() << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("docker-socket")) {
        config.docker_socket = vm.at("docker-socket").as<string>();
    } else if (string socket = docker_socket_from_env(); !socket.empty()) {
        config.docker_socket = socket;
    }

    if (vm.count("api-version")) {
        config.api_version = vm.at("api-version").as<string>();
    }

    if (vm.count("timeout")) {
        config.execution_timeout = chrono::milliseconds(vm.at("timeout").as<long long>());
    }

    CHECK(config.execution_timeout.count() > 0)
        << "Execution timeout should be positive";

    curl_global_init(CURL_GLOBAL_ALL);

    runbox::docker::docker_engine engine(config.docker_socket, config.api_version);
    runbox::language_table languages(config.images);
    runbox::ephemeral_container_provider ephemeral(engine, config);
    runbox::persistent_container_provider persistent(engine, config.persistent_containers, config.start_settle);
    runbox::sandbox_executor executor(engine, languages, ephemeral, persistent, config);

    runbox::container_mode mode = vm.count("persistent") ? runbox::container_mode::PERSISTENT : runbox::container_mode::EPHEMERAL;

    int exit_code = EXIT_SUCCESS;
    try {
        if (vm.count("ping")) {
            runbox::engine_status status = executor.ping();
            print_json(status);
            if (!status.available) exit_code = EXIT_FAILURE;
        } else if (vm.count("languages")) {
            print_json(executor.languages());
        } else if (vm.count("project")) {
            nlohmann::json j = nlohmann::json::parse(runbox::read_file_content(vm.at("project").as<string>()));
            runbox::project_request request = j.get<runbox::project_request>();
            if (vm.count("persistent")) request.mode = mode;
            print_json(executor.execute_project(request));
        } else {
            if (!vm.count("language") || !vm.count("code-file")) {
                cerr << "--language and --code-file are required" << endl
                     << endl;
                cerr << desc << endl;
                curl_global_cleanup();
                return EXIT_FAILURE;
            }

            string language = vm.at("language").as<string>();
            string code = runbox::read_file_content(vm.at("code-file").as<string>());

            if (vm.count("tests")) {
                nlohmann::json j = nlohmann::json::parse(runbox::read_file_content(vm.at("tests").as<string>()));
                auto test_cases = j.get<vector<runbox::test_case>>();
                runbox::test_run_summary summary;
                {
                    runbox::test_harness harness(executor, config.test_case_timeout, mode);
                    summary = harness.run_tests(code, language, test_cases);
                }
                print_json(summary);
            } else {
                runbox::execution_request request;
                request.code = code;
                request.language = language;
                if (vm.count("stdin-file"))
                    request.stdin_text = runbox::read_file_content(vm.at("stdin-file").as<string>());
                request.mode = mode;
                print_json(executor.execute(request));
            }
        }
    } catch (runbox::validation_error &ex) {
        cerr << ex.what() << endl;
        exit_code = EXIT_FAILURE;
    } catch (nlohmann::json::exception &ex) {
        cerr << "Malformed JSON input: " << ex.what() << endl;
        exit_code = EXIT_FAILURE;
    } catch (runbox::runbox_exception &ex) {
        LOG(ERROR) << boost::diagnostic_information(ex);
        cerr << ex.what() << endl;
        exit_code = EXIT_FAILURE;
    }

    curl_global_cleanup();
    return exit_code;
}
