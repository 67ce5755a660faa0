#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <boost/program_options.hpp>
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include "common/io_utils.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "sandbox/executor.hpp"
using namespace std;
using namespace nlohmann;

static int cancel_fd = -1;

void sigintHandler(int /* signum */) {
    // 只能调用 async-signal-safe 的函数
    if (cancel_fd >= 0) {
        uint64_t one = 1;
        (void)!write(cancel_fd, &one, sizeof(one));
    }
}

/**
 * @brief 截断预览文本，不会截断在多字节字符的中间
 */
static string preview(const string &text, size_t max_length) {
    if (text.size() <= max_length) return text;
    size_t length = max_length;
    while (length > 0 && ((unsigned char)text[length] & 0xC0) == 0x80) --length;
    return text.substr(0, length) + "...";
}

static string read_code(const boost::program_options::variables_map &vm) {
    if (vm.count("code")) return vm.at("code").as<string>();
    if (vm.count("file")) {
        string file = vm.at("file").as<string>();
        if (file == "-")
            return string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
        if (!filesystem::is_regular_file(file))
            throw runtime_error("File " + file + " does not exist");
        return sandbox::read_file_content(file);
    }
    throw runtime_error("Either --code or --file should be specified");
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("sandbox-runner options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("command", po::value<string>()->default_value("run"), "run, validate, batch or history")
        ("file", po::value<string>(), "script to execute or validate, '-' for stdin. For batch, a json array of {\"name\", \"code\"} objects")
        ("code", po::value<string>(), "code to execute or validate, takes precedence over --file")
        ("language", po::value<string>()->default_value("python"), "language of the code: python, r, javascript, sql")
        ("timeout", po::value<int>()->default_value(30), "wall-clock time limit in seconds")
        ("memory", po::value<int>()->default_value(512), "peak memory limit in MB")
        ("caller", po::value<string>()->default_value("cli"), "caller id recorded in the execution history")
        ("session", po::value<string>(), "analysis session id, used to look up the dataset")
        ("limit", po::value<size_t>()->default_value(20), "number of records listed by history")
        ("python", po::value<string>(), "python interpreter to run the code. You can either pass it from environ PYTHON")
        ("temp-dir", po::value<string>(), "set the directory to store scripts being executed. You can either pass it from environ TEMPDIR")
        ("dataset-dir", po::value<string>(), "set the directory containing datasets named after session ids. You can either pass it from environ DATASETDIR")
        ("image-dir", po::value<string>(), "set the directory to store generated images. You can either pass it from environ IMAGEDIR")
        ("history-file", po::value<string>(), "set the json lines file to record executions. You can either pass it from environ HISTORYFILE")
        ("max-timeout", po::value<int>(), "set the maximum time limit in seconds, default to 300. You can either pass it from environ MAXTIMEOUT")
        ("max-memory", po::value<int>(), "set the maximum memory limit in MB, default to 2048. You can either pass it from environ MAXMEMORY")
        ("max-output-size", po::value<size_t>(), "set the maximum bytes of stdout and stderr, default to 16777216. You can either pass it from environ MAXOUTPUTSIZE")
        ("validator-config", po::value<string>(), "json file of allowed modules, forbidden builtins and dangerous patterns. You can either pass it from environ VALIDATORCONFIG")
        ("inline-images", "replace image markers with markdown image references instead of removing them")
        ("debug", "turn on the debug mode to log the full script being executed")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("command", 1);

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .positional(positional)
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
        cout << "SandboxRunner: Validate and execute untrusted Python scripts in a resource-bounded child process" << endl
             << "Usage: " << argv[0] << " [run|validate|batch|history] [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "sandbox-runner 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("debug")) {
        sandbox::DEBUG = true;
    } else if (getenv("DEBUG")) {
        sandbox::DEBUG = true;
    }

    if (vm.count("inline-images")) {
        sandbox::INLINE_IMAGES = true;
    } else if (getenv("INLINEIMAGES")) {
        sandbox::INLINE_IMAGES = true;
    }

    if (vm.count("python")) {
        sandbox::PYTHON_EXECUTABLE = filesystem::path(vm.at("python").as<string>());
    } else if (getenv("PYTHON")) {
        sandbox::PYTHON_EXECUTABLE = filesystem::path(getenv("PYTHON"));
    }

    if (vm.count("temp-dir")) {
        sandbox::TEMP_DIR = filesystem::path(vm.at("temp-dir").as<string>());
    } else if (getenv("TEMPDIR")) {
        sandbox::TEMP_DIR = filesystem::path(getenv("TEMPDIR"));
    }

    if (vm.count("dataset-dir")) {
        sandbox::DATASET_DIR = filesystem::path(vm.at("dataset-dir").as<string>());
    } else if (getenv("DATASETDIR")) {
        sandbox::DATASET_DIR = filesystem::path(getenv("DATASETDIR"));
    }

    if (vm.count("image-dir")) {
        sandbox::IMAGE_DIR = filesystem::path(vm.at("image-dir").as<string>());
    } else if (getenv("IMAGEDIR")) {
        sandbox::IMAGE_DIR = filesystem::path(getenv("IMAGEDIR"));
    }

    if (vm.count("history-file")) {
        sandbox::HISTORY_FILE = filesystem::path(vm.at("history-file").as<string>());
    } else if (getenv("HISTORYFILE")) {
        sandbox::HISTORY_FILE = filesystem::path(getenv("HISTORYFILE"));
    }

    try {
        if (vm.count("max-timeout")) {
            sandbox::MAX_TIMEOUT = vm.at("max-timeout").as<int>();
        } else if (getenv("MAXTIMEOUT")) {
            sandbox::MAX_TIMEOUT = boost::lexical_cast<int>(getenv("MAXTIMEOUT"));
        }

        if (vm.count("max-memory")) {
            sandbox::MAX_MEMORY_LIMIT = vm.at("max-memory").as<int>();
        } else if (getenv("MAXMEMORY")) {
            sandbox::MAX_MEMORY_LIMIT = boost::lexical_cast<int>(getenv("MAXMEMORY"));
        }

        if (vm.count("max-output-size")) {
            sandbox::MAX_OUTPUT_SIZE = vm.at("max-output-size").as<size_t>();
        } else if (getenv("MAXOUTPUTSIZE")) {
            sandbox::MAX_OUTPUT_SIZE = boost::lexical_cast<size_t>(getenv("MAXOUTPUTSIZE"));
        }
    } catch (boost::bad_lexical_cast &e) {
        cerr << "Malformed limit in environment variables: " << e.what() << endl;
        return EXIT_FAILURE;
    }
    CHECK(sandbox::MAX_TIMEOUT >= 1) << "Maximum timeout should be at least 1 second";
    CHECK(sandbox::MAX_MEMORY_LIMIT >= 16) << "Maximum memory limit should be at least 16MB";

    sandbox::validator_config validator_config = sandbox::validator_config::defaults();
    string validator_config_path = vm.count("validator-config")
                                       ? vm.at("validator-config").as<string>()
                                       : get_env("VALIDATORCONFIG", "");
    if (!validator_config_path.empty()) {
        try {
            validator_config = sandbox::load_validator_config(validator_config_path);
        } catch (exception &e) {
            cerr << "Unable to load validator config " << validator_config_path << ": " << e.what() << endl;
            return EXIT_FAILURE;
        }
    }

    string command = vm.at("command").as<string>();

    if (command == "history") {
        sandbox::jsonl_history_sink history(sandbox::HISTORY_FILE);
        json entries = json::array();
        for (auto &record : history.recent(vm.at("caller").as<string>(), vm.at("limit").as<size_t>())) {
            entries.push_back({{"id", record.id},
                               {"status", sandbox::to_string(record.status)},
                               {"language", sandbox::to_string(record.lang)},
                               {"created_at", sandbox::format_timestamp(record.created_at)},
                               {"execution_time_ms", record.execution_time_ms},
                               {"code_preview", preview(record.code, 200)},
                               {"output_preview", preview(record.output, 100)},
                               {"error", record.error_message}});
        }
        cout << entries.dump(2, ' ', false, json::error_handler_t::replace) << endl;
        return EXIT_SUCCESS;
    }

    if (command != "run" && command != "validate" && command != "batch") {
        cerr << "Unrecognized command " << command << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (command != "validate" && !find_executable(sandbox::PYTHON_EXECUTABLE.string())) {
        cerr << "Python interpreter " << sandbox::PYTHON_EXECUTABLE << " not found" << endl;
        return EXIT_FAILURE;
    }

    // 嵌入的解释器只用于解析代码
    initialize_python();
    PyThread_guard guard;

    sandbox::python_ast_parser parser;
    sandbox::code_validator validator(parser, validator_config);

    string code;
    try {
        code = read_code(vm);
    } catch (exception &e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }

    if (command == "validate") {
        sandbox::validation_result result;
        try {
            result = validator.validate(code, sandbox::parse_language(vm.at("language").as<string>()));
        } catch (sandbox::invalid_language &e) {
            result.kind = sandbox::error_kind::UNSUPPORTED_LANGUAGE;
            result.error = e.what();
        }
        cout << json(result).dump(2, ' ', false, json::error_handler_t::replace) << endl;
        return result.valid ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    sandbox::directory_dataset_loader datasets(sandbox::DATASET_DIR);
    sandbox::context_builder builder(datasets);
    sandbox::process_sandbox runner(sandbox::process_options::from_config());
    sandbox::jsonl_history_sink history(sandbox::HISTORY_FILE);
    sandbox::directory_image_store images(sandbox::IMAGE_DIR);
    sandbox::sandbox_executor executor(validator, builder, runner, history, images, sandbox::INLINE_IMAGES);

    sandbox::execution_request request;
    try {
        request.lang = sandbox::parse_language(vm.at("language").as<string>());
    } catch (sandbox::invalid_language &e) {
        cerr << e.what() << endl;
        return EXIT_FAILURE;
    }
    request.timeout_seconds = vm.at("timeout").as<int>();
    request.memory_limit_mb = vm.at("memory").as<int>();
    request.caller_id = vm.at("caller").as<string>();
    if (vm.count("session")) request.session_id = vm.at("session").as<string>();

    if (command == "batch") {
        vector<sandbox::named_code_block> blocks;
        try {
            blocks = json::parse(code).get<vector<sandbox::named_code_block>>();
        } catch (json::exception &e) {
            cerr << "Malformed batch file: " << e.what() << endl;
            return EXIT_FAILURE;
        }
        auto entries = executor.execute_batch(blocks, request);
        cout << json(entries).dump(2, ' ', false, json::error_handler_t::replace) << endl;
        bool success = all_of(entries.begin(), entries.end(), [](auto &entry) { return entry.outcome.success; });
        return success ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    sandbox::cancellation cancel;
    cancel_fd = cancel.fd();
    signal(SIGINT, sigintHandler);

    request.code = code;
    sandbox::execution_outcome outcome = executor.execute(request, &cancel);
    cout << json(outcome).dump(2, ' ', false, json::error_handler_t::replace) << endl;
    return outcome.success ? EXIT_SUCCESS : EXIT_FAILURE;
}
