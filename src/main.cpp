#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <nlohmann/json.hpp>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/json_utils.hpp"
#include "common/system.hpp"
#include "config.hpp"
#include "judge/orchestrator.hpp"
#include "language/registry.hpp"
using namespace std;

static string read_input(const string& path) {
    if (path.empty() || path == "-")
        return string(istreambuf_iterator<char>(cin), istreambuf_iterator<char>());
    return grader::read_file_content(path);
}

static void write_output(const string& path, const nlohmann::json& j) {
    if (path.empty() || path == "-")
        cout << grader::dump_json(j, 2) << endl;
    else
        grader::write_file_content(path, grader::dump_json(j, 2) + "\n");
}

int main(int argc, char* argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("codegrader options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("input,i", po::value<string>()->default_value("-"), "submission json file to grade, default to stdin")
        ("output,o", po::value<string>()->default_value("-"), "file to write the report json to, default to stdout")
        ("run-dir", po::value<string>(), "set the directory to create scratch directories of submissions in. You can either pass it from environ RUNDIR")
        ("workers", po::value<size_t>(), "set the maximum number of test cases run concurrently for one submission. You can either pass it from environ WORKERS")
        ("run-user", po::value<string>(), "set the user (name or id) to run compilers and submissions as. Required when running as root. You can either pass it from environ RUNUSER")
        ("run-group", po::value<string>(), "set the group (name or id) to run compilers and submissions as, default to the primary group of the run user. You can either pass it from environ RUNGROUP")
        ("cgroup", "limit memory of user programs by cgroup, requires root privilege. You can either pass it from environ USECGROUP")
        ("config", po::value<string>(), "set the configuration file overriding executables, compilers and limits of languages. You can either pass it from environ GRADERCONFIG")
        ("syntax-only", "only check the syntax of the submission source, the report is a syntax check result")
        ("verbose", "attach compile logs to the report even if compilation succeeds")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on

    try {
        po::store(po::command_line_parser(argc, argv)
                      .options(desc)
                      .run(),
                  vm);
        po::notify(vm);
    } catch (po::error& e) {
        cerr << e.what() << endl
             << endl;
        cerr << desc << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("help")) {
        cout << "codegrader: Compile and run a submission against its test cases under resource limits" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "codegrader 1.0" << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("run-dir")) {
        grader::RUN_DIR = filesystem::path(vm.at("run-dir").as<string>());
    } else if (getenv("RUNDIR")) {
        grader::RUN_DIR = filesystem::path(getenv("RUNDIR"));
    }
    filesystem::create_directories(grader::RUN_DIR);
    CHECK(filesystem::is_directory(grader::RUN_DIR))
        << "Run directory " << grader::RUN_DIR << " does not exist";

    if (vm.count("workers")) {
        grader::WORKER_COUNT = vm["workers"].as<size_t>();
    } else if (getenv("WORKERS")) {
        grader::WORKER_COUNT = boost::lexical_cast<size_t>(getenv("WORKERS"));
    }
    CHECK(grader::WORKER_COUNT > 0) << "At least one worker is required";

    string run_user, run_group;
    if (vm.count("run-user")) {
        run_user = vm["run-user"].as<string>();
    } else if (getenv("RUNUSER")) {
        run_user = getenv("RUNUSER");
    }
    if (vm.count("run-group")) {
        run_group = vm["run-group"].as<string>();
    } else if (getenv("RUNGROUP")) {
        run_group = getenv("RUNGROUP");
    }
    if (!run_user.empty()) {
        grader::RUN_USER_ID = grader::get_userid(run_user.c_str());
        CHECK(grader::RUN_USER_ID >= 0) << "Run user " << run_user << " does not exist";
        CHECK(grader::RUN_USER_ID != 0) << "Run user must not be root";
        grader::RUN_GROUP_ID = run_group.empty()
                                   ? grader::get_primary_groupid(grader::RUN_USER_ID)
                                   : grader::get_groupid(run_group.c_str());
        CHECK(grader::RUN_GROUP_ID >= 0) << "Run group of user " << run_user << " does not exist";
    } else {
        CHECK(run_group.empty()) << "Run group requires a run user";
        CHECK(geteuid() != 0) << "Refusing to run submissions as root, pass --run-user";
    }

    if (vm.count("cgroup") || getenv("USECGROUP")) {
        grader::USE_CGROUP = true;
        if (getuid() != 0)
            LOG(WARNING) << "cgroup memory limits usually require privileged mode";
    }

    // 让评测系统写入的数据只允许当前用户写入
    umask(0022);

    grader::language_registry registry = grader::language_registry::with_defaults();

    string config_file;
    if (vm.count("config")) {
        config_file = vm["config"].as<string>();
    } else if (getenv("GRADERCONFIG")) {
        config_file = getenv("GRADERCONFIG");
    }
    if (!config_file.empty()) {
        CHECK(filesystem::is_regular_file(config_file))
            << "Configuration file " << config_file << " does not exist";
        try {
            nlohmann::json config = nlohmann::json::parse(grader::read_file_content(config_file));
            if (auto languages = grader::find_optional(config, "languages"))
                registry.configure(*languages);
        } catch (std::exception& e) {
            LOG(FATAL) << "Configuration file " << config_file << " is malformed: " << e.what();
        }
    }

    grader::execution_orchestrator orchestrator(registry, grader::WORKER_COUNT);

    nlohmann::json request;
    try {
        request = nlohmann::json::parse(read_input(vm["input"].as<string>()));
    } catch (std::exception& e) {
        LOG(ERROR) << "Unable to read submission: " << e.what();
        cerr << "Unable to read submission: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    try {
        if (vm.count("syntax-only")) {
            string language = request.at("language").get<string>();
            string source = request.value("source", "");
            write_output(vm["output"].as<string>(), orchestrator.validate_syntax(language, source));
        } else {
            grader::submission submit = request.get<grader::submission>();
            if (vm.count("verbose")) submit.verbose = true;
            write_output(vm["output"].as<string>(), orchestrator.grade(submit));
        }
    } catch (std::exception& e) {
        LOG(ERROR) << "Malformed submission: " << grader::describe_exception(e);
        cerr << "Malformed submission: " << e.what() << endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
