#include <glog/logging.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <iostream>
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "exec/orchestrator.hpp"
#include "exec/process.hpp"
#include "exec/sandbox.hpp"
#include "server/http_server.hpp"
#include "server/router.hpp"
using namespace std;

/**
 * @brief 检查 nsjail 是否可用
 * nsjail 没有 --version 参数，因此只检查 --help 能否正常返回
 */
static bool check_nsjail(const filesystem::path &nsjail) {
    pyexec::process_options opt;
    opt.command = make_command(nsjail, "--help");
    opt.wall_limit = chrono::seconds(5);
    try {
        auto outcome = pyexec::run_process(opt);
        return outcome.exitcode == 0;
    } catch (std::exception &e) {
        LOG(ERROR) << "Unable to run " << nsjail << ": " << e.what();
        return false;
    }
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    namespace po = boost::program_options;
    po::options_description desc("pyexec options");
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("config", po::value<string>(), "load configurations from the given JSON file, command line options and environment variables take precedence")
        ("script-dir", po::value<string>(), "set the directory to store generated wrapper scripts. You can either pass it from environ SCRIPTDIR")
        ("sandbox-config-dir", po::value<string>(), "set the directory with nsjail configuration files python_cloud_run.cfg and python_secure.cfg. You can either pass it from environ NSJAIL_CONFIG_DIR")
        ("nsjail", po::value<string>(), "set the location of nsjail executable, default to /usr/local/bin/nsjail. You can either pass it from environ NSJAIL")
        ("python", po::value<string>(), "set the location of python interpreter, default to /usr/local/bin/python3. You can either pass it from environ PYTHON")
        ("grace", po::value<int>(), "set extra seconds to wait for nsjail beyond the requested timeout, default to 5")
        ("host", po::value<string>(), "set the address to listen on, default to 0.0.0.0")
        ("port", po::value<unsigned short>(), "set the port to listen on, default to 8080. You can either pass it from environ PORT")
        ("debug", "turn on the debug mode to start even if nsjail or its configuration files are unavailable")
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
        cout << "pyexec: Execute untrusted Python scripts in nsjail and return the result of main()" << endl
             << "Usage: " << argv[0] << " [options]" << endl;
        cout << desc << endl;
        return EXIT_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "pyexec 1.0" << endl;
        return EXIT_SUCCESS;
    }

    pyexec::configuration config;

    if (vm.count("config")) {
        filesystem::path config_file(vm.at("config").as<string>());
        CHECK(filesystem::is_regular_file(config_file))
            << "Configuration file " << config_file << " does not exist";
        try {
            nlohmann::json j = nlohmann::json::parse(pyexec::read_file_content(config_file));
            pyexec::from_json(j, config);
        } catch (std::exception &e) {
            LOG(FATAL) << "Configuration file " << config_file << " is malformed: " << e.what();
        }
    }

    if (vm.count("debug")) {
        config.debug = true;
    } else if (getenv("DEBUG")) {
        config.debug = true;
    }

    if (vm.count("script-dir")) {
        config.script_dir = filesystem::path(vm.at("script-dir").as<string>());
    } else if (getenv("SCRIPTDIR")) {
        config.script_dir = filesystem::path(getenv("SCRIPTDIR"));
    }
    filesystem::create_directories(config.script_dir);
    CHECK(filesystem::is_directory(config.script_dir))
        << "Script directory " << config.script_dir << " does not exist";
    config.script_dir = filesystem::weakly_canonical(config.script_dir);

    if (vm.count("sandbox-config-dir")) {
        config.sandbox_config_dir = filesystem::path(vm.at("sandbox-config-dir").as<string>());
    } else if (getenv("NSJAIL_CONFIG_DIR")) {
        config.sandbox_config_dir = filesystem::path(getenv("NSJAIL_CONFIG_DIR"));
    }

    if (vm.count("nsjail")) {
        config.nsjail = filesystem::path(vm.at("nsjail").as<string>());
    } else if (getenv("NSJAIL")) {
        config.nsjail = filesystem::path(getenv("NSJAIL"));
    }

    if (vm.count("python")) {
        config.python = filesystem::path(vm.at("python").as<string>());
    } else if (getenv("PYTHON")) {
        config.python = filesystem::path(getenv("PYTHON"));
    }

    if (vm.count("grace")) {
        config.grace_seconds = vm.at("grace").as<int>();
    }
    CHECK(config.grace_seconds >= 0) << "Grace period should not be negative";

    if (vm.count("host")) {
        config.host = vm.at("host").as<string>();
    }

    if (vm.count("port")) {
        config.port = vm.at("port").as<unsigned short>();
    } else if (getenv("PORT")) {
        config.port = boost::lexical_cast<unsigned short>(getenv("PORT"));
    }

    // 生成的脚本只允许当前用户写入
    umask(0022);

    if (check_nsjail(config.nsjail)) {
        LOG(INFO) << "NSJail is available";
    } else if (config.debug) {
        LOG(WARNING) << "NSJail is not available at " << config.nsjail;
    } else {
        LOG(ERROR) << "NSJail is not available. Please install nsjail first.";
        return EXIT_FAILURE;
    }

    if (!filesystem::is_regular_file(config.sandbox_config_dir / config.fallback_profile)) {
        if (config.debug) {
            LOG(WARNING) << "NSJail configuration files not found in " << config.sandbox_config_dir;
        } else {
            LOG(ERROR) << "NSJail configuration files not found in " << config.sandbox_config_dir << ". Please run setup first.";
            return EXIT_FAILURE;
        }
    }

    LOG(INFO) << "Starting Python Script Execution API";
    LOG(INFO) << "Scripts directory: " << config.script_dir;

    try {
        pyexec::nsjail_sandbox box(config);
        pyexec::orchestrator executor(config, box);
        pyexec::server::router handler(executor, box);
        pyexec::server::http_server server(config, handler);
        server.run();
    } catch (std::exception &e) {
        LOG(ERROR) << "Server terminated: " << e.what() << endl
                   << boost::diagnostic_information(e);
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
