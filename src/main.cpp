#include <glog/logging.h>
#include <signal.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include "common/stl_utils.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "runner/launcher.hpp"
using namespace std;

static int exit_code_of(const ptyrun::execution_result &result) {
    return visit(ptyrun::overloaded{
                     [](const ptyrun::compilation_failed &) { return (int)ptyrun::E_COMPILER_ERROR; },
                     [](const ptyrun::unsupported_file &) { return (int)ptyrun::E_UNSUPPORTED_FILE; },
                     [](const ptyrun::run_completed &) { return (int)ptyrun::E_SUCCESS; },
                     [](const ptyrun::system_failure &) { return (int)ptyrun::E_INTERNAL_ERROR; }},
                 result);
}

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);

    // A program that dies while we write to its terminal must not take us with it.
    signal(SIGPIPE, SIG_IGN);

    namespace po = boost::program_options;
    po::options_description desc("ptyrun options");
    po::positional_options_description positional;
    po::variables_map vm;

    // clang-format off
    desc.add_options()
        ("source,s", po::value<string>(), "C or C++ source file to compile and run interactively")
        ("timeout,t", po::value<int>(), "wall-clock limit of the program in seconds, default to 300")
        ("sandbox-root,r", po::value<string>(), "set the directory where temporary sandboxes are created, default to ./logs. You can either pass it from environ SANDBOXROOT")
        ("compiler", po::value<string>(), "set the compiler used for both C and C++ sources, default to g++. You can either pass it from environ COMPILER")
        ("std", po::value<string>(), "set the language standard flag passed to the compiler, default to -std=c++11")
        ("compile-time-limit", po::value<int>(), "set time limit in seconds of the compiler, default to 60")
        ("grace-period", po::value<int>(), "set milliseconds between SIGTERM and SIGKILL when stopping the program, default to 5000")
        ("result-file,o", po::value<string>(), "write the result record as JSON to this file instead of standard output")
        ("help", "display this help text")
        ("version", "display version of this application");
    // clang-format on
    positional.add("source", 1);

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
        return ptyrun::E_BAD_OPTIONS;
    }

    if (vm.count("help")) {
        cout << "ptyrun: compile a single C/C++ source file and run it on a pseudo terminal" << endl
             << "Type Ctrl-C to stop the program, it is killed when the timeout expires." << endl
             << "Usage: " << argv[0] << " [options] <source>" << endl;
        cout << desc << endl;
        return ptyrun::E_SUCCESS;
    }

    if (vm.count("version")) {
        cout << "ptyrun 1.0" << endl;
        return ptyrun::E_SUCCESS;
    }

    if (!vm.count("source")) {
        cerr << "no source file given" << endl
             << endl;
        cerr << desc << endl;
        return ptyrun::E_BAD_OPTIONS;
    }
    filesystem::path source(vm.at("source").as<string>());

    int timeout = (int)ptyrun::DEFAULT_TIMEOUT.count();
    if (vm.count("timeout")) {
        timeout = vm["timeout"].as<int>();
    }
    if (timeout <= 0) {
        cerr << "timeout must be positive" << endl;
        return ptyrun::E_BAD_OPTIONS;
    }

    if (vm.count("sandbox-root")) {
        ptyrun::SANDBOX_ROOT = filesystem::path(vm.at("sandbox-root").as<string>());
    } else if (getenv("SANDBOXROOT")) {
        ptyrun::SANDBOX_ROOT = filesystem::path(getenv("SANDBOXROOT"));
    }

    if (vm.count("compiler")) {
        ptyrun::COMPILER = vm.at("compiler").as<string>();
    } else {
        ptyrun::COMPILER = ptyrun::get_env("COMPILER", ptyrun::COMPILER);
    }

    if (vm.count("std")) {
        ptyrun::COMPILER_STANDARD = vm.at("std").as<string>();
    }

    try {
        if (vm.count("compile-time-limit")) {
            ptyrun::COMPILE_TIME_LIMIT = chrono::seconds(vm["compile-time-limit"].as<int>());
        } else if (getenv("COMPILETIMELIMIT")) {
            ptyrun::COMPILE_TIME_LIMIT = chrono::seconds(boost::lexical_cast<int>(getenv("COMPILETIMELIMIT")));
        }
    } catch (boost::bad_lexical_cast &) {
        cerr << "COMPILETIMELIMIT must be an integer" << endl;
        return ptyrun::E_BAD_OPTIONS;
    }

    if (vm.count("grace-period")) {
        ptyrun::KILL_GRACE_PERIOD = chrono::milliseconds(vm["grace-period"].as<int>());
    }

    if (ptyrun::COMPILE_TIME_LIMIT.count() <= 0 || ptyrun::KILL_GRACE_PERIOD.count() < 0) {
        cerr << "time limits must be positive" << endl;
        return ptyrun::E_BAD_OPTIONS;
    }

    LOG(INFO) << "running " << source.string() << " with timeout " << timeout << "s, sandboxes in " << ptyrun::SANDBOX_ROOT.string();

    ptyrun::session_options options;
    options.grace_period = ptyrun::KILL_GRACE_PERIOD;
    options.show_banners = true;

    ptyrun::process_launcher launcher(ptyrun::SANDBOX_ROOT, options);

    auto result = launcher.execute(source, timeout);

    cerr << ptyrun::describe(result) << endl;

    string record = ptyrun::result_to_json(result).dump(4, ' ', false, nlohmann::json::error_handler_t::replace);
    if (vm.count("result-file")) {
        ofstream fout(vm.at("result-file").as<string>());
        fout << record << endl;
        if (!fout) {
            LOG(ERROR) << "unable to write result file " << vm.at("result-file").as<string>();
            return ptyrun::E_INTERNAL_ERROR;
        }
    } else {
        cout << record << endl;
    }

    return exit_code_of(result);
}
