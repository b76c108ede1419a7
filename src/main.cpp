#include "cfg/cfg.hpp"
#include "logger/logger.hpp"
#include "master/master.hpp"
#include "utils/string.hpp"
#include <boost/exception/diagnostic_information.hpp>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <unistd.h>

using namespace std;
using namespace sigq;

static void print_help()
{
    cout << "\nsigqueue-master\n\n"
            "Options:\n"
            "  -h    This message\n"
            "  -c    Path to configuration file\n"
         << endl;
}


int main(int argc, char *argv[])
{
    int ch = 0;
    const char *config_file = nullptr;

    if (argc == 1) {
        print_help();
        return EXIT_FAILURE;
    }

    while ((ch = getopt(argc, argv, "hc:")) != -1) {
        switch (ch) {
        case 'c':
            config_file = optarg;
            break;
        case 'h':
        case '?':
        default:
            print_help();
            return EXIT_FAILURE;
        }
    }

    if (config_file == nullptr) {
        print_help();
        return EXIT_FAILURE;
    }

    try {
        cfg::cfg config;
        config.init(config_file);
        logger::init(config);

        const auto g = config.section(cfg::GENERAL_SECTION);
        if (g->get<bool>("daemonize")) {
            if (daemon(0, 0) == -1) {
                cerr << "daemon() call failed: " << utils::string::str_err(errno) << endl;
                return EXIT_FAILURE;
            }
        }

        // own process group, so QUIT can signal all workers at once;
        // fails only if we already lead one
        if (setsid() == -1)
            spdlog::debug("setsid() failed: {}", utils::string::str_err(errno));

        spdlog::info("sigqueue-master {} starting", getpid());
        master m(master_options::from_cfg(config));
        m.run();

        spdlog::info("sigqueue-master shutting down");
        return EXIT_SUCCESS;
    } catch (const cfg::cfg_exception &e) {
        spdlog::error("Configuration file error: {}", e.what());
    } catch (const boost::exception &e) {
        spdlog::error("Boost exception caught: {}", boost::diagnostic_information(e));
    } catch (const exception &e) {
        spdlog::error("Exception caught: {}", e.what());
    }

    return EXIT_FAILURE;
}
