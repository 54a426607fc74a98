#include "debsnap/installer/install_pipeline.hpp"
#include "debsnap/system/command_runner.hpp"
#include "debsnap/system/signals.hpp"
#include "debsnap/util/config_parser.hpp"
#include "debsnap/util/logger.hpp"
#include "debsnap/util/path_utils.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <getopt.h>
#include <optional>
#include <string>

namespace {

constexpr const char *kDefaultLogDir = "/var/log";

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [--search-root <dir>] [--stage-dir <dir>] [--config <file>] [--log-dir <dir>]\n"
        "      [--verify-hashes] [--verbose]\n"
        "\n"
        "Replaces every APT source with a local flat repository found below the\n"
        "search root and upgrades the system from it.\n"
        "\n"
        "Options:\n"
        "  -s, --search-root      Where to look for the repository (default: current directory)\n"
        "  -d, --stage-dir        Staging location (default /opt/offline-repo)\n"
        "  -C, --config           JSON config file (default /etc/debsnap/install.json)\n"
        "  -l, --log-dir          Directory of the run log (default /var/log)\n"
        "  -H, --verify-hashes    Check SHA256 of every staged archive against the index\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n"
        "\n"
        "Exit status: 0 ok, 1 failure, 2 usage, 3 preflight, 4 no repository,\n"
        "5 staging failed, 6 stray source, 7 source verification failed\n",
        argv);
}

int Exit(debsnap::InstallExit e) { return static_cast<int>(e); }

} // namespace

int main(int argc, char **argv) {
    if (auto sr = debsnap::InstallSignalHandlers(); !sr.is_ok()) {
        std::fprintf(stderr, "WARN: %s\n", sr.msg.c_str());
    }

    std::optional<std::string> search_root;
    std::optional<std::string> stage_dir;
    std::optional<std::string> log_dir;
    bool verify_hashes = false;
    bool verbose = false;
    std::string config_path = debsnap::config::kDefaultInstallConfigPath;
    bool config_explicit = false;

    static option long_opts[] = {
        {"search-root", required_argument, nullptr, 's'},
        {"stage-dir", required_argument, nullptr, 'd'},
        {"config", required_argument, nullptr, 'C'},
        {"log-dir", required_argument, nullptr, 'l'},
        {"verify-hashes", no_argument, nullptr, 'H'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hs:d:C:l:Hv", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 's':
                search_root = optarg;
                break;

            case 'd':
                stage_dir = optarg;
                break;

            case 'C':
                config_path = optarg;
                config_explicit = true;
                break;

            case 'l':
                log_dir = optarg;
                break;

            case 'H':
                verify_hashes = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return Exit(debsnap::InstallExit::kUsage);
        }
    }

    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return Exit(debsnap::InstallExit::kUsage);
    }

    debsnap::config::InstallerConfigFromFile cfg;
    std::error_code ec;
    if (config_explicit || std::filesystem::exists(config_path, ec)) {
        if (!cfg.LoadFile(config_path)) {
            std::fprintf(stderr, "ERROR: cannot load config: %s\n", config_path.c_str());
            return Exit(debsnap::InstallExit::kPreflight);
        }
    }

    auto &logger = debsnap::Logger::Instance();
    if (verbose) logger.SetLevel(debsnap::LogLevel::Debug);

    const std::string stamp = debsnap::UtcStamp();
    const std::filesystem::path log_path = std::filesystem::path(log_dir.value_or(cfg.log_dir.value_or(kDefaultLogDir))) /
                                           ("offline-upgrade-" + stamp + ".log");
    if (!logger.SetLogFile(log_path.string())) {
        std::fprintf(stderr, "ERROR: cannot open log file: %s\n", log_path.c_str());
        return Exit(debsnap::InstallExit::kPreflight);
    }

    debsnap::InstallOptions opt;
    opt.stamp = stamp;
    opt.search_root = search_root.value_or(cfg.search_root.value_or("."));
    if (stage_dir) {
        opt.stage_dir = *stage_dir;
    } else if (cfg.stage_dir) {
        opt.stage_dir = *cfg.stage_dir;
    }
    if (cfg.sources_list) opt.layout.sources_list = *cfg.sources_list;
    if (cfg.sources_list_dir) opt.layout.sources_list_d = *cfg.sources_list_dir;
    if (cfg.backup_dir) opt.layout.backup_base = *cfg.backup_dir;
    if (cfg.lists_dir) opt.lists_dir = *cfg.lists_dir;
    opt.verify_hashes = verify_hashes || cfg.verify_pool_hashes.value_or(false);
    if (cfg.upgrade_passes) opt.upgrade.passes = static_cast<unsigned>(*cfg.upgrade_passes);
    if (cfg.extra_packages) opt.upgrade.extra_packages = *cfg.extra_packages;
    if (cfg.desktop_meta) opt.upgrade.desktop_meta = *cfg.desktop_meta;
    if (cfg.refresh_boot) opt.upgrade.refresh_boot = *cfg.refresh_boot;

    const auto outcome = debsnap::InstallPipeline(debsnap::DefaultCommandRunner(), opt).Run();
    if (!outcome.ok()) {
        std::fprintf(stderr, "ERROR: %s\n", outcome.message.c_str());
        std::fprintf(stderr, "Log: %s\n", log_path.c_str());
        return Exit(outcome.exit);
    }

    std::printf("\nUpgrade done. Reboot to load the new kernel.\n");
    std::printf("Previous sources: %s\n", outcome.quarantine_dir.c_str());
    std::printf("Log: %s\n", log_path.c_str());
    return 0;
}
