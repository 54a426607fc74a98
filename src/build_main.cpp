#include "debsnap/builder/build_pipeline.hpp"
#include "debsnap/builder/repacker.hpp"
#include "debsnap/builder/worker_pool.hpp"
#include "debsnap/system/command_runner.hpp"
#include "debsnap/system/signals.hpp"
#include "debsnap/util/config_parser.hpp"
#include "debsnap/util/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <getopt.h>
#include <memory>
#include <optional>
#include <string>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [--repo-dir <dir>] [--include-updates] [--register] [--trusted=no]\n"
        "      [--jobs <n>] [--cache-dir <dir>] [--config <file>] [--log-file <file>] [--verbose]\n"
        "\n"
        "Options:\n"
        "  -r, --repo-dir         Where to build the repository (default: $HOME/offline-repo)\n"
        "  -u, --include-updates  Download pending updates into the APT cache first (no install)\n"
        "  -g, --register         Add the repository to this host's sources and apt-get update\n"
        "      --trusted=no       Omit [trusted=yes] from the registered source line\n"
        "  -j, --jobs             Parallel workers (default: number of CPUs)\n"
        "  -c, --cache-dir        APT archive cache (default /var/cache/apt/archives)\n"
        "  -C, --config           JSON config file (default /etc/debsnap/build.json)\n"
        "  -L, --log-file         Also append log lines to this file\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv);
}

std::string DefaultRepoDir() {
    const char *home = std::getenv("HOME");
    return std::string(home && *home ? home : "/root") + "/offline-repo";
}

} // namespace

int main(int argc, char **argv) {
    if (auto sr = debsnap::InstallSignalHandlers(); !sr.is_ok()) {
        std::fprintf(stderr, "WARN: %s\n", sr.msg.c_str());
    }

    std::optional<std::string> repo_dir;
    std::optional<std::string> cache_dir;
    std::optional<std::string> log_file;
    std::optional<unsigned> jobs;
    std::optional<bool> trusted;
    bool include_updates = false;
    bool register_repo = false;
    bool verbose = false;
    std::string config_path = debsnap::config::kDefaultBuildConfigPath;
    bool config_explicit = false;

    static option long_opts[] = {
        {"repo-dir", required_argument, nullptr, 'r'},
        {"include-updates", no_argument, nullptr, 'u'},
        {"register", no_argument, nullptr, 'g'},
        {"trusted", required_argument, nullptr, 't'},
        {"jobs", required_argument, nullptr, 'j'},
        {"cache-dir", required_argument, nullptr, 'c'},
        {"config", required_argument, nullptr, 'C'},
        {"log-file", required_argument, nullptr, 'L'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hr:ugj:c:C:L:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'r':
                repo_dir = optarg;
                break;

            case 'u':
                include_updates = true;
                break;

            case 'g':
                register_repo = true;
                break;

            case 't':
                if (std::strcmp(optarg, "no") == 0) {
                    trusted = false;
                } else if (std::strcmp(optarg, "yes") == 0) {
                    trusted = true;
                } else {
                    std::fprintf(stderr, "Invalid --trusted: %s (expected yes or no)\n", optarg);
                    return 2;
                }
                break;

            case 'j': {
                char *end = nullptr;
                unsigned long v = std::strtoul(optarg, &end, 10);
                if (!end || *end != '\0' || v == 0 || v > debsnap::kMaxJobs) {
                    std::fprintf(stderr, "Invalid --jobs: %s\n", optarg);
                    return 2;
                }
                jobs = static_cast<unsigned>(v);
                break;
            }

            case 'c':
                cache_dir = optarg;
                break;

            case 'C':
                config_path = optarg;
                config_explicit = true;
                break;

            case 'L':
                log_file = optarg;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return 2;
    }

    debsnap::config::BuilderConfigFromFile cfg;
    std::error_code ec;
    if (config_explicit || std::filesystem::exists(config_path, ec)) {
        if (!cfg.LoadFile(config_path)) {
            std::fprintf(stderr, "ERROR: cannot load config: %s\n", config_path.c_str());
            return 1;
        }
    }

    auto &logger = debsnap::Logger::Instance();
    if (verbose) logger.SetLevel(debsnap::LogLevel::Debug);
    const std::string log_path = log_file.value_or(cfg.log_file.value_or(""));
    if (!log_path.empty() && !logger.SetLogFile(log_path)) {
        std::fprintf(stderr, "ERROR: cannot open log file: %s\n", log_path.c_str());
        return 1;
    }

    debsnap::BuildOptions opt;
    opt.repo_dir = std::filesystem::absolute(repo_dir.value_or(cfg.repo_dir.value_or(DefaultRepoDir())), ec);
    if (ec) {
        std::fprintf(stderr, "ERROR: bad repository directory: %s\n", ec.message().c_str());
        return 1;
    }
    if (cache_dir) {
        opt.cache_dir = *cache_dir;
    } else if (cfg.cache_dir) {
        opt.cache_dir = *cfg.cache_dir;
    }
    opt.include_updates = include_updates || cfg.include_updates.value_or(false);
    opt.register_repo = register_repo || cfg.register_repo.value_or(false);
    opt.trusted = trusted.value_or(cfg.trusted.value_or(true));
    if (jobs) {
        opt.jobs = *jobs;
    } else if (cfg.jobs) {
        opt.jobs = static_cast<unsigned>(*cfg.jobs);
    }

    auto runner = debsnap::DefaultCommandRunner();
    auto repacker = std::make_shared<debsnap::DpkgRepacker>(runner);

    debsnap::BuildReport report;
    auto res = debsnap::BuildPipeline(runner, repacker, opt).Run(report);
    if (!res.ok) {
        std::fprintf(stderr, "ERROR: %s\n", res.msg.c_str());
        return 1;
    }

    std::printf("[ok] Repo built at: %s\n", opt.repo_dir.c_str());
    std::printf("     pool/  Packages  Packages.gz  Release  installed-packages.csv\n");
    std::printf("     %zu archives, %zu repacked, %zu skipped\n", report.inventory.rows.size(),
                report.reconcile.repacked, report.reconcile.skipped);
    for (const auto &item : report.reconcile.Skipped()) {
        std::printf("     skipped %s: %s\n", item.record.ToString().c_str(), item.reason.c_str());
    }
    return 0;
}
