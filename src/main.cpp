#include "net/http_transport.hpp"
#include "net/update_service.hpp"
#include "update/updater.hpp"
#include "util/config_parser.hpp"
#include "util/duration.hpp"
#include "util/logger.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <getopt.h>
#include <optional>
#include <string>
#include <unistd.h>

namespace {

enum LongOnly : int {
    kOptLinks = 1000,
    kOptNoLinks,
    kOptTimeout,
    kOptLogLevel,
};

struct CliOverrides {
    std::optional<std::string> source;
    std::optional<std::string> protocol;
    std::optional<std::string> directory;
    std::optional<std::string> user_id;
    std::optional<std::string> license_key;
    std::optional<std::string> product_ids;
    std::optional<std::string> random_delay;
    std::optional<bool> links;
    std::optional<std::uint64_t> timeout_seconds;
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options]\n"
        "\n"
        "Options:\n"
        "  -c, --config <file>        JSON config file (default %s, optional)\n"
        "  -s, --source <host>        Update service host\n"
        "  -p, --protocol <scheme>    http or https\n"
        "  -d, --directory <dir>      Directory holding the database files\n"
        "  -u, --userid <id>          Account id\n"
        "  -k, --licensekey <key>     License key\n"
        "  -P, --productids <list>    Comma delimited product ids\n"
        "  -r, --randomdelay <dur>    Wait a random time up to <dur> first (e.g. 30m)\n"
        "      --timeout <seconds>    Per-request timeout, 0 disables\n"
        "      --links / --no-links   Create legacy symlinks (default on)\n"
        "      --log-level <level>    debug, info, warn, error or none\n"
        "  -v, --verbose              Debug logging\n"
        "  -q, --quiet                Only warnings and errors\n"
        "  -h, --help                 Show this help\n",
        argv, geoupdate::config::kDefaultConfigPath);
}

void ApplyOverrides(const CliOverrides& cli, geoupdate::config::UpdaterConfig& cfg) {
    if (cli.source) cfg.source = *cli.source;
    if (cli.protocol) cfg.protocol = *cli.protocol;
    if (cli.directory) cfg.directory = *cli.directory;
    if (cli.user_id) cfg.user_id = *cli.user_id;
    if (cli.license_key) cfg.license_key = *cli.license_key;
    if (cli.product_ids) cfg.product_ids = geoupdate::config::SplitProductIds(*cli.product_ids);
    if (cli.links) cfg.links = *cli.links;
    if (cli.timeout_seconds) cfg.timeout_seconds = *cli.timeout_seconds;
}

} // namespace

int main(int argc, char **argv) {
    CliOverrides cli;
    std::string config_path = geoupdate::config::kDefaultConfigPath;
    bool config_explicit = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"source", required_argument, nullptr, 's'},
        {"protocol", required_argument, nullptr, 'p'},
        {"directory", required_argument, nullptr, 'd'},
        {"userid", required_argument, nullptr, 'u'},
        {"licensekey", required_argument, nullptr, 'k'},
        {"productids", required_argument, nullptr, 'P'},
        {"randomdelay", required_argument, nullptr, 'r'},
        {"timeout", required_argument, nullptr, kOptTimeout},
        {"links", no_argument, nullptr, kOptLinks},
        {"no-links", no_argument, nullptr, kOptNoLinks},
        {"log-level", required_argument, nullptr, kOptLogLevel},
        {"verbose", no_argument, nullptr, 'v'},
        {"quiet", no_argument, nullptr, 'q'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hvqc:s:p:d:u:k:P:r:", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;
            case 'v':
                geoupdate::Logger::Instance().SetLevel(geoupdate::LogLevel::Debug);
                break;
            case 'q':
                geoupdate::Logger::Instance().SetLevel(geoupdate::LogLevel::Warn);
                break;
            case 'c':
                config_path = optarg;
                config_explicit = true;
                break;
            case 's': cli.source = optarg; break;
            case 'p': cli.protocol = optarg; break;
            case 'd': cli.directory = optarg; break;
            case 'u': cli.user_id = optarg; break;
            case 'k': cli.license_key = optarg; break;
            case 'P': cli.product_ids = optarg; break;
            case 'r': cli.random_delay = optarg; break;
            case kOptLinks: cli.links = true; break;
            case kOptNoLinks: cli.links = false; break;

            case kOptLogLevel: {
                auto lvl = geoupdate::ParseLogLevel(optarg);
                if (!lvl) {
                    std::fprintf(stderr, "Invalid --log-level: %s\n", optarg);
                    return 2;
                }
                geoupdate::Logger::Instance().SetLevel(*lvl);
                break;
            }

            case kOptTimeout: {
                char *end = nullptr;
                unsigned long long v = std::strtoull(optarg, &end, 10);
                if (!end || *end != '\0' || optarg[0] == '-') {
                    std::fprintf(stderr, "Invalid --timeout: %s\n", optarg);
                    return 2;
                }
                cli.timeout_seconds = static_cast<std::uint64_t>(v);
                break;
            }

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

    geoupdate::config::UpdaterConfig cfg;
    auto load_res = cfg.LoadFile(config_path);
    if (!load_res.is_ok()) {
        if (config_explicit || ::access(config_path.c_str(), F_OK) == 0) {
            LogError("cannot load config: %s", load_res.message().c_str());
            return 1;
        }
        LogDebug("No config file used: %s", load_res.message().c_str());
    }

    ApplyOverrides(cli, cfg);
    if (cli.random_delay) {
        auto parsed = geoupdate::ParseDuration(*cli.random_delay);
        if (!parsed) {
            std::fprintf(stderr, "Invalid --randomdelay: %s\n", parsed.error().c_str());
            return 2;
        }
        cfg.random_delay = *parsed;
    }

    geoupdate::CurlHttpTransport::Options http_opt;
    http_opt.timeout_seconds = static_cast<long>(cfg.timeout_seconds);
    geoupdate::CurlHttpTransport transport(http_opt);
    geoupdate::UpdateServiceClient service(transport, {cfg.protocol, cfg.source});

    geoupdate::Updater updater(service);
    geoupdate::RunSummary summary;
    auto res = updater.Run(cfg, summary);
    if (!res.is_ok()) {
        LogError("%s", res.message().c_str());
        return 1;
    }

    return summary.AllSucceeded() ? 0 : 1;
}
