#define _FILE_OFFSET_BITS 64

#include "app/provisioner.hpp"
#include "disk/disk_inventory.hpp"
#include "disk/reenumeration_waiter.hpp"
#include "image/http_client.hpp"
#include "system/privileges.hpp"
#include "system/signals.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"
#include "util/progress_sinks.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <getopt.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

enum LongOnly : int {
    kOptCacheDir = 1000,
    kOptVerify,
    kOptTarget,
};

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [options] download [VERSION]\n"
        "   %s [options] flash IMAGE [--target DEV]\n"
        "   %s [options] provision [VERSION] [--target DEV]\n"
        "   %s [options] list\n"
        "\n"
        "VERSION is 'latest' (default) or a release date YYYY-MM-DD.\n"
        "\n"
        "Options:\n"
        "  -c, --config PATH      JSON config file (default %s)\n"
        "  -v, --verbose          Debug logging\n"
        "  -y, --yes              Do not ask for confirmation before writing\n"
        "      --cache-dir DIR    Image cache directory\n"
        "      --verify           Read the card back and compare after flashing\n"
        "      --target DEV       Disk to write (e.g. /dev/sdb, disk4)\n"
        "  -h, --help             Show this help\n",
        argv, argv, argv, argv, piprov::config::kDefaultConfigPath);
}

struct CliOverrides {
    std::optional<std::string> cache_dir;
    std::optional<std::string> target;
    bool verbose = false;
    bool yes = false;
    bool verify = false;
};

piprov::Result LoadConfig(const std::string& path, bool explicit_path,
                          piprov::config::ProvisionConfig& cfg) {
    std::error_code ec;
    if (!explicit_path && !std::filesystem::exists(path, ec)) {
        cfg.Reset();
        return piprov::Result::Ok();
    }
    return cfg.LoadFile(path);
}

void ApplyOverrides(const CliOverrides& cli, piprov::config::ProvisionConfig& cfg) {
    if (cli.cache_dir) cfg.cache_dir = *cli.cache_dir;
    if (cli.target) cfg.target_disk = *cli.target;
    if (cli.verbose) cfg.verbose = true;
    if (cli.yes) cfg.require_confirmation = false;
    if (cli.verify) cfg.verify_flash = true;
}

void ConfigureLogging(const piprov::config::ProvisionConfig& cfg) {
    piprov::LogLevel lvl = piprov::LogLevel::Info;
    if (cfg.log_level) (void)piprov::ParseLogLevel(*cfg.log_level, lvl);
    if (cfg.verbose) lvl = piprov::LogLevel::Debug;
    piprov::Logger::Instance().SetLevel(lvl);
}

int Fail(const piprov::Result& r) {
    piprov::ClearProgressLine();
    if (r.kind == piprov::ErrorKind::UserAborted) {
        LogWarn("Aborted: %s", r.msg.c_str());
    } else {
        LogError("%s: %s", piprov::ErrorKindName(r.kind), r.msg.c_str());
    }
    return piprov::ExitCodeFor(r);
}

} // namespace

int main(int argc, char **argv) {
    piprov::InstallSignalHandlers();

    std::string config_path = piprov::config::kDefaultConfigPath;
    bool explicit_config = false;
    CliOverrides cli;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"yes", no_argument, nullptr, 'y'},
        {"cache-dir", required_argument, nullptr, kOptCacheDir},
        {"verify", no_argument, nullptr, kOptVerify},
        {"target", required_argument, nullptr, kOptTarget},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:vy", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                config_path = optarg;
                explicit_config = true;
                break;

            case 'v':
                cli.verbose = true;
                break;

            case 'y':
                cli.yes = true;
                break;

            case kOptCacheDir:
                cli.cache_dir = optarg;
                break;

            case kOptVerify:
                cli.verify = true;
                break;

            case kOptTarget:
                cli.target = optarg;
                break;

            default:
                PrintUsage(argv[0]);
                return 2;
        }
    }

    std::vector<std::string> args(argv + optind, argv + argc);
    if (args.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }
    const std::string command = args.front();

    if (cli.verbose) piprov::Logger::Instance().SetLevel(piprov::LogLevel::Debug);

    piprov::config::ProvisionConfig cfg;
    if (auto r = LoadConfig(config_path, explicit_config, cfg); !r.ok) {
        return Fail(r);
    }
    ApplyOverrides(cli, cfg);
    if (auto r = cfg.Validate(); !r.ok) {
        return Fail(r);
    }
    ConfigureLogging(cfg);

    // Checked before any download so "provision" does not fetch an image it cannot write.
    if (command == "flash" || command == "provision") {
        if (auto r = piprov::RequireRoot(::geteuid(), command.c_str()); !r.ok) {
            return Fail(r);
        }
    }

    piprov::CurlHttpClient http;
    piprov::SystemClock clock;
    piprov::ConsoleProgressSink progress;

    // The prompt must reach the operator even when stdin/stdout are redirected.
    std::ifstream tty("/dev/tty");
    std::istream& confirm_in = tty.is_open() ? static_cast<std::istream&>(tty) : std::cin;

    std::unique_ptr<piprov::DiskInventory> inventory;
    if (command == "flash" || command == "provision" || command == "list") {
        inventory = piprov::CreatePlatformDiskInventory(cfg.mount_base_dir);
        LogDebug("Disk inventory: %s", inventory->PlatformName());
    }

    piprov::Provisioner provisioner(cfg, {.http = &http,
                                          .inventory = inventory.get(),
                                          .clock = &clock,
                                          .confirm_in = &confirm_in,
                                          .confirm_out = &std::cerr,
                                          .progress = &progress});

    if (command == "download") {
        if (args.size() > 2) {
            PrintUsage(argv[0]);
            return 2;
        }
        const std::string version = args.size() == 2 ? args[1] : cfg.image_version;
        std::string image;
        if (auto r = provisioner.DownloadImage(version, image); !r.ok) {
            return Fail(r);
        }
        piprov::ClearProgressLine();
        std::printf("%s\n", image.c_str());
        return 0;
    }

    if (command == "flash") {
        if (args.size() != 2) {
            PrintUsage(argv[0]);
            return 2;
        }
        piprov::BootPartitionHandle boot;
        if (auto r = provisioner.FlashImage(args[1], boot); !r.ok) {
            return Fail(r);
        }
        piprov::ClearProgressLine();
        std::printf("%s\n", boot.mount_point.c_str());
        return 0;
    }

    if (command == "provision") {
        if (args.size() > 2) {
            PrintUsage(argv[0]);
            return 2;
        }
        const std::string version = args.size() == 2 ? args[1] : cfg.image_version;
        std::string image;
        if (auto r = provisioner.DownloadImage(version, image); !r.ok) {
            return Fail(r);
        }
        piprov::BootPartitionHandle boot;
        if (auto r = provisioner.FlashImage(image, boot); !r.ok) {
            return Fail(r);
        }
        piprov::ClearProgressLine();
        std::printf("%s\n", boot.mount_point.c_str());
        return 0;
    }

    if (command == "list") {
        if (args.size() != 1) {
            PrintUsage(argv[0]);
            return 2;
        }
        std::vector<piprov::ScoredDisk> disks;
        if (auto r = provisioner.ListDisks(disks); !r.ok) {
            return Fail(r);
        }
        piprov::PrintDiskTable(disks, std::cout);
        return 0;
    }

    std::fprintf(stderr, "Unknown command: %s\n", command.c_str());
    PrintUsage(argv[0]);
    return 2;
}
