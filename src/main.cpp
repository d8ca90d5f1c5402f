#include "system/signals.hpp"
#include "upload/upload_app.hpp"

#include <cstdio>
#include <cstring>
#include <getopt.h>
#include <string>

namespace {

void PrintUsage(const char *argv) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c config.json] [-d dir] [--dry-run] [--validate]\n"
        "      [--reset NAME:TAG]... [--reset-all] [--progress-file path] [-v]\n"
        "\n"
        "Options:\n"
        "  -c, --config           Configuration file (default config.json); a relative\n"
        "                         assets_file in it is resolved against the config\n"
        "                         file's directory\n"
        "  -d, --dir              Directory holding the asset files (default .)\n"
        "  -n, --dry-run          Print the commands, do not run them or touch the progress file\n"
        "  -V, --validate         Only check that every manifest entry, in any section,\n"
        "                         has a matching file\n"
        "  -r, --reset NAME:TAG   Forget the progress record of one asset (repeatable)\n"
        "  -R, --reset-all        Forget all progress records\n"
        "  -p, --progress-file    Progress file (default <dir>/.progress.json)\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv);
}

} // namespace

int main(int argc, char **argv) {
    uploader::InstallSignalHandlers();

    uploader::CliOptions opts;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"dir", required_argument, nullptr, 'd'},
        {"dry-run", no_argument, nullptr, 'n'},
        {"validate", no_argument, nullptr, 'V'},
        {"reset", required_argument, nullptr, 'r'},
        {"reset-all", no_argument, nullptr, 'R'},
        {"progress-file", required_argument, nullptr, 'p'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:d:nVr:Rp:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return 0;

            case 'c':
                opts.config_path = optarg;
                break;

            case 'd':
                opts.directory = optarg;
                break;

            case 'n':
                opts.dry_run = true;
                break;

            case 'V':
                opts.validate_only = true;
                break;

            case 'r':
                if (std::strchr(optarg, ':') == nullptr) {
                    std::fprintf(stderr, "Invalid --reset (expected NAME:TAG): %s\n", optarg);
                    return 2;
                }
                opts.reset_keys.emplace_back(optarg);
                break;

            case 'R':
                opts.reset_all = true;
                break;

            case 'p':
                opts.progress_file = optarg;
                break;

            case 'v':
                opts.verbose = true;
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
    if (opts.dry_run && opts.validate_only) {
        std::fprintf(stderr, "--dry-run and --validate are mutually exclusive\n");
        return 2;
    }

    uploader::UploadApp app;
    return app.Run(opts);
}
