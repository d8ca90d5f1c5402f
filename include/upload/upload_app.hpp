#pragma once

#include "exec/command_runner.hpp"
#include "util/config_parser.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace uploader {

struct CliOptions {
    std::string config_path = config::kDefaultConfigFile;
    std::string directory = ".";
    std::optional<std::string> progress_file;   // overrides the config value
    std::vector<std::string> reset_keys;        // NAME:TAG
    bool reset_all = false;
    bool dry_run = false;
    bool validate_only = false;
    bool verbose = false;
};

// Mode dispatch for the command line tool. Returns the process exit code:
// 0 success, 1 any failure.
class UploadApp {
public:
    UploadApp();
    // |runner| executes live uploads; dry runs always use DryRunCommandRunner.
    explicit UploadApp(std::unique_ptr<ICommandRunner> runner);

    int Run(const CliOptions& opts);

private:
    int RunReset(const CliOptions& opts);
    int RunValidate(const CliOptions& opts, const config::UploaderConfig& cfg);
    int RunUpload(const CliOptions& opts, const config::UploaderConfig& cfg);

    Result ApplyLogging(const CliOptions& opts, const config::UploaderConfig* cfg) const;
    std::string ProgressPath(const CliOptions& opts, const config::UploaderConfig* cfg) const;

    std::unique_ptr<ICommandRunner> runner_;
};

} // namespace uploader
