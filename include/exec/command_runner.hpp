#pragma once

#include <string>
#include <vector>

namespace uploader {

struct Command {
    std::string program;
    std::vector<std::string> args;

    // Shell-quoted form, for logs and dry-run output.
    std::string ToString() const;
};

struct CommandResult {
    // Process exit status; 128+N when killed by signal N, -1 when it never started.
    int exit_code = -1;
    std::string stdout_text;
    std::string stderr_text;

    bool Succeeded() const { return exit_code == 0; }

    // One-line failure description: "exit N: <last stderr line>" (stdout when stderr is empty).
    std::string Describe() const;
};

// The only way the upload pipeline starts external processes. It runs the command
// to completion and reports; it never interprets the output.
class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;
    virtual CommandResult Run(const Command& cmd) = 0;
};

// fork/execvp with stdout and stderr captured through pipes.
class PosixCommandRunner final : public ICommandRunner {
public:
    CommandResult Run(const Command& cmd) override;
};

// Prints the command instead of running it and reports success with empty output.
class DryRunCommandRunner final : public ICommandRunner {
public:
    CommandResult Run(const Command& cmd) override;

    const std::vector<Command>& Printed() const { return printed_; }

private:
    std::vector<Command> printed_;
};

} // namespace uploader
