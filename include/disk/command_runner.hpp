#pragma once

#include "util/result.hpp"

#include <string>
#include <vector>

namespace piprov {

struct CommandOutput {
    int exit_code = -1;
    std::string out;
};

class ICommandRunner {
public:
    virtual ~ICommandRunner() = default;

    // Runs argv[0] from PATH, capturing stdout. A non-zero exit is not a failure
    // of Run itself; callers inspect exit_code.
    virtual Result Run(const std::vector<std::string>& argv, CommandOutput& out) const = 0;
};

class ProcessRunner final : public ICommandRunner {
public:
    Result Run(const std::vector<std::string>& argv, CommandOutput& out) const override;
};

// Run + require exit status 0; the failure message names the command.
Result RunChecked(const ICommandRunner& runner,
                  const std::vector<std::string>& argv,
                  std::string* out_stdout = nullptr);

} // namespace piprov
