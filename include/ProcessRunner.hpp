#pragma once

#include <string>
#include <vector>

struct ProcessResult
{
    int ExitCode = -1; //127 when the program could not be executed, 128+N when killed by signal N
    std::string StdOut;
    std::string StdErr;

    bool Succeeded() const { return ExitCode == 0; }
};

class ProcessRunner
{
public:
    // Blocks until the child exits. Throws std::runtime_error if no child could be started.
    static ProcessResult Run(const std::vector<std::string>& Args);

    static bool FindInPath(const std::string& Tool);

    static std::string Trim(const std::string& Text);
};
