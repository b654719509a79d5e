#include <grader/sandbox/execute.hpp>

#include "sandbox/sandboxed_process.hpp"

#include <grader/common/error_types.hpp>
#include <grader/common/expected.hpp>
#include <grader/logging.hpp>

#include <fmt/ranges.h>

#include <future>
#include <string>
#include <utility>
#include <vector>

namespace grader {

Expected<ExecutionResult> execute(const std::string& executable, const std::vector<std::string>& arguments,
                                  const ExecuteOptions& options) {
    LOG_TRACE("execute({:?}, {})", executable, arguments);

    SandboxedProcess process{executable, arguments, options};

    TRY(process.start());

    return process.supervise();
}

std::future<Expected<ExecutionResult>> execute_async(std::string executable, std::vector<std::string> arguments,
                                                     ExecuteOptions options) {
    return std::async(std::launch::async,
                      [executable = std::move(executable), arguments = std::move(arguments),
                       options = std::move(options)] { return execute(executable, arguments, options); });
}

} // namespace grader
