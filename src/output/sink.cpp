#include "output/sink.hpp"

#include <grader/logging.hpp>

#include <cstdio>
#include <mutex>
#include <string_view>

namespace grader {

void FileSink::write(std::string_view str) {
    std::lock_guard lock{mutex_};

    if (std::fwrite(str.data(), 1, str.size(), file_) != str.size()) {
        LOG_WARN("Report output cut short after a failed write: {}", get_err_msg());
    }
}

void FileSink::flush() {
    std::lock_guard lock{mutex_};

    if (std::fflush(file_) != 0) {
        LOG_WARN("Could not flush report output: {}", get_err_msg());
    }
}

} // namespace grader
