#include <grader/logging.hpp>

#include <catch2/catch_session.hpp>
#include <libassert/assert.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <stdexcept>

void libassert_handler(const libassert::assertion_info& info) {
    LOG_ERROR(info.to_string());

    throw std::runtime_error(info.to_string());
}

int main(int argc, char* argv[]) {
    grader::init_loggers();

    // The runner and sandbox log every spawn and state change at debug level, which drowns out
    // Catch2's own output. LOG_LEVEL still wins when set.
    if (std::getenv("LOG_LEVEL") == nullptr) {
        spdlog::set_level(spdlog::level::warn);
    }

    libassert::set_failure_handler(libassert_handler);

    int result = Catch::Session().run(argc, argv);

    return result;
}
