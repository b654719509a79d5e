#include "app/grader_app.hpp"
#include "user/cl_args.hpp"
#include "user/program_options.hpp"

#include <grader/api/exercise.hpp>
#include <grader/logging.hpp>
#include <grader/registrars/exercise_registrar.hpp>

#include <cstddef>
#include <span>

int main(int argc, const char* argv[]) {
    grader::init_loggers();

    LOG_TRACE("Registered exercises: {}", grader::ExerciseRegistrar::get().get_handles());

    std::span<const char*> args{argv, static_cast<std::size_t>(argc)};

    const grader::ProgramOptions options = grader::parse_args_or_exit(args);

    return grader::GraderApp{options}.run();
}
