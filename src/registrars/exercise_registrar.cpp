#include <grader/registrars/exercise_registrar.hpp>

#include <grader/api/exercise.hpp>
#include <grader/logging.hpp>

#include <range/v3/algorithm/find_if.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace grader {

ExerciseRegistrar& ExerciseRegistrar::get() noexcept {
    // thread-safe singleton initialization pattern
    static ExerciseRegistrar local_instance{};

    return local_instance;
}

void ExerciseRegistrar::add(Exercise exercise) {
    auto handle_matcher = [&exercise](const std::unique_ptr<Exercise>& registered) {
        return registered->get_handle() == exercise.get_handle();
    };

    if (auto iter = ranges::find_if(registered_, handle_matcher); iter != registered_.end()) {
        LOG_WARN("Exercise {:?} registered more than once; keeping the latest", exercise.get_handle());
        *iter = std::make_unique<Exercise>(std::move(exercise));
        return;
    }

    registered_.push_back(std::make_unique<Exercise>(std::move(exercise)));
}

std::optional<std::reference_wrapper<const Exercise>> ExerciseRegistrar::find(std::string_view handle) const {
    auto handle_matcher = [handle](const std::unique_ptr<Exercise>& exercise) {
        return exercise->get_handle() == handle;
    };

    if (auto iter = ranges::find_if(registered_, handle_matcher); iter != registered_.end()) {
        return std::cref(**iter);
    }

    return std::nullopt;
}

std::vector<std::string_view> ExerciseRegistrar::get_handles() const {
    return registered_ |
           ranges::views::transform([](const std::unique_ptr<Exercise>& exercise) -> std::string_view {
               return exercise->get_handle();
           }) |
           ranges::to<std::vector>;
}

} // namespace grader
