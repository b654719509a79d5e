#pragma once

#include <grader/api/exercise.hpp>

#include <range/v3/view/transform.hpp>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace grader {

/// A global singleton registrar of exercises.
///
/// Exercises registered here (usually through ``ExerciseAutoRegistrar``) are made accessible at
/// the CLI level by their handle.
class ExerciseRegistrar
{
public:
    static ExerciseRegistrar& get() noexcept;

    /// Registers an exercise. One with the same handle is replaced.
    void add(Exercise exercise);

    std::optional<std::reference_wrapper<const Exercise>> find(std::string_view handle) const;

    auto get_exercises() const {
        return registered_ | ranges::views::transform([](const std::unique_ptr<Exercise>& exercise) -> const Exercise& {
                   return *exercise;
               });
    }

    std::vector<std::string_view> get_handles() const;

    std::size_t get_num_registered() const { return registered_.size(); }

private:
    ExerciseRegistrar() = default;

    std::vector<std::unique_ptr<Exercise>> registered_;
};

/// Helper class that, when constructed, registers an exercise to the global registrar
class ExerciseAutoRegistrar
{
public:
    explicit ExerciseAutoRegistrar(Exercise exercise) noexcept { ExerciseRegistrar::get().add(std::move(exercise)); }
};

} // namespace grader
