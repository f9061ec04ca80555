#pragma once
#include <ecs/ecs.hpp>
#include <algorithm>
#include <cstddef>
#include <functional>
#include <vector>

namespace sprite2d {

/**
 * @brief Frame scheduler: prioritised task lists for the update and draw phases.
 *
 * Within a phase tasks run in ascending priority; equal priorities run in
 * registration order. Every registered task runs every frame.
 */
class Pipeline {
public:
    using SystemFunc = std::function<void(ecs::World&, float)>;

    enum class Phase { Update, Draw };

    void add_task(Phase phase, SystemFunc func, int priority = 0) {
        auto& tasks = phase == Phase::Update ? update_ : draw_;
        Task task{priority, std::move(func)};
        // upper_bound keeps insertion order among equal priorities
        auto pos = std::upper_bound(tasks.begin(), tasks.end(), task,
            [](const Task& a, const Task& b) { return a.priority < b.priority; });
        tasks.insert(pos, std::move(task));
    }

    void add_update(SystemFunc func, int priority = 0) { add_task(Phase::Update, std::move(func), priority); }
    void add_render(SystemFunc func, int priority = 0) { add_task(Phase::Draw, std::move(func), priority); }

    /**
     * @brief Runs the update phase.
     */
    void update(ecs::World& world, float dt) {
        for (auto& t : update_) t.func(world, dt);
    }

    /**
     * @brief Runs the draw phase.
     */
    void render(ecs::World& world) {
        for (auto& t : draw_) t.func(world, 0.0f);
    }

    std::size_t task_count(Phase phase) const {
        return phase == Phase::Update ? update_.size() : draw_.size();
    }

private:
    struct Task {
        int        priority;
        SystemFunc func;
    };

    std::vector<Task> update_;
    std::vector<Task> draw_;
};

} // namespace sprite2d
