#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace contagion::sim
{
// One step of the disease progression. Rates are multipliers of the block type's base R0 and DR.
struct InfectedStage {
    float reproduction;
    float death_rate;
};

// Cyclic counter walking an ordered list of stages, `period` ticks per stage.
class StageTimer
{
public:
    explicit StageTimer(int32_t period, std::vector<InfectedStage> stages = {});

    void addStage(InfectedStage stage);

    // Returns 1 when the stage index wraps back to the first stage, 0 otherwise.
    int32_t tick() noexcept;

    [[nodiscard]] float reproduction() const noexcept;
    [[nodiscard]] float deathRate() const noexcept;

    [[nodiscard]] int32_t period() const noexcept
    {
        return period_;
    }

    [[nodiscard]] int32_t elapsed() const noexcept
    {
        return elapsed_;
    }

    [[nodiscard]] std::size_t stageIndex() const noexcept
    {
        return stage_index_;
    }

    [[nodiscard]] std::size_t stageCount() const noexcept
    {
        return stages_.size();
    }

private:
    std::vector<InfectedStage> stages_;
    int32_t period_;
    int32_t elapsed_{};
    std::size_t stage_index_{};
};

// Stage tables for the two infected cohorts of every block.
struct DiseaseModel {
    int32_t timer_period;
    std::vector<InfectedStage> current_stages;
    std::vector<InfectedStage> next_stages;
};

[[nodiscard]] DiseaseModel defaultDiseaseModel();
} // namespace contagion::sim
