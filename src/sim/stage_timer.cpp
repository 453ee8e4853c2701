#include "contagion/sim/stage_timer.hpp"

#include <utility>

namespace contagion::sim
{
StageTimer::StageTimer(int32_t period, std::vector<InfectedStage> stages)
    : stages_{std::move(stages)}
    , period_{period}
{
}

void StageTimer::addStage(InfectedStage stage)
{
    stages_.push_back(stage);
}

int32_t StageTimer::tick() noexcept
{
    // a timer without stages or with a non-positive period never advances
    if (stages_.empty() || period_ < 1) {
        return 0;
    }

    if (++elapsed_ < period_) {
        return 0;
    }

    elapsed_     = 0;
    stage_index_ = (stage_index_ + 1) % stages_.size();
    return stage_index_ == 0 ? 1 : 0;
}

float StageTimer::reproduction() const noexcept
{
    return stages_.empty() ? 0.0f : stages_[stage_index_].reproduction;
}

float StageTimer::deathRate() const noexcept
{
    return stages_.empty() ? 0.0f : stages_[stage_index_].death_rate;
}

DiseaseModel defaultDiseaseModel()
{
    // incubating cohort: silent first stage, then contagious; symptomatic cohort: contagious and dying
    return DiseaseModel{
        .timer_period   = 3,
        .current_stages = {{.reproduction = 1.0f, .death_rate = 0.1f}, {.reproduction = 1.0f, .death_rate = 0.5f}},
        .next_stages    = {{.reproduction = 0.0f, .death_rate = 0.0f}, {.reproduction = 1.0f, .death_rate = 0.0f}}};
}
} // namespace contagion::sim
