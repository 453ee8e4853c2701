#include "contagion/sim/block.hpp"

#include <algorithm>
#include <cmath>

#include "contagion/sim/random_source.hpp"

namespace contagion::sim
{
Block::Block(const BlockTypeProfile& profile, const DiseaseModel& disease, int32_t healthy, int32_t infected, int32_t material)
    : profile_{&profile}
    , is_working_{profile.type == BlockType::FACTORY}
    , current_timer_{disease.timer_period, disease.current_stages}
    , next_timer_{disease.timer_period, disease.next_stages}
    , healthy_{healthy}
    , current_infected_{0, profile.infected_priority}
    , next_infected_{infected}
    , material_{std::max(material, profile.resource_min)}
{
}

void Block::addOutBlock(BlockId target)
{
    out_blocks_.push_back(target);
    for (Quantity quantity : ALL_QUANTITIES) {
        value(quantity).addOutLink(ValueLink{.block = target, .quantity = quantity});
    }
}

template <typename Self>
auto& Block::valueOf(Self& self, Quantity quantity) noexcept
{
    switch (quantity) {
        case Quantity::HEALTHY_POP:
            return self.healthy_;
        case Quantity::INFECTED_CURR_GEN:
            return self.current_infected_;
        case Quantity::INFECTED_NEXT_GEN:
            return self.next_infected_;
        case Quantity::MATERIAL:
        default:
            return self.material_;
    }
}

IntValue& Block::value(Quantity quantity) noexcept
{
    return valueOf(*this, quantity);
}

const IntValue& Block::value(Quantity quantity) const noexcept
{
    return valueOf(*this, quantity);
}

float Block::currentReproduction() const noexcept
{
    return profile_->reproduction * current_timer_.reproduction();
}

float Block::nextReproduction() const noexcept
{
    return profile_->reproduction * next_timer_.reproduction();
}

float Block::currentDeathRate() const noexcept
{
    return profile_->death_rate * current_timer_.deathRate();
}

float Block::nextDeathRate() const noexcept
{
    return profile_->death_rate * next_timer_.deathRate();
}

float Block::materialRate() const noexcept
{
    return is_working_ ? profile_->working_material_rate : profile_->material_rate;
}

void Block::endInBlock(const IRandomSource& random)
{
    // both timers tick every round
    const int32_t current_cycles = current_timer_.tick();
    const int32_t next_cycles    = next_timer_.tick();

    if (current_cycles + next_cycles > 0) {
        // the symptomatic cohort recovers, the incubating one becomes symptomatic
        healthy_.set(healthy_.get() + current_infected_.get());
        current_infected_.set(next_infected_.get());
        next_infected_.set(0);
    }

    const float spread = static_cast<float>(current_infected_.get()) * currentReproduction() + static_cast<float>(next_infected_.get()) * nextReproduction();
    const int32_t infections = std::clamp(static_cast<int32_t>(spread), 0, healthy_.get());
    next_infected_.set(next_infected_.get() + infections);
    healthy_.set(healthy_.get() - infections);

    const int32_t current_deaths = adaptedRandomNumber(random, currentDeathRate(), current_infected_.get());
    current_infected_.set(std::max(current_infected_.get() - current_deaths, 0));
    const int32_t next_deaths = adaptedRandomNumber(random, nextDeathRate(), next_infected_.get());
    next_infected_.set(std::max(next_infected_.get() - next_deaths, 0));

    const float produced = std::floor(materialRate() * static_cast<float>(healthy_.get() + current_infected_.get()));
    material_.set(std::max(material_.get() + static_cast<int32_t>(produced), profile_->resource_min));
}

bool Block::endRound(const ValueResolver& resolve)
{
    if (is_quarantined_) {
        if (++quarantine_counter_ >= quarantine_period_) {
            is_quarantined_ = false;
        }
        return false;
    }

    healthy_.broadcast(HEALTHY_BROADCAST_RATIO, 0.0f, resolve);
    current_infected_.broadcast(CURRENT_BROADCAST_RATIO, profile_->infected_offset, resolve);
    next_infected_.broadcast(NEXT_BROADCAST_RATIO, 0.0f, resolve);
    material_.broadcast(MATERIAL_BROADCAST_RATIO, 0.0f, resolve);
    return true;
}

void Block::commit() noexcept
{
    healthy_.commit();
    current_infected_.commit();
    next_infected_.commit();
    material_.commit();

    // propagation may take a block with a positive floor below it
    if (material_.get() < profile_->resource_min) {
        material_.set(profile_->resource_min);
    }
}

bool Block::stopWorking() noexcept
{
    is_working_ = false;
    return true;
}

bool Block::startWorking() noexcept
{
    if (profile_->type != BlockType::FACTORY) {
        return false;
    }
    is_working_ = true;
    return true;
}

int32_t Block::taxed() noexcept
{
    const auto levied = static_cast<int32_t>(std::floor(static_cast<float>(material_.get()) * profile_->tax_rate));
    const int32_t tax = std::clamp(levied, 0, std::max(material_.get() - profile_->resource_min, 0));
    material_.set(material_.get() - tax);
    return tax;
}

bool Block::quarantined(int32_t period) noexcept
{
    is_quarantined_     = true;
    quarantine_period_  = period;
    quarantine_counter_ = 0;
    return true;
}

bool Block::aided() noexcept
{
    healthy_.set(0);
    current_infected_.set(0);
    next_infected_.set(0);
    return true;
}
} // namespace contagion::sim
