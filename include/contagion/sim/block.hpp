#pragma once
#include <cstdint>
#include <functional>
#include <vector>

#include "block_type.hpp"
#include "broadcast_value.hpp"
#include "random_source_interface.hpp"
#include "stage_timer.hpp"

namespace contagion::sim
{
using ValueResolver = std::function<IntValue&(const ValueLink&)>;

// One tile of the board. Carries four broadcast counters (healthy, two infected cohorts, material),
// a timer per infected cohort and the flags the rules layer toggles between rounds.
class Block
{
public:
    inline static constexpr int32_t DEFAULT_QUARANTINE_PERIOD = 10;

    inline static constexpr float HEALTHY_BROADCAST_RATIO  = 0.5f;
    inline static constexpr float CURRENT_BROADCAST_RATIO  = 0.9f;
    inline static constexpr float NEXT_BROADCAST_RATIO     = 0.5f;
    inline static constexpr float MATERIAL_BROADCAST_RATIO = 0.5f;

    // `infected` seeds the incubating (next generation) cohort.
    Block(const BlockTypeProfile& profile, const DiseaseModel& disease, int32_t healthy, int32_t infected, int32_t material);

    void addOutBlock(BlockId target);

    // Local settlement: generation shift, new infections, deaths, material. Writes through.
    void endInBlock(const IRandomSource& random);
    // Propagation into the neighbours' buffers. Returns false when quarantine kept the block isolated.
    bool endRound(const ValueResolver& resolve);
    void commit() noexcept;

    bool stopWorking() noexcept;
    // Only factories can work.
    bool startWorking() noexcept;
    // Levies tax_rate of the material, never below the resource floor.
    int32_t taxed() noexcept;
    bool quarantined(int32_t period) noexcept;
    bool aided() noexcept;

    [[nodiscard]] BlockType type() const noexcept
    {
        return profile_->type;
    }

    [[nodiscard]] const BlockTypeProfile& profile() const noexcept
    {
        return *profile_;
    }

    [[nodiscard]] int32_t healthy() const noexcept
    {
        return healthy_.get();
    }

    [[nodiscard]] int32_t currentInfected() const noexcept
    {
        return current_infected_.get();
    }

    [[nodiscard]] int32_t nextInfected() const noexcept
    {
        return next_infected_.get();
    }

    [[nodiscard]] int32_t material() const noexcept
    {
        return material_.get();
    }

    [[nodiscard]] bool isWorking() const noexcept
    {
        return is_working_;
    }

    [[nodiscard]] bool isQuarantined() const noexcept
    {
        return is_quarantined_;
    }

    [[nodiscard]] int32_t quarantineCounter() const noexcept
    {
        return quarantine_counter_;
    }

    [[nodiscard]] int32_t quarantinePeriod() const noexcept
    {
        return quarantine_period_;
    }

    [[nodiscard]] const std::vector<BlockId>& outBlocks() const noexcept
    {
        return out_blocks_;
    }

    [[nodiscard]] const StageTimer& currentTimer() const noexcept
    {
        return current_timer_;
    }

    [[nodiscard]] const StageTimer& nextTimer() const noexcept
    {
        return next_timer_;
    }

    [[nodiscard]] IntValue& value(Quantity quantity) noexcept;
    [[nodiscard]] const IntValue& value(Quantity quantity) const noexcept;

    [[nodiscard]] float currentReproduction() const noexcept;
    [[nodiscard]] float nextReproduction() const noexcept;
    [[nodiscard]] float currentDeathRate() const noexcept;
    [[nodiscard]] float nextDeathRate() const noexcept;
    [[nodiscard]] float materialRate() const noexcept;

private:
    template <typename Self>
    static auto& valueOf(Self& self, Quantity quantity) noexcept;

    const BlockTypeProfile* profile_;
    std::vector<BlockId> out_blocks_;

    bool is_working_{false};
    bool is_quarantined_{false};
    int32_t quarantine_counter_{};
    int32_t quarantine_period_{DEFAULT_QUARANTINE_PERIOD};

    StageTimer current_timer_;
    StageTimer next_timer_;

    IntValue healthy_;
    IntValue current_infected_;
    IntValue next_infected_;
    IntValue material_;
};
} // namespace contagion::sim
