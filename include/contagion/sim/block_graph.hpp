#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "block.hpp"
#include "block_type.hpp"
#include "random_source_interface.hpp"
#include "stage_timer.hpp"

namespace contagion::sim
{
// Sums of every counter over the whole board.
struct GraphTotals {
    int64_t healthy;
    int64_t current_infected;
    int64_t next_infected;
    int64_t material;

    [[nodiscard]] int64_t population() const noexcept
    {
        return healthy + current_infected + next_infected;
    }
};

// Arena of blocks addressed by index. Edges and value links store indices, never pointers,
// so the board can be copied and blocks never own each other.
class BlockGraph
{
public:
    explicit BlockGraph(std::shared_ptr<const ProfileTable> profiles, DiseaseModel disease = defaultDiseaseModel());

    BlockId addBlock(BlockType type, int32_t healthy, int32_t infected, int32_t material);
    // Registers `target` as a neighbour of `source` and links the four counters, in call order.
    void connect(BlockId source, BlockId target);

    // One turn: local settlement on every block, then propagation on every block, then commit.
    void runRound(const IRandomSource& random);

    [[nodiscard]] Block& block(BlockId id);
    [[nodiscard]] const Block& block(BlockId id) const;

    [[nodiscard]] std::span<const Block> blocks() const noexcept
    {
        return blocks_;
    }

    [[nodiscard]] std::size_t size() const noexcept
    {
        return blocks_.size();
    }

    [[nodiscard]] int32_t roundsPlayed() const noexcept
    {
        return rounds_played_;
    }

    [[nodiscard]] const ProfileTable& profiles() const noexcept
    {
        return *profiles_;
    }

    [[nodiscard]] GraphTotals totals() const noexcept;

private:
    IntValue& resolve(const ValueLink& link);

    std::shared_ptr<const ProfileTable> profiles_;
    DiseaseModel disease_;
    std::vector<Block> blocks_;
    int32_t rounds_played_{};
};
} // namespace contagion::sim
