#include "contagion/sim/block_graph.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace contagion::sim
{
BlockGraph::BlockGraph(std::shared_ptr<const ProfileTable> profiles, DiseaseModel disease)
    : profiles_{std::move(profiles)}
    , disease_{std::move(disease)}
{
    if (!profiles_) {
        throw std::invalid_argument("Profile table cannot be null");
    }
}

BlockId BlockGraph::addBlock(BlockType type, int32_t healthy, int32_t infected, int32_t material)
{
    if (healthy < 0 || infected < 0 || material < 0) {
        throw std::invalid_argument("Initial counts of a block must be non-negative");
    }

    blocks_.emplace_back(profiles_->profile(type), disease_, healthy, infected, material);
    return blocks_.size() - 1;
}

void BlockGraph::connect(BlockId source, BlockId target)
{
    if (target >= blocks_.size()) {
        throw std::out_of_range("Unknown target block " + std::to_string(target));
    }
    block(source).addOutBlock(target);
}

void BlockGraph::runRound(const IRandomSource& random)
{
    // Every phase must finish on all blocks before the next one starts:
    // settlement writes through, propagation only touches buffers, commit publishes them.
    for (Block& block : blocks_) {
        block.endInBlock(random);
    }

    const ValueResolver resolver = [this](const ValueLink& link) -> IntValue& { return resolve(link); };
    for (Block& block : blocks_) {
        block.endRound(resolver);
    }

    for (Block& block : blocks_) {
        block.commit();
    }

    ++rounds_played_;
}

Block& BlockGraph::block(BlockId id)
{
    if (id >= blocks_.size()) {
        throw std::out_of_range("Unknown block " + std::to_string(id));
    }
    return blocks_[id];
}

const Block& BlockGraph::block(BlockId id) const
{
    if (id >= blocks_.size()) {
        throw std::out_of_range("Unknown block " + std::to_string(id));
    }
    return blocks_[id];
}

GraphTotals BlockGraph::totals() const noexcept
{
    GraphTotals totals{};
    for (const Block& block : blocks_) {
        totals.healthy += block.healthy();
        totals.current_infected += block.currentInfected();
        totals.next_infected += block.nextInfected();
        totals.material += block.material();
    }
    return totals;
}

IntValue& BlockGraph::resolve(const ValueLink& link)
{
    return blocks_[link.block].value(link.quantity);
}
} // namespace contagion::sim
