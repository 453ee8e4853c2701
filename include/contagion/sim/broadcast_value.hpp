#pragma once
#include <cstddef>
#include <cstdint>
#include <type_traits>
#include <vector>

#include "buffered_value.hpp"

namespace contagion::sim
{
using BlockId = std::size_t;

// Selects one of the four counters carried by every block.
enum class Quantity : uint8_t {
    HEALTHY_POP,
    INFECTED_CURR_GEN,
    INFECTED_NEXT_GEN,
    MATERIAL,
};

inline constexpr std::size_t QUANTITY_COUNT = 4;

inline constexpr Quantity ALL_QUANTITIES[QUANTITY_COUNT] = {
    Quantity::HEALTHY_POP,
    Quantity::INFECTED_CURR_GEN,
    Quantity::INFECTED_NEXT_GEN,
    Quantity::MATERIAL,
};

// Address of a counter in the block arena. Links do not own their targets.
struct ValueLink {
    BlockId block;
    Quantity quantity;
};

template <Scalar T>
class BroadcastValue : public BufferedValue<T>
{
public:
    inline static constexpr float ZERO = 1e-6f;

    explicit BroadcastValue(T value = T{}, float priority = 0.0f)
        : BufferedValue<T>{value}
        , priority_{priority}
    {
    }

    [[nodiscard]] float priority() const noexcept
    {
        return priority_;
    }

    void setPriority(float priority) noexcept
    {
        priority_ = priority;
    }

    void addOutLink(ValueLink link)
    {
        out_links_.push_back(link);
    }

    [[nodiscard]] const std::vector<ValueLink>& outLinks() const noexcept
    {
        return out_links_;
    }

    // Gives away a `ratio` share of the committed value to the linked values whose priority is at
    // least `offset`. Each target gets a part weighted by (priority + 1), truncated, in link order.
    // Only the amount handed out leaves this value's buffer; undistributed residue stays here.
    // `resolve` maps a link to the value it addresses. Returns the amount given away.
    template <typename Resolver>
        requires std::is_invocable_r_v<BroadcastValue&, Resolver, const ValueLink&>
    T broadcast(float ratio, float offset, Resolver&& resolve)
    {
        std::vector<BroadcastValue*> targets;
        targets.reserve(out_links_.size());

        float priority_sum = 0.0f;
        for (const ValueLink& link : out_links_) {
            BroadcastValue& target = resolve(link);
            if (target.priority_ < offset) {
                continue;
            }
            priority_sum += target.priority_ + 1.0f;
            targets.push_back(&target);
        }

        if (priority_sum < ZERO) {
            return T{};
        }

        if (ratio <= ZERO) {
            ratio = 0.0f;
        }

        const T committed = this->get();
        T delta           = static_cast<T>(committed * ratio);
        if (committed < delta) {
            delta = committed;
        }

        T remaining = delta;
        for (BroadcastValue* target : targets) {
            T alloc = static_cast<T>(delta * ((target->priority_ + 1.0f) / priority_sum));
            if (remaining < alloc) {
                alloc = remaining;
            }
            target->addBuffered(alloc);
            remaining -= alloc;
        }

        const T given = delta - remaining;
        this->addBuffered(-given);
        return given;
    }

private:
    float priority_{};
    std::vector<ValueLink> out_links_;
};

using IntValue = BroadcastValue<int32_t>;
} // namespace contagion::sim
