#include "SignMemory.h"
#include <algorithm>
#include <limits>

SignMemory::SignMemory(std::size_t capacity, long long expirySteps)
{
    configure(capacity, expirySteps);
}

void SignMemory::configure(std::size_t capacity, long long expirySteps)
{
    capacity_ = std::max<std::size_t>(1, capacity);
    expirySteps_ = std::max(0LL, expirySteps);

    while (entries_.size() > capacity_)
    {
        evictOldest();
    }
}

bool SignMemory::isExpired(const Entry &entry, long long step) const
{
    if (expirySteps_ == 0)
        return false;
    return (step - entry.recordedStep) > expirySteps_;
}

void SignMemory::purgeExpired(long long step)
{
    for (auto it = entries_.begin(); it != entries_.end();)
    {
        if (isExpired(it->second, step))
            it = entries_.erase(it);
        else
            ++it;
    }
}

void SignMemory::record(int signId, const sf::Vector2f &position, long long step)
{
    purgeExpired(step);

    auto it = entries_.find(signId);
    if (it != entries_.end())
    {
        it->second.position = position;
        it->second.recordedStep = step;
        return;
    }

    if (entries_.size() >= capacity_)
    {
        evictOldest();
    }
    entries_[signId] = Entry{signId, position, step};
}

std::optional<SignMemory::Entry> SignMemory::latest(long long step, const sf::Vector2f &fromPosition) const
{
    std::optional<Entry> best;
    float bestDistSq = std::numeric_limits<float>::max();

    for (const auto &[id, entry] : entries_)
    {
        if (isExpired(entry, step))
            continue;

        sf::Vector2f delta = entry.position - fromPosition;
        float distSq = delta.x * delta.x + delta.y * delta.y;

        if (!best || entry.recordedStep > best->recordedStep ||
            (entry.recordedStep == best->recordedStep && distSq < bestDistSq))
        {
            best = entry;
            bestDistSq = distSq;
        }
    }
    return best;
}

void SignMemory::evictOldest()
{
    if (entries_.empty())
        return;

    // oldest recording loses, lowest id on ties (map order)
    auto oldest = entries_.begin();
    for (auto it = entries_.begin(); it != entries_.end(); ++it)
    {
        if (it->second.recordedStep < oldest->second.recordedStep)
            oldest = it;
    }
    entries_.erase(oldest);
}
