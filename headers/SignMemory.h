#pragma once
#include <SFML/System/Vector2.hpp>
#include <cstddef>
#include <map>
#include <optional>

/**
 * per agent memory of previously seen signs
 * bounded: recording into a full memory evicts the oldest entry
 * entries older than expirySteps are ignored and purged on the next write (0 = never expire)
 */
class SignMemory
{
public:
    struct Entry
    {
        int signId = -1;
        sf::Vector2f position;
        long long recordedStep = 0;
    };

    SignMemory() = default;
    SignMemory(std::size_t capacity, long long expirySteps);

    void configure(std::size_t capacity, long long expirySteps);

    // stores (or refreshes) a sighting
    void record(int signId, const sf::Vector2f &position, long long step);

    // drops every entry that has expired at the given step
    void purgeExpired(long long step);

    bool isExpired(const Entry &entry, long long step) const;

    // most recently recorded live entry, ties broken by distance to fromPosition
    std::optional<Entry> latest(long long step, const sf::Vector2f &fromPosition) const;

    bool contains(int signId) const { return entries_.count(signId) != 0; }
    bool empty() const { return entries_.empty(); }
    std::size_t size() const { return entries_.size(); }
    std::size_t capacity() const { return capacity_; }
    long long expirySteps() const { return expirySteps_; }
    const std::map<int, Entry> &entries() const { return entries_; }
    void clear() { entries_.clear(); }

private:
    std::map<int, Entry> entries_; // keyed by sign id, ordered for deterministic iteration
    std::size_t capacity_ = 8;
    long long expirySteps_ = 0;

    void evictOldest();
};
