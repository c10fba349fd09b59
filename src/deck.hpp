#pragma once
#include "rng.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// Everything needed to build one deck: a label, the cards and the shuffle seed.
// With shuffle=false the cards keep the order they were supplied in.
template <typename T>
struct DeckConfig {
    std::string name;
    std::vector<T> items;
    uint32_t seed = 0;
    bool shuffle = true;
};

// An ordered, destructively drawn pile of cards (room tiles or event cards).
// T must expose a `name` member; drawByName matches on it.
//
// The order is fixed when the deck is built; there is no reshuffle and no refill.
template <typename T>
class Deck {
public:
    Deck() = default;
    explicit Deck(std::vector<T> items, std::string name = std::string())
        : name_(std::move(name)), items_(std::move(items)) {}

    const std::string& name() const { return name_; }

    int count() const { return static_cast<int>(items_.size()); }
    bool empty() const { return items_.empty(); }

    // Removes and returns the top card, or nullopt when the deck is depleted.
    std::optional<T> draw() {
        if (items_.empty()) return std::nullopt;
        T top = std::move(items_.front());
        items_.erase(items_.begin());
        return top;
    }

    // Removes and returns the first card called `name`. The order of the
    // remaining cards is left untouched.
    std::optional<T> drawByName(const std::string& name) {
        for (auto it = items_.begin(); it != items_.end(); ++it) {
            if (it->name == name) {
                T found = std::move(*it);
                items_.erase(it);
                return found;
            }
        }
        return std::nullopt;
    }

    bool contains(const std::string& name) const {
        for (const T& it : items_) {
            if (it.name == name) return true;
        }
        return false;
    }

    const std::vector<T>& peekAll() const { return items_; }

private:
    std::string name_;
    std::vector<T> items_;
};

template <typename T>
Deck<T> makeDeck(DeckConfig<T> cfg) {
    if (cfg.shuffle) {
        RNG rng(cfg.seed);
        shuffleInPlace(cfg.items, rng);
    }
    return Deck<T>(std::move(cfg.items), std::move(cfg.name));
}
