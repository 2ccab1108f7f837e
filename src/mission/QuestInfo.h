#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

// Quest variables and collected key cards of the running mission
struct QuestInfo {
    std::map<std::string, int32_t> bits;
    std::set<std::string> keyCards;

    void setBit(const std::string& name, int32_t value) { bits[name] = value; }

    std::optional<int32_t> bit(const std::string& name) const {
        auto it = bits.find(name);
        if (it == bits.end()) return std::nullopt;
        return it->second;
    }

    void addKeyCard(const std::string& name) { keyCards.insert(name); }
    bool hasKeyCard(const std::string& name) const { return keyCards.count(name) > 0; }
};
