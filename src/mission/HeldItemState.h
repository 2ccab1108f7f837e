#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

#include "World.h"

// One carried entity, captured as its template plus a property snapshot
struct HeldItem {
    int32_t templateId = 0;
    nlohmann::json properties = nlohmann::json::object();
};

// What the player carries across a level transition:
//   { "left_hand": {"template_id", "properties"} | null, "right_hand": ..., "inventory": ... }
struct HeldItemState {
    std::optional<HeldItem> leftHand;
    std::optional<HeldItem> rightHand;
    std::optional<HeldItem> inventory;

    bool empty() const { return !leftHand && !rightHand && !inventory; }

    // Snapshot of the entities referenced by the world's PlayerInfo
    static HeldItemState capture(const ecs::World& world);

    nlohmann::json toJson() const;
    static std::optional<HeldItemState> fromJson(const nlohmann::json& j);

    bool saveToFile(const std::string& path) const;
    static std::optional<HeldItemState> loadFromFile(const std::string& path);
};
