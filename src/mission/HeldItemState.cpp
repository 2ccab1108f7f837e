#include "HeldItemState.h"
#include "PropertySerialization.h"

#include <SDL3/SDL_log.h>
#include <fstream>

using json = nlohmann::json;

namespace {

std::optional<HeldItem> captureOne(const ecs::World& world, std::optional<EntityId> entity) {
    if (!entity || !world.valid(*entity)) {
        return std::nullopt;
    }
    const auto* templateId = world.tryGet<TemplateId>(*entity);
    if (!templateId) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "HeldItemState: entity %u has no template, not persisted",
                    entityToInt(*entity));
        return std::nullopt;
    }
    return HeldItem{templateId->id, PropertySerialization::snapshot(world, *entity)};
}

json itemToJson(const std::optional<HeldItem>& item) {
    if (!item) {
        return nullptr;
    }
    return {{"template_id", item->templateId}, {"properties", item->properties}};
}

std::optional<HeldItem> itemFromJson(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }
    HeldItem item;
    item.templateId = j.at("template_id").get<int32_t>();
    item.properties = j.value("properties", json::object());
    return item;
}

}  // namespace

HeldItemState HeldItemState::capture(const ecs::World& world) {
    const auto& player = world.player();
    HeldItemState state;
    state.leftHand = captureOne(world, player.leftHand);
    state.rightHand = captureOne(world, player.rightHand);
    if (player.inventory != entt::null) {
        state.inventory = captureOne(world, player.inventory);
    }
    return state;
}

json HeldItemState::toJson() const {
    return {{"left_hand", itemToJson(leftHand)},
            {"right_hand", itemToJson(rightHand)},
            {"inventory", itemToJson(inventory)}};
}

std::optional<HeldItemState> HeldItemState::fromJson(const json& j) {
    try {
        HeldItemState state;
        state.leftHand = itemFromJson(j.value("left_hand", json()));
        state.rightHand = itemFromJson(j.value("right_hand", json()));
        state.inventory = itemFromJson(j.value("inventory", json()));
        return state;
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "HeldItemState: malformed state: %s", e.what());
        return std::nullopt;
    }
}

bool HeldItemState::saveToFile(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "HeldItemState: Failed to open '%s' for writing", path.c_str());
        return false;
    }
    file << toJson().dump(2);
    SDL_Log("HeldItemState: Saved held items to '%s'", path.c_str());
    return true;
}

std::optional<HeldItemState> HeldItemState::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "HeldItemState: Failed to open file '%s'", path.c_str());
        return std::nullopt;
    }
    try {
        return fromJson(json::parse(file));
    } catch (const json::exception& e) {
        SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "HeldItemState: Failed to parse '%s': %s", path.c_str(), e.what());
        return std::nullopt;
    }
}
