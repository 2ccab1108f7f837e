#include "ScriptWorld.h"
#include "ScriptFactory.h"

#include <SDL3/SDL_log.h>
#include <algorithm>

void ScriptWorld::addScript(EntityId entity, std::unique_ptr<Script> script) {
    if (!script) {
        return;
    }
    scripts_[entity].push_back(Entry{std::move(script), false});
    if (std::find(pending_.begin(), pending_.end(), entity) == pending_.end()) {
        pending_.push_back(entity);
    }
}

void ScriptWorld::addScripts(EntityId entity, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        auto script = ScriptFactory::create(name);
        if (!script) {
            SDL_LogWarn(SDL_LOG_CATEGORY_APPLICATION, "ScriptWorld: unknown script '%s' on entity %u",
                        name.c_str(), entityToInt(entity));
            continue;
        }
        addScript(entity, std::move(script));
    }
}

void ScriptWorld::removeEntity(EntityId entity) {
    scripts_.erase(entity);
    pending_.erase(std::remove(pending_.begin(), pending_.end(), entity), pending_.end());
}

Effect ScriptWorld::initializePending(ScriptContext& ctx) {
    std::vector<Effect> effects;
    std::vector<EntityId> pending;
    pending.swap(pending_);
    for (EntityId entity : pending) {
        auto it = scripts_.find(entity);
        if (it == scripts_.end()) continue;
        for (auto& entry : it->second) {
            if (!entry.initialized) {
                entry.initialized = true;
                effects.push_back(entry.script->initialize(entity, ctx));
            }
        }
    }
    return Effect::combine(std::move(effects));
}

Effect ScriptWorld::update(ScriptContext& ctx) {
    std::vector<Effect> effects;
    effects.push_back(initializePending(ctx));
    for (auto& [entity, entries] : scripts_) {
        if (!ctx.world.valid(entity)) {
            continue;
        }
        for (auto& entry : entries) {
            if (entry.initialized) {
                effects.push_back(entry.script->update(entity, ctx));
            }
        }
    }
    return Effect::combine(std::move(effects));
}

Effect ScriptWorld::dispatch(const Message& message, ScriptContext& ctx) {
    auto it = scripts_.find(message.to);
    if (it == scripts_.end()) {
        SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "ScriptWorld: dropping %s for entity %u without scripts",
                     messagePayloadName(message.payload), entityToInt(message.to));
        return {};
    }
    std::vector<Effect> effects;
    for (auto& entry : it->second) {
        effects.push_back(entry.script->handleMessage(message.to, ctx, message.payload));
    }
    return Effect::combine(std::move(effects));
}

size_t ScriptWorld::scriptCount() const {
    size_t count = 0;
    for (const auto& [entity, entries] : scripts_) {
        count += entries.size();
    }
    return count;
}
