#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "Script.h"

// Owns every live script, keyed by entity. Scripts added during a tick are
// initialized at the start of the next update.
class ScriptWorld {
public:
    ScriptWorld() = default;
    ~ScriptWorld() = default;

    ScriptWorld(const ScriptWorld&) = delete;
    ScriptWorld& operator=(const ScriptWorld&) = delete;

    void addScript(EntityId entity, std::unique_ptr<Script> script);

    // Instantiates each named script; unknown names are logged and skipped
    void addScripts(EntityId entity, const std::vector<std::string>& names);

    void removeEntity(EntityId entity);

    Effect initializePending(ScriptContext& ctx);
    Effect update(ScriptContext& ctx);

    // Delivered to every script of the addressee; dropped when it has none
    Effect dispatch(const Message& message, ScriptContext& ctx);

    bool hasScripts(EntityId entity) const { return scripts_.count(entity) > 0; }
    size_t scriptCount() const;

    template<typename T>
    const T* find(EntityId entity) const {
        auto it = scripts_.find(entity);
        if (it == scripts_.end()) return nullptr;
        for (const auto& entry : it->second) {
            if (const auto* typed = dynamic_cast<const T*>(entry.script.get())) {
                return typed;
            }
        }
        return nullptr;
    }

private:
    struct Entry {
        std::unique_ptr<Script> script;
        bool initialized = false;
    };

    std::map<EntityId, std::vector<Entry>> scripts_;
    std::vector<EntityId> pending_;
};
