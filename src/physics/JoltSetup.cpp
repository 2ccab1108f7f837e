#include "JoltSetup.h"

#include <Jolt/RegisterTypes.h>
#include <Jolt/Core/Factory.h>

#include <SDL3/SDL_log.h>
#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace JoltSetup {

namespace {

std::mutex leaseMutex;
std::weak_ptr<RuntimeLease> currentLease;

void logTrace(const char* format, ...) {
    char line[1024];
    va_list args;
    va_start(args, format);
    vsnprintf(line, sizeof(line), format, args);
    va_end(args);
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "Jolt: %s", line);
}

#ifdef JPH_ENABLE_ASSERTS
bool logAssert(const char* expression, const char* message, const char* file, uint32_t line) {
    SDL_LogError(SDL_LOG_CATEGORY_APPLICATION, "Jolt: assertion (%s) failed at %s:%u %s",
                 expression, file, line, message ? message : "");
    return true;
}
#endif

} // anonymous namespace

const LayerInterface& layerInterface() {
    static const LayerInterface instance;
    return instance;
}

const LayerPairFilter& layerPairFilter() {
    static const LayerPairFilter instance;
    return instance;
}

const LayerVsTreeFilter& layerVsTreeFilter() {
    static const LayerVsTreeFilter instance;
    return instance;
}

RuntimeLease::RuntimeLease() {
    JPH::RegisterDefaultAllocator();
    JPH::Trace = logTrace;
    JPH_IF_ENABLE_ASSERTS(JPH::AssertFailed = logAssert;)

    JPH::Factory::sInstance = new JPH::Factory();
    JPH::RegisterTypes();
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "JoltSetup: types registered");
}

RuntimeLease::~RuntimeLease() {
    JPH::UnregisterTypes();
    delete JPH::Factory::sInstance;
    JPH::Factory::sInstance = nullptr;
    SDL_LogDebug(SDL_LOG_CATEGORY_APPLICATION, "JoltSetup: types unregistered");
}

std::shared_ptr<RuntimeLease> RuntimeLease::acquire() {
    std::lock_guard<std::mutex> lock(leaseMutex);
    std::shared_ptr<RuntimeLease> lease = currentLease.lock();
    if (!lease) {
        lease.reset(new RuntimeLease());
        currentLease = lease;
    }
    return lease;
}

} // namespace JoltSetup
