/**
 * @file safety_components.cpp
 * @copyright Copyright (c) 2025 MTA, Inc.
 * 
 * Registry of SafeableComponent instances.
 * 
 * Components register from constructors of global objects, which run before
 * main() and before the safety system is initialized, so the registry sets
 * itself up on first use. It has its own critical section so that
 * makeAllComponentsSafe() can run from reportFault() while the fault record
 * lock is released.
 * 
 * activate() and makeSafe() are always called on a copy of the list taken
 * under the lock and never with the lock held.
 */

#include <cstring>
#include <cstdint>

#include <pico/stdlib.h>
#include <pico/critical_section.h>

#include "safety_private.hpp"


namespace Forge::Core::Safety {

    struct ComponentRegistry {
        uint32_t magic;
        uint32_t componentCount;
        SafeableComponent* components[FORGE_SAFETY_MAX_REGISTERED_COMPONENTS];
    };

    static ComponentRegistry gComponentRegistry = {};
    static critical_section_t gComponentRegistryCriticalSection;

    static void ensureRegistryInitialized() {
        // First call happens from static initialization, before Core 1 runs
        if (!critical_section_is_initialized(&gComponentRegistryCriticalSection)) {
            critical_section_init(&gComponentRegistryCriticalSection);
        }

        critical_section_enter_blocking(&gComponentRegistryCriticalSection);

        if (gComponentRegistry.magic != FORGE_COMPONENT_REGISTRY_MAGIC) {
            memset(&gComponentRegistry, 0, sizeof(ComponentRegistry));
            gComponentRegistry.magic = FORGE_COMPONENT_REGISTRY_MAGIC;
        }

        critical_section_exit(&gComponentRegistryCriticalSection);
    }

    static bool isRegistryValid() {
        return gComponentRegistry.magic == FORGE_COMPONENT_REGISTRY_MAGIC &&
               gComponentRegistry.componentCount <= FORGE_SAFETY_MAX_REGISTERED_COMPONENTS;
    }

    /**
     * @brief Copy the registered components out from under the lock
     * 
     * @return Number of components copied; 0 if the registry is corrupt
     */
    static uint32_t snapshotComponents(SafeableComponent** out) {
        ensureRegistryInitialized();

        critical_section_enter_blocking(&gComponentRegistryCriticalSection);

        uint32_t count = 0;

        if (isRegistryValid()) {
            count = gComponentRegistry.componentCount;

            for (uint32_t i = 0; i < count; i++) {
                out[i] = gComponentRegistry.components[i];
            }
        }

        critical_section_exit(&gComponentRegistryCriticalSection);
        return count;
    }

    bool registerComponent(SafeableComponent* component) {
        if (component == nullptr) {
            return false;
        }

        ensureRegistryInitialized();

        critical_section_enter_blocking(&gComponentRegistryCriticalSection);

        bool success = false;

        if (isRegistryValid() && gComponentRegistry.componentCount < FORGE_SAFETY_MAX_REGISTERED_COMPONENTS) {
            success = true;

            for (uint32_t i = 0; i < gComponentRegistry.componentCount; i++) {
                if (gComponentRegistry.components[i] == component) {
                    success = false;
                    break;
                }
            }

            if (success) {
                gComponentRegistry.components[gComponentRegistry.componentCount++] = component;
            }
        }

        critical_section_exit(&gComponentRegistryCriticalSection);
        return success;
    }

    bool unregisterComponent(SafeableComponent* component) {
        if (component == nullptr) {
            return false;
        }

        ensureRegistryInitialized();

        critical_section_enter_blocking(&gComponentRegistryCriticalSection);

        bool success = false;

        if (isRegistryValid()) {
            for (uint32_t i = 0; i < gComponentRegistry.componentCount; i++) {
                if (gComponentRegistry.components[i] != component) {
                    continue;
                }

                // Keep registration order for the rest
                for (uint32_t j = i + 1; j < gComponentRegistry.componentCount; j++) {
                    gComponentRegistry.components[j - 1] = gComponentRegistry.components[j];
                }

                gComponentRegistry.componentCount--;
                gComponentRegistry.components[gComponentRegistry.componentCount] = nullptr;
                success = true;
                break;
            }
        }

        critical_section_exit(&gComponentRegistryCriticalSection);
        return success;
    }

    bool activateAllComponents(const char** failingComponentName) {
        if (failingComponentName != nullptr) {
            *failingComponentName = nullptr;
        }

        SafeableComponent* components[FORGE_SAFETY_MAX_REGISTERED_COMPONENTS];
        const uint32_t count = snapshotComponents(components);

        for (uint32_t i = 0; i < count; i++) {
            if (components[i] == nullptr || components[i]->activate()) {
                continue;
            }

            if (failingComponentName != nullptr) {
                *failingComponentName = components[i]->getComponentName();
            }

            makeAllComponentsSafe();
            return false;
        }

        return true;
    }

    void makeAllComponentsSafe() {
        SafeableComponent* components[FORGE_SAFETY_MAX_REGISTERED_COMPONENTS];
        const uint32_t count = snapshotComponents(components);

        for (uint32_t i = 0; i < count; i++) {
            if (components[i] != nullptr) {
                components[i]->makeSafe();
            }
        }
    }

} // namespace Forge::Core::Safety
