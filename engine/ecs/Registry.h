// Minimal ECS registry: entity lifecycle + component management.
#pragma once

#include <cstddef>
#include <cstdint>
#include <queue>
#include <utility>
#include <vector>

#include "ComponentStorage.h"
#include "Entity.h"

namespace Starfall::ECS {

class Registry {
public:
    Entity create() {
        std::uint32_t index = 0;
        if (!freeList_.empty()) {
            index = freeList_.front();
            freeList_.pop();
        } else {
            // Slot 0 stays unused so that kInvalidEntity never names a live entity.
            if (versions_.empty()) {
                versions_.push_back(0);
                live_.push_back(false);
            }
            index = static_cast<std::uint32_t>(versions_.size());
            versions_.push_back(0);
            live_.push_back(false);
        }
        live_[index] = true;
        ++liveCount_;
        return makeEntity(index, versions_[index]);
    }

    bool alive(Entity e) const {
        const std::uint32_t index = entityIndex(e);
        return index != 0 && index < versions_.size() && live_[index] &&
               versions_[index] == entityVersion(e);
    }

    // Destroying a dead or stale handle is a no-op and returns false. A slot whose
    // version is exhausted is retired instead of recycled, so versions never wrap.
    bool destroy(Entity e) {
        if (!alive(e)) {
            return false;
        }
        const std::uint32_t index = entityIndex(e);
        storage_.removeAll(e);
        live_[index] = false;
        if (versions_[index] == kMaxEntityVersion) {
            ++retired_;
        } else {
            versions_[index] += 1;
            freeList_.push(index);
        }
        --liveCount_;
        return true;
    }

    std::size_t size() const { return liveCount_; }
    std::size_t retiredSlots() const { return retired_; }

    template <typename T, typename... Args>
    T& emplace(Entity e, Args&&... args) {
        return storage_.template pool<T>().emplace(e, std::forward<Args>(args)...);
    }

    template <typename T>
    void remove(Entity e) {
        storage_.template pool<T>().remove(e);
    }

    template <typename T>
    T* get(Entity e) {
        return storage_.template pool<T>().get(e);
    }

    template <typename T>
    const T* get(Entity e) const {
        const auto* p = storage_.template pool<T>();
        return p ? p->get(e) : nullptr;
    }

    template <typename T>
    bool has(Entity e) const {
        const auto* p = storage_.template pool<T>();
        return p && p->contains(e);
    }

    // Visits entities owning every listed component. The callback must not
    // destroy entities or add/remove Primary components; collect handles and
    // act after the view returns.
    template <typename Primary, typename... Rest, typename Func>
    void view(Func&& func) {
        auto& primaryPool = storage_.template pool<Primary>();
        for (auto& [entity, primary] : primaryPool) {
            if ((storage_.template pool<Rest>().contains(entity) && ...)) {
                func(entity, primary, *storage_.template pool<Rest>().get(entity)...);
            }
        }
    }

    template <typename Primary, typename... Rest, typename Func>
    void view(Func&& func) const {
        const auto* primaryPool = storage_.template pool<Primary>();
        if (!primaryPool) {
            return;
        }
        for (const auto& [entity, primary] : *primaryPool) {
            bool allHave = ((storage_.template pool<Rest>() && storage_.template pool<Rest>()->contains(entity)) && ...);
            if (allHave) {
                func(entity, primary, *storage_.template pool<Rest>()->get(entity)...);
            }
        }
    }

private:
    std::vector<std::uint32_t> versions_;
    std::vector<bool> live_;
    std::queue<std::uint32_t> freeList_;
    std::size_t liveCount_{0};
    std::size_t retired_{0};
    ComponentStorage storage_;
};

}  // namespace Starfall::ECS
