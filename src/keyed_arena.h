#pragma once
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace beacontrack {

// Per-key state slots. The arena lock only guards the slot table; each slot
// carries its own mutex, so work on one key never waits on another key.
template <typename T>
class KeyedArena {
public:
    struct Slot {
        std::mutex lock;
        T value;
        bool occupied = false;
    };

private:
    mutable std::mutex arenaMutex;
    std::map<std::string, std::shared_ptr<Slot>> slots;

public:
    std::shared_ptr<Slot> acquire(const std::string &key) {
        std::lock_guard<std::mutex> lock(arenaMutex);
        auto &slot = slots[key];
        if (!slot) slot = std::make_shared<Slot>();
        return slot;
    }

    std::shared_ptr<Slot> find(const std::string &key) const {
        std::lock_guard<std::mutex> lock(arenaMutex);
        auto it = slots.find(key);
        if (it == slots.end()) return nullptr;
        return it->second;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(arenaMutex);
        return slots.size();
    }
};

}  // namespace beacontrack
