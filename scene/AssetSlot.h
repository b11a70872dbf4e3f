#pragma once

#include <string>
#include <utility>

enum class AssetState { Unloaded, Loading, Ready, Failed };

inline const char* assetStateName(AssetState s) {
    switch (s) {
        case AssetState::Unloaded: return "unloaded";
        case AssetState::Loading: return "loading";
        case AssetState::Ready: return "ready";
        case AssetState::Failed: return "failed";
    }
    return "unknown";
}

// Readiness of one asynchronously loaded asset. Ready and Failed are final:
// there is no retry, so every transition out of them is refused.
template <typename T>
class AssetSlot {
public:
    AssetState state() const { return current; }
    bool isReady() const { return current == AssetState::Ready; }
    bool isFinal() const { return current == AssetState::Ready || current == AssetState::Failed; }

    const T* get() const { return isReady() ? &payload : nullptr; }
    T* get() { return isReady() ? &payload : nullptr; }
    const std::string& error() const { return failure; }

    bool markLoading() {
        if (current != AssetState::Unloaded) return false;
        current = AssetState::Loading;
        return true;
    }

    bool resolve(T value) {
        if (isFinal()) return false;
        payload = std::move(value);
        current = AssetState::Ready;
        return true;
    }

    bool fail(std::string message) {
        if (isFinal()) return false;
        failure = std::move(message);
        current = AssetState::Failed;
        return true;
    }

private:
    AssetState current = AssetState::Unloaded;
    T payload{};
    std::string failure;
};
