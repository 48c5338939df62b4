#pragma once

/**
 * @file change_trigger.hpp
 * @brief One-shot expiry tokens issued by a FileProvider for watched paths
 */

#include <atomic>
#include <memory>
#include <vector>

namespace fineview {

// ============================================================================
// ChangeTrigger - "has this watched file-set changed since I was issued?"
// ============================================================================
//
// A trigger never goes back from expired to non-expired. Once it reports
// expired the holder must discard it and ask the provider for a new one.
//
// Thread safety: isExpired() may be called from any thread.
//
class ChangeTrigger {
public:
    virtual ~ChangeTrigger() = default;

    [[nodiscard]] virtual bool isExpired() const = 0;
};

using ChangeTriggerPtr = std::shared_ptr<ChangeTrigger>;

// Trigger backed by a single latch, expired explicitly by its owner
class FlagChangeTrigger : public ChangeTrigger {
public:
    [[nodiscard]] bool isExpired() const override {
        return expired_.load(std::memory_order_acquire);
    }

    // Latch the trigger. Idempotent.
    void expire() {
        expired_.store(true, std::memory_order_release);
    }

private:
    std::atomic<bool> expired_{false};
};

// Expired as soon as any of its children is expired
class CompositeChangeTrigger : public ChangeTrigger {
public:
    explicit CompositeChangeTrigger(std::vector<ChangeTriggerPtr> triggers);

    [[nodiscard]] bool isExpired() const override;

    [[nodiscard]] size_t size() const { return triggers_.size(); }

private:
    std::vector<ChangeTriggerPtr> triggers_;
    // Latched so children are not consulted again after the first hit
    mutable std::atomic<bool> expired_{false};
};

}  // namespace fineview
