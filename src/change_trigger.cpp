#include "fineview/change_trigger.hpp"

namespace fineview {

CompositeChangeTrigger::CompositeChangeTrigger(std::vector<ChangeTriggerPtr> triggers)
    : triggers_(std::move(triggers)) {}

bool CompositeChangeTrigger::isExpired() const {
    if (expired_.load(std::memory_order_acquire)) {
        return true;
    }

    for (const auto& trigger : triggers_) {
        if (trigger && trigger->isExpired()) {
            expired_.store(true, std::memory_order_release);
            return true;
        }
    }
    return false;
}

}  // namespace fineview
