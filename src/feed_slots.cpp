#include "feed_slots.hpp"
#include "errors.hpp"
#include "event_log.hpp"

namespace feed {

const char* to_string(SlotRule rule) {
    switch (rule) {
        case SlotRule::PREFERRED: return "preferred slot";
        case SlotRule::ALREADY_HELD: return "slot already held";
        case SlotRule::FREE_UNRESERVED: return "first free unreserved slot";
        case SlotRule::FREE: return "first free slot";
        case SlotRule::OVERWRITE_FIRST: return "all slots busy, overwriting slot 0";
    }
    return "unknown";
}

SlotChoice choose_slot(const std::vector<FeedSlot>& slots,
                       const std::map<std::string, std::size_t>& preferred,
                       const std::string& identity) {
    auto pref = preferred.find(identity);
    if (pref != preferred.end() && pref->second < slots.size()) {
        const auto& holder = slots[pref->second].identity;
        if (!holder || *holder == identity) {
            return {pref->second, SlotRule::PREFERRED};
        }
    }

    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (slots[i].identity && *slots[i].identity == identity) {
            return {i, SlotRule::ALREADY_HELD};
        }
    }

    auto reserved_by_other = [&](std::size_t slot) {
        for (const auto& [owner, index] : preferred) {
            if (index == slot && owner != identity) return true;
        }
        return false;
    };

    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i].identity && !reserved_by_other(i)) {
            return {i, SlotRule::FREE_UNRESERVED};
        }
    }

    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i].identity) {
            return {i, SlotRule::FREE};
        }
    }

    return {0, SlotRule::OVERWRITE_FIRST};
}

// ─── FeedSlotTable ──────────────────────────────────────────────────────────

FeedSlotTable::FeedSlotTable(std::size_t slot_count, std::map<std::string, std::size_t> preferred)
    : slot_count_(slot_count), preferred_(std::move(preferred)), slots_(slot_count) {
    if (slot_count_ == 0) {
        throw errors::ConfigurationError("feed slot table needs at least one slot");
    }
    for (const auto& [identity, slot] : preferred_) {
        if (slot >= slot_count_) {
            throw errors::ConfigurationError("preferred slot " + std::to_string(slot) + " for '" +
                                             identity + "' is outside the table");
        }
    }
}

std::size_t FeedSlotTable::assign(const std::string& identity, imaging::ImagePtr image) {
    std::lock_guard<std::mutex> lock(mutex_);

    SlotChoice choice = choose_slot(slots_, preferred_, identity);

    // One identity, one slot
    for (std::size_t i = 0; i < slots_.size(); ++i) {
        if (i != choice.slot && slots_[i].identity && *slots_[i].identity == identity) {
            slots_[i] = FeedSlot{};
        }
    }

    FeedSlot& slot = slots_[choice.slot];
    if (slot.identity && *slot.identity != identity) {
        event_log::warn("Feed slot " + std::to_string(choice.slot + 1) + " taken over from '" +
                        *slot.identity + "' by '" + identity + "'");
    }
    slot.identity = identity;
    slot.last_image = std::move(image);

    event_log::info("'" + identity + "' shown in feed slot " + std::to_string(choice.slot + 1) +
                    " (" + to_string(choice.rule) + ")");
    return choice.slot;
}

std::vector<FeedSlot> FeedSlotTable::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_;
}

} // namespace feed
