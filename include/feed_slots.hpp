#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "imaging.hpp"

namespace feed {

struct FeedSlot {
    std::optional<std::string> identity; // empty = unassigned
    imaging::ImagePtr last_image;
};

// Which rule picked the slot, in precedence order
enum class SlotRule {
    PREFERRED,
    ALREADY_HELD,
    FREE_UNRESERVED,
    FREE,
    OVERWRITE_FIRST
};

const char* to_string(SlotRule rule);

struct SlotChoice {
    std::size_t slot;
    SlotRule rule;
};

// Pure selection over a snapshot of the table
SlotChoice choose_slot(const std::vector<FeedSlot>& slots,
                       const std::map<std::string, std::size_t>& preferred,
                       const std::string& identity);

// Fixed set of live-display slots shared by every handling unit.
// Selection and update happen under one lock.
class FeedSlotTable {
public:
    // Throws errors::ConfigurationError on zero slots or a preferred
    // slot outside the table.
    FeedSlotTable(std::size_t slot_count, std::map<std::string, std::size_t> preferred);

    // Picks the slot for identity, stores the image there and returns
    // the slot index. Any other slot the identity held is vacated.
    std::size_t assign(const std::string& identity, imaging::ImagePtr image);

    std::vector<FeedSlot> snapshot() const;
    std::size_t size() const { return slot_count_; }

private:
    const std::size_t slot_count_;
    const std::map<std::string, std::size_t> preferred_;
    mutable std::mutex mutex_;
    std::vector<FeedSlot> slots_;
};

} // namespace feed
