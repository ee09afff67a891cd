#include <gtest/gtest.h>
#include <thread>
#include "errors.hpp"
#include "feed_slots.hpp"

using feed::FeedSlotTable;
using feed::SlotRule;

namespace {

imaging::ImagePtr image_tagged(uint8_t tag) {
    auto image = std::make_shared<imaging::Image>();
    image->pixels = {tag};
    return image;
}

std::vector<feed::FeedSlot> slots_held_by(std::initializer_list<const char*> holders) {
    std::vector<feed::FeedSlot> slots;
    for (const char* holder : holders) {
        feed::FeedSlot slot;
        if (holder) slot.identity = holder;
        slots.push_back(slot);
    }
    return slots;
}

} // namespace

TEST(FeedSlotTable, ArrivalSequenceFillsReservedThenFreeThenOverwrites) {
    FeedSlotTable table(4, {{"A", 0}, {"B", 1}});

    EXPECT_EQ(table.assign("A", image_tagged(1)), 0u);
    EXPECT_EQ(table.assign("B", image_tagged(2)), 1u);
    EXPECT_EQ(table.assign("C", image_tagged(3)), 2u);
    EXPECT_EQ(table.assign("D", image_tagged(4)), 3u);
    EXPECT_EQ(table.assign("E", image_tagged(5)), 0u);

    auto slots = table.snapshot();
    ASSERT_EQ(slots.size(), 4u);
    EXPECT_EQ(*slots[0].identity, "E");
    EXPECT_EQ(slots[0].last_image->pixels[0], 5);
    EXPECT_EQ(*slots[3].identity, "D");
}

TEST(FeedSlotTable, RepeatSenderKeepsItsSlotAndImageIsReplaced) {
    FeedSlotTable table(4, {});

    EXPECT_EQ(table.assign("C", image_tagged(1)), 0u);
    EXPECT_EQ(table.assign("D", image_tagged(2)), 1u);
    EXPECT_EQ(table.assign("C", image_tagged(3)), 0u);

    auto slots = table.snapshot();
    EXPECT_EQ(slots[0].last_image->pixels[0], 3);
}

TEST(FeedSlotTable, RejectsImpossibleTables) {
    EXPECT_THROW(FeedSlotTable(0, {}), errors::ConfigurationError);
    EXPECT_THROW(FeedSlotTable(2, {{"A", 2}}), errors::ConfigurationError);
}

TEST(FeedSlotTable, UnreservedSlotIsPreferredOverAnotherIdentitysReservation) {
    FeedSlotTable table(3, {{"A", 0}});

    EXPECT_EQ(table.assign("X", image_tagged(1)), 1u);
    EXPECT_EQ(table.assign("Y", image_tagged(2)), 2u);
    // Only the reserved slot is free now
    EXPECT_EQ(table.assign("Z", image_tagged(3)), 0u);
    // A finds its slot held by Z and nothing free
    EXPECT_EQ(table.assign("A", image_tagged(4)), 0u);

    auto slots = table.snapshot();
    EXPECT_EQ(*slots[0].identity, "A");
}

TEST(FeedSlotTable, ReservedSlotIsLastResortForOthersThenOverwritten) {
    FeedSlotTable table(3, {{"A", 0}});

    EXPECT_EQ(table.assign("Z", image_tagged(1)), 1u);
    EXPECT_EQ(table.assign("Y", image_tagged(2)), 2u);
    EXPECT_EQ(table.assign("X", image_tagged(3)), 0u); // falls back to the reserved slot
    EXPECT_EQ(table.assign("X", image_tagged(4)), 0u); // already held

    // A takes nothing from rule 1 (0 is held by X) and lands on overwrite
    EXPECT_EQ(table.assign("A", image_tagged(5)), 0u);
    auto slots = table.snapshot();
    EXPECT_EQ(*slots[0].identity, "A");
    EXPECT_EQ(*slots[1].identity, "Z");
    EXPECT_EQ(*slots[2].identity, "Y");

    // X was displaced; it now holds nothing and every slot is busy
    EXPECT_EQ(table.assign("X", image_tagged(6)), 0u);
    slots = table.snapshot();
    std::size_t held_by_x = 0;
    for (const auto& slot : slots) {
        if (slot.identity && *slot.identity == "X") ++held_by_x;
    }
    EXPECT_EQ(held_by_x, 1u);
}

TEST(FeedSlotTable, IdentityNeverHoldsTwoSlots) {
    FeedSlotTable table(3, {{"A", 2}});

    // Reserved slot 2 is taken by someone else first
    EXPECT_EQ(table.assign("P", image_tagged(1)), 0u);
    EXPECT_EQ(table.assign("Q", image_tagged(2)), 1u);
    EXPECT_EQ(table.assign("R", image_tagged(3)), 2u);

    // R sits on A's reservation and nothing is free
    EXPECT_EQ(table.assign("A", image_tagged(4)), 0u);
    auto slots = table.snapshot();
    EXPECT_EQ(*slots[0].identity, "A");

    std::size_t held_by_a = 0;
    for (const auto& slot : slots) {
        if (slot.identity && *slot.identity == "A") ++held_by_a;
    }
    EXPECT_EQ(held_by_a, 1u);
}

TEST(ChooseSlot, RulesApplyInPrecedenceOrder) {
    std::map<std::string, std::size_t> preferred{{"A", 0}, {"B", 1}};

    auto choice = feed::choose_slot(slots_held_by({nullptr, nullptr, nullptr}), preferred, "A");
    EXPECT_EQ(choice.slot, 0u);
    EXPECT_EQ(choice.rule, SlotRule::PREFERRED);

    choice = feed::choose_slot(slots_held_by({"A", nullptr, nullptr}), preferred, "A");
    EXPECT_EQ(choice.slot, 0u);
    EXPECT_EQ(choice.rule, SlotRule::PREFERRED);

    choice = feed::choose_slot(slots_held_by({"X", nullptr, "A"}), preferred, "A");
    EXPECT_EQ(choice.slot, 2u);
    EXPECT_EQ(choice.rule, SlotRule::ALREADY_HELD);

    choice = feed::choose_slot(slots_held_by({nullptr, nullptr, nullptr}), preferred, "C");
    EXPECT_EQ(choice.slot, 2u);
    EXPECT_EQ(choice.rule, SlotRule::FREE_UNRESERVED);

    choice = feed::choose_slot(slots_held_by({"X", nullptr, "Y"}), preferred, "C");
    EXPECT_EQ(choice.slot, 1u);
    EXPECT_EQ(choice.rule, SlotRule::FREE);

    choice = feed::choose_slot(slots_held_by({"X", "Y", "Z"}), preferred, "C");
    EXPECT_EQ(choice.slot, 0u);
    EXPECT_EQ(choice.rule, SlotRule::OVERWRITE_FIRST);
}

TEST(FeedSlotTable, ConcurrentAssignmentsKeepOneSlotPerIdentity) {
    FeedSlotTable table(4, {{"TX1", 0}, {"TX2", 1}});
    const std::vector<std::string> identities{"TX1", "TX2", "cam-a", "cam-b"};

    std::vector<std::thread> threads;
    for (const auto& id : identities) {
        threads.emplace_back([&table, id]() {
            for (int i = 0; i < 50; ++i) table.assign(id, image_tagged(static_cast<uint8_t>(i)));
        });
    }
    for (auto& t : threads) t.join();

    auto slots = table.snapshot();
    EXPECT_EQ(*slots[0].identity, "TX1");
    EXPECT_EQ(*slots[1].identity, "TX2");
    for (const auto& id : identities) {
        std::size_t held = 0;
        for (const auto& slot : slots) {
            if (slot.identity && *slot.identity == id) ++held;
        }
        EXPECT_EQ(held, 1u) << id;
    }
}
