#include <gtest/gtest.h>

#include "ErrorSlot.hpp"

using namespace CapBridge;

TEST(ErrorSlotTest, StartsEmpty) {
    ErrorSlot slot;
    EXPECT_FALSE(slot.hasError());
    EXPECT_FALSE(slot.last().has_value());
}

TEST(ErrorSlotTest, KeepsMessageUntilOverwritten) {
    ErrorSlot slot;
    slot.set("first");
    EXPECT_EQ(slot.last().value(), "first");
    // reading does not clear
    EXPECT_EQ(slot.last().value(), "first");
    slot.set("second");
    EXPECT_EQ(slot.last().value(), "second");
}

TEST(ErrorSlotTest, BridgeErrorRendersKindAndDetail) {
    ErrorSlot slot;
    slot.set(BridgeError(BridgeError::Kind::UnknownRequest, "no pending request with id 'x'"));
    EXPECT_EQ(slot.last().value(), "UnknownRequest: no pending request with id 'x'");
}

TEST(ErrorSlotTest, KindNames) {
    EXPECT_STREQ(BridgeError::kindName(BridgeError::Kind::InvalidEncoding), "InvalidEncoding");
    EXPECT_STREQ(BridgeError::kindName(BridgeError::Kind::Html), "Html");
}
