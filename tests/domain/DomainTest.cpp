#include <gtest/gtest.h>

#include "domain/Timestamp.hpp"
#include "domain/PresenceStatus.hpp"
#include "domain/enums/PresenceError.hpp"
#include "domain/enums/RegistrationMode.hpp"

using namespace finger::domain;
using namespace std::chrono_literals;

// ================================================================
// TIMESTAMP
// ================================================================

TEST(TimestampTest, SecondsAndMillis) {
    auto ts = Timestamp::fromMillis(1700000000123);
    EXPECT_EQ(ts.toSeconds(), 1700000000);
    EXPECT_EQ(ts.toMillis(), 1700000000123);
    EXPECT_EQ(ts.plus(60s).toMillis(), 1700000060123);
}

TEST(TimestampTest, SecondsSinceIsNeverNegative) {
    auto earlier = Timestamp::fromSeconds(100);
    auto later = Timestamp::fromSeconds(160);
    EXPECT_EQ(later.secondsSince(earlier), 60);
    EXPECT_EQ(earlier.secondsSince(later), 0);
}

TEST(TimestampTest, ToStringIsUtcIso8601) {
    EXPECT_EQ(Timestamp::fromSeconds(0).toString(), "1970-01-01T00:00:00Z");
    EXPECT_EQ(Timestamp::fromSeconds(1700000000).toString(), "2023-11-14T22:13:20Z");
}

// ================================================================
// PRESENCE STATUS
// ================================================================

TEST(PresenceStatusTest, EffectiveAtExpiry) {
    PresenceStatus status;
    status.username = "alice";
    status.online = true;
    status.since = Timestamp::fromSeconds(0);
    status.expiresAt = Timestamp::fromSeconds(3600);
    status.message = "hi";

    EXPECT_TRUE(status.isOnlineAt(Timestamp::fromSeconds(3599)));
    EXPECT_FALSE(status.isOnlineAt(Timestamp::fromSeconds(3600)));

    auto before = status.effectiveAt(Timestamp::fromSeconds(10));
    EXPECT_TRUE(before.online);
    EXPECT_EQ(before.since, Timestamp::fromSeconds(0));

    auto after = status.effectiveAt(Timestamp::fromSeconds(5000));
    EXPECT_FALSE(after.online);
    EXPECT_EQ(after.since, Timestamp::fromSeconds(3600));
    EXPECT_EQ(after.message, "hi");
}

TEST(PresenceStatusTest, OfflineRecordUnchanged) {
    PresenceStatus status;
    status.online = false;
    status.since = Timestamp::fromSeconds(50);

    auto effective = status.effectiveAt(Timestamp::fromSeconds(100000));
    EXPECT_FALSE(effective.online);
    EXPECT_EQ(effective.since, Timestamp::fromSeconds(50));
}

// ================================================================
// ENUMS
// ================================================================

TEST(EnumsTest, RegistrationMode) {
    EXPECT_EQ(toString(RegistrationMode::KEY_REQUIRED), "key");
    EXPECT_EQ(parseRegistrationMode("closed"), RegistrationMode::CLOSED);
    EXPECT_FALSE(parseRegistrationMode("Open").has_value());
}

TEST(EnumsTest, PresenceError) {
    for (auto error : {PresenceError::INVALID_USERNAME, PresenceError::USERNAME_TAKEN, PresenceError::REGISTRATION_CLOSED,
                       PresenceError::INVALID_REGISTRATION_KEY, PresenceError::AUTH_FAILED,
                       PresenceError::NOT_ONLINE, PresenceError::USER_NOT_FOUND,
                       PresenceError::STORE_UNAVAILABLE}) {
        EXPECT_EQ(parsePresenceError(toString(error)), error);
    }
    EXPECT_EQ(parsePresenceError("garbage"), PresenceError::NONE);
}
