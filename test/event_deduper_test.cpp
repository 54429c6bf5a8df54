#include <gtest/gtest.h>

#include "relaysync/service/event_deduper.hpp"
#include "test_helpers.hpp"

using namespace relaysync::service;
using namespace relaysync_test;
using namespace std;
using namespace ::testing;

TEST(EventDeduperTest, Admit_AcceptsEachIdOnce)
{
    EventDeduper deduper;
    auto event = makeEvent(hexId(1), ALICE, 1, 100);
    auto copy = makeEvent(hexId(1), ALICE, 1, 100);

    ASSERT_TRUE(deduper.admit(*event));
    ASSERT_FALSE(deduper.admit(*copy));
    ASSERT_EQ(deduper.size(), 1);
};

TEST(EventDeduperTest, Admit_AcceptsDistinctIds)
{
    EventDeduper deduper;

    ASSERT_TRUE(deduper.admit(*makeEvent(hexId(1), ALICE, 1, 100)));
    ASSERT_TRUE(deduper.admit(*makeEvent(hexId(2), ALICE, 1, 100)));
    ASSERT_EQ(deduper.size(), 2);
};

TEST(EventDeduperTest, Admit_RejectsEventsWithoutId)
{
    EventDeduper deduper;

    ASSERT_FALSE(deduper.admit(*makeEvent("", ALICE, 1, 100)));
    ASSERT_EQ(deduper.size(), 0);
};
