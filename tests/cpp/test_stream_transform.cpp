#include <gtest/gtest.h>
#include "TestSamples.hpp"
#include "lheutils/Errors.hpp"
#include "lheutils/StreamTransform.hpp"
#include <memory>

using namespace lheutils;
using namespace testing_lhe;

namespace
{
    std::unique_ptr<CountingStream> sampleStream(std::vector<Event> events)
    {
        return std::make_unique<CountingStream>(sampleInit(), std::move(events));
    }
}

TEST(StreamTransform, AppendCopiesCentralWeight) {
    TransformedStream stream(sampleStream({sampleEvent(1.5), sampleEvent(-2.0)}),
                             {AppendWeight{"lhe", "central", "LHE weight"}});

    const auto [group, weight] = stream.init().findWeight("central");
    ASSERT_NE(weight, nullptr);
    EXPECT_EQ(group->name(), "lhe");
    EXPECT_EQ(weight->index, 4);

    Event event;
    ASSERT_TRUE(stream.next(event));
    EXPECT_DOUBLE_EQ(event.weights.at("central"), 1.5);
    EXPECT_EQ(event.weights.size(), 4u);
    ASSERT_TRUE(stream.next(event));
    EXPECT_DOUBLE_EQ(event.weights.at("central"), -2.0);
    EXPECT_FALSE(stream.next(event));
}

TEST(StreamTransform, SourceHeaderIsNotModified) {
    auto source = sampleStream({});
    const Init before = source->init();
    const EventStream* raw = source.get();
    TransformedStream stream(std::move(source), {RestrictToWeight{"1"}});
    EXPECT_EQ(raw->init(), before);
    EXPECT_EQ(stream.init().numWeights(), 1u);
}

TEST(StreamTransform, RestrictPromotesSelectedWeight) {
    TransformedStream stream(sampleStream({sampleEvent(2.0)}), {RestrictToWeight{"3"}});

    ASSERT_EQ(stream.init().weightGroups.size(), 1u);
    EXPECT_EQ(stream.init().weightGroups[0].name(), "PDF");

    Event event;
    ASSERT_TRUE(stream.next(event));
    EXPECT_DOUBLE_EQ(event.info.weight, 4.0);
    ASSERT_EQ(event.weights.size(), 1u);
    EXPECT_DOUBLE_EQ(event.weights.at("3"), 4.0);
}

TEST(StreamTransform, RestrictDropsEventsWithoutTheWeight) {
    std::vector<Event> events;
    for (int i = 0; i < 10; ++i) {
        events.push_back(sampleEvent(i + 1.0, i % 3 != 0));
    }
    TransformedStream stream(sampleStream(events), {RestrictToWeight{"1"}});

    // Events 0, 3, 6 and 9 lack weights; the rest keep their order
    EXPECT_EQ(centralWeights(stream), (std::vector<double>{2, 3, 5, 6, 8, 9}));
    EXPECT_EQ(stream.eventsDropped(), 4u);
}

TEST(StreamTransform, PoliciesComposeInOrder) {
    TransformedStream stream(sampleStream({sampleEvent(1.0, false), sampleEvent(3.0)}),
                             {AppendWeight{"lhe", "central", ""}, RestrictToWeight{"central"}});

    ASSERT_EQ(stream.init().numWeights(), 1u);
    EXPECT_NE(stream.init().findWeight("central").second, nullptr);

    Event event;
    ASSERT_TRUE(stream.next(event));
    EXPECT_DOUBLE_EQ(event.info.weight, 1.0);
    EXPECT_EQ(event.weights, (std::map<std::string, double>{{"central", 1.0}}));
    ASSERT_TRUE(stream.next(event));
    EXPECT_DOUBLE_EQ(event.info.weight, 3.0);
    EXPECT_FALSE(stream.next(event));
}

TEST(StreamTransform, StackedStreamsCompose) {
    auto inner = std::make_unique<TransformedStream>(sampleStream({sampleEvent(5.0)}),
                                                     std::vector<TransformPolicy>{AppendWeight{"a", "x", ""}});
    TransformedStream outer(std::move(inner), {AppendWeight{"a", "y", ""}});

    EXPECT_EQ(outer.init().findWeight("x").second->index, 4);
    EXPECT_EQ(outer.init().findWeight("y").second->index, 5);

    Event event;
    ASSERT_TRUE(outer.next(event));
    EXPECT_DOUBLE_EQ(event.weights.at("x"), 5.0);
    EXPECT_DOUBLE_EQ(event.weights.at("y"), 5.0);
}

TEST(StreamTransform, HeaderErrorsHappenBeforeAnyPull) {
    size_t pulls = 0;
    auto source = std::make_unique<PullCounter>(sampleInit(), std::vector<Event>{sampleEvent(1.0)}, pulls);
    std::vector<TransformPolicy> duplicate{AppendWeight{"g", "2", ""}};
    EXPECT_THROW(TransformedStream(std::move(source), duplicate), DuplicateWeightId);
    EXPECT_EQ(pulls, 0u);

    auto second = std::make_unique<PullCounter>(sampleInit(), std::vector<Event>{sampleEvent(1.0)}, pulls);
    std::vector<TransformPolicy> unknown{RestrictToWeight{"nope"}};
    EXPECT_THROW(TransformedStream(std::move(second), unknown), WeightIdNotFound);
    EXPECT_EQ(pulls, 0u);
}

TEST(StreamTransform, EventsArePulledLazily) {
    auto source = sampleStream({sampleEvent(1.0), sampleEvent(2.0), sampleEvent(3.0)});
    CountingStream* counter = source.get();
    TransformedStream stream(std::move(source), {AppendWeight{"g", "c", ""}});
    EXPECT_EQ(counter->pulls, 0u);

    Event event;
    ASSERT_TRUE(stream.next(event));
    EXPECT_EQ(counter->pulls, 1u);
}
