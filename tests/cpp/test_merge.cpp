#include <gtest/gtest.h>
#include "TestSamples.hpp"
#include "lheutils/Errors.hpp"
#include "lheutils/LHEFile.hpp"
#include "lheutils/MergeCoordinator.hpp"
#include "lheutils/SafeWriter.hpp"
#include <memory>
#include <sstream>
#include <stdexcept>

using namespace lheutils;
using namespace testing_lhe;

namespace
{
    std::vector<std::unique_ptr<EventStream>> sources(std::vector<std::vector<double>> weights)
    {
        std::vector<std::unique_ptr<EventStream>> out;
        for (const auto& list : weights)
        {
            std::vector<Event> events;
            for (double w : list) events.push_back(sampleEvent(w));
            out.push_back(std::make_unique<VectorEventStream>(sampleInit(), std::move(events)));
        }
        return out;
    }
}

TEST(Merge, ConcatenatesInSourceOrder) {
    ConcatenatedStream merged(sources({{1, 2}, {3}, {}, {4, 5}}));
    EXPECT_EQ(merged.numSources(), 4u);
    EXPECT_EQ(merged.init(), sampleInit());
    EXPECT_EQ(centralWeights(merged), (std::vector<double>{1, 2, 3, 4, 5}));
    EXPECT_EQ(merged.totalEvents(), 5u);
}

TEST(Merge, DifferentHeadersFailBeforeAnyEvent) {
    Init other = sampleInit();
    other.info.energyA = 7000.0;

    size_t pulls = 0;
    std::vector<std::unique_ptr<EventStream>> inputs;
    inputs.push_back(std::make_unique<PullCounter>(sampleInit(), std::vector<Event>{sampleEvent(1.0)}, pulls));
    inputs.push_back(std::make_unique<PullCounter>(other, std::vector<Event>{sampleEvent(2.0)}, pulls));

    try {
        merge(std::move(inputs));
        FAIL() << "expected IncompatibleHeaders";
    } catch (const IncompatibleHeaders& e) {
        EXPECT_EQ(e.sourceIndex(), 1u);
        EXPECT_EQ(e.field(), "init.energyA");
    }
    EXPECT_EQ(pulls, 0u);
}

TEST(Merge, IncompatibleMergeWritesNothing) {
    Init other = sampleInit();
    other.processes[0].xSection = 12.0;

    TempDir dir;
    const std::string target = dir.file("merged.lhe");
    auto inputs = sources({{1}});
    inputs.push_back(std::make_unique<VectorEventStream>(other, std::vector<Event>{sampleEvent(2.0)}));

    try {
        auto merged = merge(std::move(inputs));
        SafeWriter().write(*merged, Destination::file(target));
        FAIL() << "expected IncompatibleHeaders";
    } catch (const IncompatibleHeaders& e) {
        EXPECT_EQ(e.field(), "process[0].xSection");
    }
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_TRUE(std::filesystem::is_empty(dir.path()));
}

TEST(Merge, SingleSourcePassesThrough) {
    auto inputs = sources({{1, 2}});
    EventStream* only = inputs.front().get();
    auto merged = merge(std::move(inputs));
    EXPECT_EQ(merged.get(), only);
    EXPECT_EQ(centralWeights(*merged), (std::vector<double>{1, 2}));
}

TEST(Merge, EmptySourceListIsRejected) {
    std::vector<std::unique_ptr<EventStream>> none;
    EXPECT_THROW(merge(std::move(none)), std::invalid_argument);
    std::vector<std::unique_ptr<EventStream>> alsoNone;
    EXPECT_THROW(ConcatenatedStream{std::move(alsoNone)}, std::invalid_argument);
}

TEST(Merge, WeightGroupOrderAndHeaderTextDoNotMatter) {
    Init reordered = sampleInit();
    std::swap(reordered.weightGroups[0], reordered.weightGroups[1]);
    reordered.headerText = "<MGVersion>other</MGVersion>";

    std::vector<std::unique_ptr<EventStream>> inputs = sources({{1}});
    inputs.push_back(std::make_unique<VectorEventStream>(reordered, std::vector<Event>{sampleEvent(2.0)}));
    ConcatenatedStream merged(std::move(inputs));
    EXPECT_EQ(centralWeights(merged), (std::vector<double>{1, 2}));
    // The first source's header is the one carried on
    EXPECT_EQ(merged.init().weightGroups[0].name(), "scale_variation");
}

TEST(Merge, WeightDefinitionsMustAgree) {
    Init other = sampleInit();
    other.weightGroups[1].find("3")->text = "pdf=260002";

    std::vector<std::unique_ptr<EventStream>> inputs = sources({{1}});
    inputs.push_back(std::make_unique<VectorEventStream>(other, std::vector<Event>{}));
    EXPECT_THROW(ConcatenatedStream{std::move(inputs)}, IncompatibleHeaders);
}

TEST(Merge, MergesDecodedFiles) {
    std::vector<std::unique_ptr<EventStream>> inputs;
    std::istringstream a(sampleText(3));
    std::istringstream b(sampleText(2));
    inputs.push_back(std::make_unique<LHEFile>(a, "a.lhe"));
    inputs.push_back(std::make_unique<LHEFile>(b, "b.lhe"));

    ConcatenatedStream merged(std::move(inputs));
    EXPECT_EQ(centralWeights(merged), (std::vector<double>{1.5, 2.5, 3.5, 1.5, 2.5}));
    EXPECT_EQ(merged.totalEvents(), 5u);
}
