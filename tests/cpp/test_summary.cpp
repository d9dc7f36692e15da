#include <gtest/gtest.h>
#include "TestSamples.hpp"
#include "lheutils/LHEFile.hpp"
#include "lheutils/Summary.hpp"
#include <sstream>

using namespace lheutils;
using namespace testing_lhe;

namespace
{
    const ChannelKey kDrellYan{{-2, 2}, {-11, 11}};

    /// pp -> e- e+ with the beam protons listed as incoming particles.
    Event protonEvent(double weight)
    {
        Event event = sampleEvent(weight);
        event.particles[0].id = 2212;
        event.particles[1].id = 2212;
        return event;
    }

    Event gluonFusion(double weight)
    {
        Event event = sampleEvent(weight, false);
        event.info.procId = 2;
        event.particles[0].id = 21;
        event.particles[1].id = 21;
        event.particles[2].id = 25;
        event.particles.pop_back();
        return event;
    }

    Summary summaryOf(const std::vector<Event>& events)
    {
        Summary summary;
        for (const auto& event : events) summary.add(event);
        return summary;
    }
}

TEST(Summary, CountsChannelsAndNegativeWeights) {
    std::vector<Event> events;
    for (int i = 0; i < 100; ++i) events.push_back(protonEvent(i % 10 == 0 ? -1.0 : 1.0));
    VectorEventStream stream(sampleInit(), events);

    Summary summary = summarize(stream);
    EXPECT_EQ(summary.totalEvents(), 100u);
    EXPECT_EQ(summary.negativeEvents(), 10u);
    EXPECT_DOUBLE_EQ(summary.negativeRatio(), 0.10);
    ASSERT_EQ(summary.channels().size(), 1u);

    // Outgoing ids are sorted: (11, -11) is keyed as [-11, 11]
    const ChannelKey key = ChannelKey::fromEvent(events.front());
    EXPECT_EQ(key, (ChannelKey{{2212, 2212}, {-11, 11}}));
    EXPECT_EQ(key.toString(), "[2212, 2212] -> [-11, 11]");
    EXPECT_DOUBLE_EQ(summary.share(key), 1.0);
    EXPECT_EQ(summary.channels().at(key).events, 100u);
    EXPECT_EQ(summary.channels().at(key).negative, 10u);
}

TEST(Summary, EmptySummary) {
    Summary summary;
    EXPECT_EQ(summary.totalEvents(), 0u);
    EXPECT_DOUBLE_EQ(summary.negativeRatio(), 0.0);
    EXPECT_DOUBLE_EQ(summary.share(kDrellYan), 0.0);
    EXPECT_TRUE(summary.channelsByCount().empty());
}

TEST(Summary, ChannelKeyIgnoresIntermediateParticles) {
    Event event = sampleEvent(1.0);
    Particle z;
    z.id = 23;
    z.status = 2;
    event.particles.insert(event.particles.begin() + 2, z);

    ChannelKey key = ChannelKey::fromEvent(event);
    EXPECT_EQ(key, kDrellYan);
    EXPECT_EQ(key.toString(), "[-2, 2] -> [-11, 11]");
}

TEST(Summary, MergeIsAMonoid) {
    Summary a = summaryOf({sampleEvent(1.0), sampleEvent(-1.0)});
    Summary b = summaryOf({gluonFusion(2.0)});
    Summary c = summaryOf({gluonFusion(-3.0), sampleEvent(4.0), gluonFusion(5.0)});
    const Summary empty;

    EXPECT_EQ((a + b) + c, a + (b + c));
    EXPECT_EQ(a + b, b + a);
    EXPECT_EQ(a + empty, a);
    EXPECT_EQ(empty + a, a);
    EXPECT_NE(a + b, a);

    std::vector<Event> all = {sampleEvent(1.0), sampleEvent(-1.0), gluonFusion(2.0),
                              gluonFusion(-3.0), sampleEvent(4.0), gluonFusion(5.0)};
    EXPECT_EQ(a + b + c, summaryOf(all));
}

TEST(Summary, ChannelsByCountIsDescending) {
    Summary summary = summaryOf({gluonFusion(1.0), sampleEvent(1.0), gluonFusion(1.0), gluonFusion(-1.0)});
    auto channels = summary.channelsByCount();
    ASSERT_EQ(channels.size(), 2u);
    EXPECT_EQ(channels[0].first.toString(), "[21, 21] -> [25]");
    EXPECT_EQ(channels[0].second.events, 3u);
    EXPECT_EQ(channels[0].second.negative, 1u);
    EXPECT_EQ(channels[1].first, kDrellYan);
    EXPECT_DOUBLE_EQ(summary.share(kDrellYan), 0.25);
}

TEST(Summary, FileInfoSplitsByProcess) {
    Init init = sampleInit();
    init.processes.push_back(ProcessInfo{20.0, 1.0, 20.0, 2});
    init.info.numProcesses = 2;

    Event unknown = sampleEvent(1.0);
    unknown.info.procId = 7;
    VectorEventStream stream(init, {sampleEvent(1.0), gluonFusion(-1.0), sampleEvent(2.0), unknown});

    FileInfo info = FileInfo::collect("sample.lhe", stream);
    EXPECT_EQ(info.source, "sample.lhe");
    EXPECT_EQ(info.beams.beamA, 2212);
    ASSERT_EQ(info.weightGroups.size(), 2u);
    EXPECT_EQ(info.weightGroups[0], (std::pair<std::string, size_t>{"scale_variation", 2}));
    EXPECT_EQ(info.weightGroups[1], (std::pair<std::string, size_t>{"PDF", 1}));

    ASSERT_EQ(info.processes.size(), 2u);
    EXPECT_EQ(info.processes[0].process.procId, 1);
    EXPECT_EQ(info.processes[0].summary.totalEvents(), 2u);
    EXPECT_EQ(info.processes[1].summary.totalEvents(), 1u);
    EXPECT_EQ(info.processes[1].summary.negativeEvents(), 1u);
    EXPECT_EQ(info.total.totalEvents(), 4u);
}

TEST(Summary, SummarizesDecodedFile) {
    std::string text = kHeader;
    for (size_t i = 0; i < 6; ++i) text += eventText(i, i % 3 == 0);
    text += kFooter;
    std::istringstream in(text);
    LHEFile file(in);

    Summary summary = summarize(file);
    EXPECT_EQ(summary.totalEvents(), 6u);
    EXPECT_EQ(summary.negativeEvents(), 2u);
    EXPECT_DOUBLE_EQ(summary.share(kDrellYan), 1.0);
}
