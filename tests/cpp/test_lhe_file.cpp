#include <gtest/gtest.h>
#include "TestSamples.hpp"
#include "lheutils/Errors.hpp"
#include "lheutils/LHEFile.hpp"
#include <sstream>

using namespace lheutils;
using namespace testing_lhe;

TEST(LHEFile, ParsesHeader) {
    std::istringstream in(sampleText(1));
    LHEFile file(in, "sample");
    const Init& init = file.init();

    EXPECT_EQ(init.version, "3.0");
    EXPECT_EQ(init.info.beamA, 2212);
    EXPECT_EQ(init.info.beamB, 2212);
    EXPECT_DOUBLE_EQ(init.info.energyA, 6500.0);
    EXPECT_EQ(init.info.pdfSetB, 260000);
    EXPECT_EQ(init.info.weightingStrategy, -4);
    ASSERT_EQ(init.processes.size(), 1u);
    EXPECT_DOUBLE_EQ(init.processes[0].xSection, 500.0);
    EXPECT_DOUBLE_EQ(init.processes[0].error, 10.0);
    EXPECT_EQ(init.processes[0].procId, 1);

    ASSERT_EQ(init.weightGroups.size(), 2u);
    const WeightGroup& scale = init.weightGroups[0];
    EXPECT_EQ(scale.name(), "scale_variation");
    EXPECT_EQ(scale.attributes().at("combine"), "envelope");
    ASSERT_EQ(scale.size(), 2u);
    EXPECT_EQ(scale.weights()[0].id, "1");
    EXPECT_EQ(scale.weights()[0].text, "mur=1 muf=1");
    EXPECT_EQ(scale.weights()[0].attributes.at("MUR"), "1.0");
    EXPECT_EQ(scale.weights()[1].index, 2);
    EXPECT_EQ(init.weightGroups[1].weights()[0].index, 3);
    EXPECT_EQ(init.maxWeightIndex(), 3);

    EXPECT_NE(init.headerText.find("<MGVersion>"), std::string::npos);
    EXPECT_EQ(init.headerText.find("initrwgt"), std::string::npos);
    EXPECT_EQ(file.sourceName(), "sample");
}

TEST(LHEFile, ReadsEventsSequentially) {
    std::istringstream in(sampleText(3));
    LHEFile file(in);

    Event event;
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(file.next(event));
        EXPECT_EQ(event.info.nParticles, 4);
        ASSERT_EQ(event.particles.size(), 4u);
        EXPECT_DOUBLE_EQ(event.info.weight, i + 1.5);
        EXPECT_EQ(event.particles[0].id, 2);
        EXPECT_EQ(event.particles[0].status, -1);
        EXPECT_EQ(event.particles[0].color1, 501);
        EXPECT_DOUBLE_EQ(event.particles[2].pz, 30.0);
        EXPECT_DOUBLE_EQ(event.particles[2].spin, -1.0);
        ASSERT_EQ(event.weights.size(), 3u);
        EXPECT_DOUBLE_EQ(event.weights.at("1"), i + 1.5);
        EXPECT_DOUBLE_EQ(event.weights.at("2"), 0.25);
    }
    EXPECT_FALSE(file.next(event));
    EXPECT_FALSE(file.next(event));
    EXPECT_EQ(file.eventsRead(), 3u);
    EXPECT_EQ(file.status(), DecodeStatus::Ok);
}

TEST(LHEFile, ReadsPlainAndGzipFiles) {
    TempDir dir;
    const std::string text = sampleText(5);
    writeFile(dir.file("plain.lhe"), text);
    writeFile(dir.file("packed.lhe.gz"), gzipBytes(text));

    LHEFile plain(dir.file("plain.lhe"));
    LHEFile packed(dir.file("packed.lhe.gz"));
    EXPECT_EQ(plain.init(), packed.init());

    Event a;
    Event b;
    size_t n = 0;
    while (plain.next(a)) {
        ASSERT_TRUE(packed.next(b));
        expectSameEvent(a, b);
        ++n;
    }
    EXPECT_FALSE(packed.next(b));
    EXPECT_EQ(n, 5u);
}

TEST(LHEFile, PositionalWeightsFollowHeaderIndex) {
    std::string text = kHeader;
    text += "<event>\n 1 1 2.0 0 0 0\n 11 1 0 0 0 0 0 0 1 1 0 0 9\n<weights> 0.1 0.2 0.3 0.4 </weights>\n</event>\n";
    text += kFooter;
    std::istringstream in(text);
    LHEFile file(in);

    Event event;
    ASSERT_TRUE(file.next(event));
    ASSERT_EQ(event.weights.size(), 3u);
    EXPECT_DOUBLE_EQ(event.weights.at("1"), 0.1);
    EXPECT_DOUBLE_EQ(event.weights.at("2"), 0.2);
    EXPECT_DOUBLE_EQ(event.weights.at("3"), 0.3);
}

TEST(LHEFile, IgnoresCommentsAndUnknownBlocks) {
    std::string text = kHeader;
    text += "<event npLO=\" -1 \">\n 1 1 2.0 0 0 0\n 11 1 0 0 0 0 0 0 1 1 0 0 9\n"
            "#aMCatNLO 2 5 3 3 3\n<mgrwt>\n<rscale> 0 0.1 </rscale>\n</mgrwt>\n</event>\n";
    text += kFooter;
    std::istringstream in(text);
    LHEFile file(in);

    Event event;
    ASSERT_TRUE(file.next(event));
    EXPECT_EQ(event.particles.size(), 1u);
    EXPECT_EQ(event.attributes.at("npLO"), " -1 ");
    EXPECT_FALSE(file.next(event));
}

TEST(LHEFile, TruncatedInputDeliversCompleteEventsFirst) {
    std::string text = sampleText(3);
    // Cut in the middle of the third event
    const size_t third = text.find("<event>", text.find("<event>", text.find("<event>") + 1) + 1);
    text.resize(third + 40);
    std::istringstream in(text);
    LHEFile file(in, "cut.lhe");

    Event event;
    ASSERT_TRUE(file.next(event));
    ASSERT_TRUE(file.next(event));
    try {
        file.next(event);
        FAIL() << "expected DecodeTruncated";
    } catch (const DecodeTruncated& e) {
        EXPECT_EQ(e.source(), "cut.lhe");
        EXPECT_EQ(e.eventIndex(), 2u);
    }
    EXPECT_EQ(file.status(), DecodeStatus::Truncated);
    EXPECT_FALSE(file.next(event));
    EXPECT_EQ(file.eventsRead(), 2u);
}

TEST(LHEFile, MissingClosingTagIsTruncation) {
    std::string text = sampleText(2);
    text.resize(text.size() - std::string(kFooter).size());
    std::istringstream in(text);
    LHEFile file(in);

    Event event;
    ASSERT_TRUE(file.next(event));
    ASSERT_TRUE(file.next(event));
    EXPECT_THROW(file.next(event), DecodeTruncated);
}

TEST(LHEFile, TruncatedGzipStream) {
    TempDir dir;
    const std::string packed = gzipBytes(sampleText(2000));
    writeFile(dir.file("cut.lhe.gz"), packed.substr(0, packed.size() / 2));

    LHEFile file(dir.file("cut.lhe.gz"));
    Event event;
    size_t n = 0;
    EXPECT_THROW({ while (file.next(event)) ++n; }, DecodeTruncated);
    EXPECT_GT(n, 0u);
    EXPECT_LT(n, 2000u);
    EXPECT_EQ(file.status(), DecodeStatus::Truncated);
}

TEST(LHEFile, BadNumberIsMalformed) {
    std::string text = kHeader + eventText(0);
    text += "<event>\n 1 1 2.0 0 0 0\n 11 1 0 0 0 0 0 0 abc 1 0 0 9\n</event>\n";
    text += kFooter;
    std::istringstream in(text);
    LHEFile file(in);

    Event event;
    ASSERT_TRUE(file.next(event));
    EXPECT_THROW(file.next(event), DecodeMalformed);
    EXPECT_EQ(file.status(), DecodeStatus::Malformed);
    EXPECT_FALSE(file.next(event));
}

TEST(LHEFile, ParticleCountMustMatch) {
    std::string missing = std::string(kHeader) +
        "<event>\n 2 1 2.0 0 0 0\n 11 1 0 0 0 0 0 0 1 1 0 0 9\n</event>\n" + kFooter;
    std::istringstream in1(missing);
    LHEFile tooFew(in1);
    Event event;
    EXPECT_THROW(tooFew.next(event), DecodeMalformed);

    std::string extra = std::string(kHeader) +
        "<event>\n 1 1 2.0 0 0 0\n 11 1 0 0 0 0 0 0 1 1 0 0 9\n -11 1 0 0 0 0 0 0 1 1 0 0 9\n</event>\n" + kFooter;
    std::istringstream in2(extra);
    LHEFile tooMany(in2);
    EXPECT_THROW(tooMany.next(event), DecodeMalformed);
}

TEST(LHEFile, HugeParticleCountIsMalformed) {
    std::string text = kHeader + eventText(0);
    text += "<event>\n 2000000000 1 1.0 9.1e+01 7.5e-03 1.3e-01\n";
    text += " 2 -1 0 0 501 0 0.0 0.0 4.5e+01 4.5e+01 0.0 0.0 9.0\n";
    text += "</event>\n";
    text += kFooter;
    std::istringstream in(text);
    LHEFile file(in);

    Event event;
    ASSERT_TRUE(file.next(event));
    EXPECT_THROW(file.next(event), DecodeMalformed);
    EXPECT_EQ(file.status(), DecodeStatus::Malformed);
    EXPECT_EQ(file.eventsRead(), 1u);
}

TEST(LHEFile, HugeProcessCountIsMalformed) {
    std::string text =
        "<LesHouchesEvents version=\"3.0\">\n"
        "<init>\n"
        " 2212 2212 6.5e+03 6.5e+03 0 0 260000 260000 -4 2000000000\n"
        " 5.0e+02 1.0e+01 5.0e+02 1\n"
        "</init>\n";
    text += eventText(0);
    text += kFooter;
    std::istringstream in(text);
    EXPECT_THROW(LHEFile file(in), DecodeMalformed);
}

TEST(LHEFile, MismatchedTagIsMalformed) {
    std::string text = kHeader + eventText(0) + "<event>\n 0 1 1.0 0 0 0\n</evnt>\n" + kFooter;
    std::istringstream in(text);
    LHEFile file(in);

    Event event;
    ASSERT_TRUE(file.next(event));
    EXPECT_THROW(file.next(event), DecodeMalformed);
}

TEST(LHEFile, BrokenHeaderFailsInConstructor) {
    std::istringstream noInit("<LesHouchesEvents version=\"3.0\">\n</LesHouchesEvents>\n");
    EXPECT_THROW(LHEFile file(noInit), DecodeMalformed);

    std::istringstream wrongRoot("<html></html>");
    EXPECT_THROW(LHEFile file(wrongRoot), DecodeMalformed);

    std::istringstream empty("");
    EXPECT_THROW(LHEFile file(empty), DecodeTruncated);

    std::istringstream cutHeader(std::string(kHeader).substr(0, 200));
    EXPECT_THROW(LHEFile file(cutHeader), DecodeTruncated);
}

TEST(LHEFile, MissingSource) {
    TempDir dir;
    EXPECT_THROW(LHEFile file(dir.file("nothing.lhe")), SourceNotFound);
}

TEST(LHEFile, UnreadableSourceIsNotADecodeError) {
    TempDir dir;
    try {
        LHEFile file(dir.path().string());
        FAIL() << "expected an error for a directory";
    } catch (const LHEError&) {
        FAIL() << "a directory is an I/O failure, not an LHE error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("Failed to open LHEFile"), std::string::npos);
    }
}

TEST(LHEFile, DuplicateWeightIdInHeaderIsMalformed) {
    std::string text = kHeader;
    const std::string pdf = "<weight id=\"3\">pdf=260001</weight>";
    text.replace(text.find(pdf), pdf.size(), pdf + "\n<weight id=\"1\">again</weight>");
    text += kFooter;
    std::istringstream in(text);
    EXPECT_THROW(LHEFile file(in), DecodeMalformed);
}

TEST(LHEFile, StatusNames) {
    EXPECT_STREQ(toString(DecodeStatus::Ok), "ok");
    EXPECT_STREQ(toString(DecodeStatus::Truncated), "truncated");
    EXPECT_STREQ(toString(DecodeStatus::Malformed), "malformed");
}
