// test_golden_gtest.cpp - Golden regression harness: catalog, stages and summary

#include <gtest/gtest.h>
#include "../deck/golden.hpp"
#include "../lib/file.h"
#include <cstdio>

using namespace deck;

static const char* FIXTURE =
    "<deck><canvas width=\"300\" height=\"200\"/><slide><rect xp=\"50\" yp=\"50\" wp=\"20\" hp=\"20\" color=\"red\"/></slide></deck>";

static const char* CATALOG =
    "{\n"
    "  \"version\": \"1.0\",\n"
    "  \"description\": \"unit catalog\",\n"
    "  \"total_tests\": 3,\n"
    "  \"test_cases\": [\n"
    "    { \"name\": \"rect\", \"category\": \"shapes\", \"input\": { \"dsh\": \"shapes/rect.dsh\" },\n"
    "      \"outputs\": { \"xml\": \"shapes/rect.xml\", \"svg\": \"shapes/rect.svg\" } },\n"
    "    { \"name\": \"changed\", \"category\": \"shapes\", \"input\": { \"dsh\": \"shapes/changed.dsh\" },\n"
    "      \"outputs\": { \"xml\": \"shapes/changed.xml\", \"svg\": \"shapes/changed.svg\" } },\n"
    "    { \"name\": \"absent\", \"category\": \"text\", \"input\": { \"dsh\": \"text/absent.dsh\" },\n"
    "      \"outputs\": { \"svg\": \"text/absent.svg\" } }\n"
    "  ]\n"
    "}\n";

class GoldenTest : public ::testing::Test {
protected:
    FontResolver fonts;
    PassthroughCompiler compiler;
    Pipeline pipeline{ &fonts, &compiler };
    char dir[64];

    void SetUp() override {
        snprintf(dir, sizeof(dir), "/tmp/deck-golden-XXXXXX");
        ASSERT_NE(mkdtemp(dir), nullptr);
        ASSERT_TRUE(create_dir(path("input/shapes").c_str()));
        ASSERT_TRUE(create_dir(path("expected/shapes").c_str()));
        ASSERT_TRUE(write_text_file(path("golden_tests.json").c_str(), CATALOG));
        ASSERT_TRUE(write_text_file(path("input/shapes/rect.dsh").c_str(), FIXTURE));
        ASSERT_TRUE(write_text_file(path("input/shapes/changed.dsh").c_str(), FIXTURE));

        // references produced by the current renderer, one of them altered
        std::string svg;
        DeckError err;
        ASSERT_EQ(pipeline.render_xml(FIXTURE, "svg", RenderOptions(), &svg, &err), DECK_OK);
        ASSERT_TRUE(write_text_file(path("expected/shapes/rect.xml").c_str(), FIXTURE));
        ASSERT_TRUE(write_text_file(path("expected/shapes/rect.svg").c_str(), svg.c_str()));
        ASSERT_TRUE(write_text_file(path("expected/shapes/changed.xml").c_str(), FIXTURE));
        std::string altered = svg;
        altered[40] = altered[40] == 'x' ? 'y' : 'x';
        ASSERT_TRUE(write_text_file(path("expected/shapes/changed.svg").c_str(), altered.c_str()));
    }

    void TearDown() override {
        remove_dir(dir);
    }

    std::string path(const char* relative) { return std::string(dir) + "/" + relative; }
};

TEST(MismatchTest, Describe) {
    EXPECT_EQ(describe_mismatch("abc", "abc"), "");
    EXPECT_EQ(describe_mismatch("abcd", "abXd"), "size 4, expected 4, first difference at byte 2");
    EXPECT_EQ(describe_mismatch("ab", "abc"), "size 2, expected 3, first difference at byte 2");
}

TEST(CatalogTest, MalformedAndMissing) {
    GoldenCatalog catalog;
    std::string error;
    EXPECT_FALSE(load_golden_catalog("/nonexistent/golden_tests.json", &catalog, &error));
    EXPECT_NE(error.find("cannot read"), std::string::npos);
}

TEST_F(GoldenTest, LoadsCatalog) {
    GoldenRunner runner(&pipeline, dir);
    std::string error;
    ASSERT_TRUE(runner.load(&error)) << error;
    const GoldenCatalog& catalog = runner.catalog();
    EXPECT_EQ(catalog.version, "1.0");
    EXPECT_EQ(catalog.total_tests, 3);
    ASSERT_EQ(catalog.cases.size(), 3u);
    EXPECT_EQ(catalog.cases[0].dsh, "shapes/rect.dsh");
    EXPECT_EQ(catalog.cases[0].outputs.at("svg"), "shapes/rect.svg");
    EXPECT_EQ(catalog.cases[2].category, "text");
}

TEST_F(GoldenTest, BadJsonIsReported) {
    ASSERT_TRUE(write_text_file(path("golden_tests.json").c_str(), "{ \"test_cases\": [ "));
    GoldenRunner runner(&pipeline, dir);
    std::string error;
    EXPECT_FALSE(runner.load(&error));
    EXPECT_NE(error.find("malformed"), std::string::npos);
}

TEST_F(GoldenTest, MatchingCasePasses) {
    GoldenRunner runner(&pipeline, dir);
    std::string error;
    ASSERT_TRUE(runner.load(&error));
    CaseResult result = runner.run_case(runner.catalog().cases[0]);
    EXPECT_FALSE(result.skipped);
    EXPECT_FALSE(result.failed());
    ASSERT_NE(result.stage("xml"), nullptr);
    EXPECT_EQ(result.stage("xml")->outcome, OUTCOME_PASSED);
    EXPECT_EQ(result.stage("svg")->outcome, OUTCOME_PASSED);
    // no reference listed for these
    EXPECT_EQ(result.stage("png")->outcome, OUTCOME_SKIPPED);
    EXPECT_EQ(result.stage("pdf")->outcome, OUTCOME_SKIPPED);
    // generated artifacts mirror the input tree
    EXPECT_TRUE(file_exists(path("output/shapes/rect.xml").c_str()));
    EXPECT_TRUE(file_exists(path("output/shapes/rect.svg").c_str()));
    EXPECT_TRUE(file_exists(path("output/shapes/rect.png").c_str()));
}

TEST_F(GoldenTest, ChangedOutputFails) {
    GoldenRunner runner(&pipeline, dir);
    std::string error;
    ASSERT_TRUE(runner.load(&error));
    CaseResult result = runner.run_case(runner.catalog().cases[1]);
    EXPECT_TRUE(result.failed());
    EXPECT_EQ(result.stage("xml")->outcome, OUTCOME_PASSED);
    const StageResult* svg = result.stage("svg");
    ASSERT_NE(svg, nullptr);
    EXPECT_EQ(svg->outcome, OUTCOME_FAILED);
    EXPECT_NE(svg->detail.find("first difference at byte 40"), std::string::npos);
    EXPECT_NE(svg->detail.find("output/shapes/changed.svg"), std::string::npos);
}

TEST_F(GoldenTest, MissingFixtureIsSkipped) {
    GoldenRunner runner(&pipeline, dir);
    std::string error;
    ASSERT_TRUE(runner.load(&error));
    CaseResult result = runner.run_case(runner.catalog().cases[2]);
    EXPECT_TRUE(result.skipped);
    EXPECT_FALSE(result.failed());
    EXPECT_NE(result.skip_reason.find("text/absent.dsh"), std::string::npos);
}

TEST_F(GoldenTest, MissingReferenceIsSkipped) {
    ASSERT_EQ(remove(path("expected/shapes/rect.svg").c_str()), 0);
    GoldenRunner runner(&pipeline, dir);
    std::string error;
    ASSERT_TRUE(runner.load(&error));
    CaseResult result = runner.run_case(runner.catalog().cases[0]);
    EXPECT_FALSE(result.failed());
    EXPECT_EQ(result.stage("svg")->outcome, OUTCOME_SKIPPED);
}

TEST_F(GoldenTest, SummaryCounts) {
    GoldenRunner runner(&pipeline, dir);
    std::string error;
    ASSERT_TRUE(runner.load(&error));
    GoldenSummary summary = runner.run_all();
    EXPECT_EQ(summary.total, 3);
    EXPECT_EQ(summary.passed, 1);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_EQ(summary.skipped, 1);
    EXPECT_EQ(summary.stages["xml"].passed, 2);
    EXPECT_EQ(summary.stages["svg"].passed, 1);
    EXPECT_EQ(summary.stages["svg"].failed, 1);

    std::string report = summary.format("Results Summary:");
    EXPECT_NE(report.find("Overall: 1 passed, 1 failed, 1 skipped"), std::string::npos);
    EXPECT_NE(report.find("svg pipeline: 1 passed, 1 failed, 0 skipped"), std::string::npos);
    EXPECT_NE(report.find("pdf pipeline: 0 passed, 0 failed, 2 skipped"), std::string::npos);
}

TEST_F(GoldenTest, CategoryFilter) {
    GoldenRunner runner(&pipeline, dir);
    std::string error;
    ASSERT_TRUE(runner.load(&error));
    EXPECT_EQ(runner.run_all("text").total, 1);
    EXPECT_EQ(runner.run_all("shapes").total, 2);
    EXPECT_EQ(runner.run_all("nothing").total, 0);
}

TEST_F(GoldenTest, CleanupRemovesOutput) {
    GoldenRunner runner(&pipeline, dir);
    std::string error;
    ASSERT_TRUE(runner.load(&error));
    runner.run_all();
    EXPECT_TRUE(dir_exists(path("output").c_str()));
    EXPECT_TRUE(runner.cleanup());
    EXPECT_FALSE(dir_exists(path("output").c_str()));
    EXPECT_TRUE(runner.cleanup());
}
