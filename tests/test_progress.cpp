#include <gtest/gtest.h>

#include "progress.hpp"

using namespace std;

TEST(Progress, ReportsToReceiver)
{
    vector<ParseProgress> aReports;
    const ProgressReporter progress([&aReports](const ParseProgress& p) { aReports.push_back(p); });
    ASSERT_TRUE(progress);

    progress.report(25, 100, "Indexing");
    ASSERT_EQ(aReports.size(), 1u);
    EXPECT_EQ(aReports[0].current, 25);
    EXPECT_EQ(aReports[0].total, 100);
    EXPECT_EQ(aReports[0].stage, "Indexing");
}

TEST(Progress, WithoutReceiverNothingHappens)
{
    const ProgressReporter progress;
    EXPECT_FALSE(progress);
    EXPECT_NO_THROW(progress.report(1, 2, "ignored"));
    EXPECT_FALSE(progress.scaled(0, 50, "x"));
    EXPECT_FALSE(progress.callback());
}

TEST(Progress, ReceiverErrorsAreContained)
{
    size_t nCalls = 0;
    const ProgressReporter progress([&nCalls](const ParseProgress&) {
        ++nCalls;
        throw runtime_error("display gone");
    });

    EXPECT_NO_THROW(progress.report(1, 100, "a"));
    EXPECT_NO_THROW(progress.report(2, 100, "b"));
    EXPECT_EQ(nCalls, 2u);
}

TEST(Progress, ScaledReporterMapsIntoRange)
{
    vector<ParseProgress> aReports;
    const ProgressReporter progress([&aReports](const ParseProgress& p) { aReports.push_back(p); });

    const ProgressReporter sub = progress.scaled(10, 50, "Index: ");
    sub.report(0, 100, "start");
    sub.report(50, 100, "half");
    sub.report(4, 4, "done");

    ASSERT_EQ(aReports.size(), 3u);
    EXPECT_DOUBLE_EQ(aReports[0].current, 10);
    EXPECT_DOUBLE_EQ(aReports[1].current, 30);
    EXPECT_DOUBLE_EQ(aReports[2].current, 50);
    EXPECT_DOUBLE_EQ(aReports[2].total, 100);
    EXPECT_EQ(aReports[1].stage, "Index: half");
}

TEST(Progress, CallbackForwards)
{
    vector<string> aStages;
    const ProgressReporter progress([&aStages](const ParseProgress& p) { aStages.push_back(p.stage); });

    const ProgressCallback onProgress = progress.scaled(0, 10, "sub ").callback();
    ASSERT_TRUE(onProgress);
    onProgress(ParseProgress{1, 2, "step"});
    ASSERT_EQ(aStages.size(), 1u);
    EXPECT_EQ(aStages[0], "sub step");
}
