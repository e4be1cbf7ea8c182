#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

#include "progress.h"

using GIFSeq::ProgressChannel;
using GIFSeq::ProgressEvent;
using GIFSeq::Stage;
using std::string;

static ProgressEvent
sampling(const string& name, const uint32_t processed, const uint32_t total) {
    return {.stage = Stage::Sampling, .currentItemName = name, .processedCount = processed, .totalCount = total};
}

static ProgressEvent
done(const string& output, const std::vector<string>& files) {
    const auto total = static_cast<uint32_t>(files.size());
    return {.stage           = Stage::Done,
            .currentItemName = output,
            .processedCount  = total,
            .totalCount      = total,
            .finalOutputPath = output,
            .processedFiles  = files};
}

TEST(ProgressChannel, DropsOldestWhenFull) {
    ProgressChannel channel(2);
    channel.publish(sampling("a", 0, 3));
    channel.publish(sampling("b", 1, 3));
    channel.publish(sampling("c", 2, 3));
    EXPECT_EQ(channel.getDroppedCount(), 1u);
    channel.close();

    EXPECT_EQ(channel.receive()->currentItemName, "b");
    EXPECT_EQ(channel.receive()->currentItemName, "c");
    EXPECT_FALSE(channel.receive().has_value());
}

TEST(ProgressChannel, TerminalEventIsKept) {
    ProgressChannel channel(1);
    channel.publish(sampling("a", 0, 1));
    channel.publish(done("out.gif", {"a"}));
    channel.publish(sampling("late", 0, 1));
    EXPECT_EQ(channel.getDroppedCount(), 2u);

    const auto event = channel.receive();
    ASSERT_TRUE(event.has_value());
    EXPECT_TRUE(event->isFinal());
    EXPECT_EQ(event->finalOutputPath, "out.gif");
}

TEST(ProgressChannel, ClosedChannelIgnoresPublishAndDrains) {
    ProgressChannel channel;
    channel.publish(sampling("a", 0, 2));
    channel.close();
    EXPECT_TRUE(channel.isClosed());
    channel.publish(sampling("b", 1, 2));

    EXPECT_EQ(channel.receive()->currentItemName, "a");
    EXPECT_FALSE(channel.receive().has_value());
    EXPECT_FALSE(channel.receive().has_value());
}

TEST(Progress, ShortenPath) {
    EXPECT_EQ(GIFSeq::shortenPath("frames/a.png"), "frames/a.png");
    const string exact(50, 'x');
    EXPECT_EQ(GIFSeq::shortenPath(exact), exact);

    const string longPath = string(40, 'd') + "/" + string(30, 'f') + ".png";
    const auto shortened  = GIFSeq::shortenPath(longPath);
    EXPECT_EQ(shortened.size(), 50u);
    EXPECT_EQ(shortened, "..." + longPath.substr(longPath.size() - 47));
}

TEST(Progress, ProgressBar) {
    EXPECT_EQ(GIFSeq::renderProgressBar(sampling("a", 5, 10), 10), "[#####-----]");
    EXPECT_EQ(GIFSeq::renderProgressBar(sampling("a", 0, 10), 4), "[----]");
    EXPECT_EQ(GIFSeq::renderProgressBar(sampling("a", 10, 10), 4), "[####]");
    EXPECT_EQ(GIFSeq::renderProgressBar(sampling("a", 0, 0), 4), "[####]");
}

TEST(ConsolePresenter, PrintsSummary) {
    ProgressChannel channel;
    std::ostringstream out;
    GIFSeq::ConsolePresenter presenter(channel, out, false);
    presenter.start();
    channel.publish(sampling("a.png", 0, 3));
    channel.publish(sampling("b.png", 1, 3));
    channel.publish(sampling("c.png", 2, 3));
    channel.publish(done("result/out.gif", {"a.png", "b.png", "c.png"}));
    ASSERT_TRUE(presenter.wait());

    const auto text = out.str();
    EXPECT_NE(text.find("Sampling"), string::npos);
    EXPECT_NE(text.find("Done! Processed 3 files."), string::npos);
    EXPECT_NE(text.find("GIF file generated at: result/out.gif"), string::npos);
    EXPECT_EQ(text.find("Processed files:"), string::npos);
    EXPECT_EQ(presenter.getProcessedFiles(), (std::vector<string>{"a.png", "b.png", "c.png"}));
}

TEST(ConsolePresenter, DebugListsFiles) {
    ProgressChannel channel;
    std::ostringstream out;
    GIFSeq::ConsolePresenter presenter(channel, out, true);
    presenter.start();
    channel.publish(sampling("a.png", 0, 2));
    channel.publish(sampling("b.png", 1, 2));
    channel.publish({.stage = Stage::Writing, .currentItemName = "out.gif", .processedCount = 2, .totalCount = 2});
    channel.publish(done("out.gif", {"a.png", "b.png"}));
    ASSERT_TRUE(presenter.wait());

    const auto text = out.str();
    EXPECT_NE(text.find("[Sampling] 0/2 a.png"), string::npos);
    EXPECT_NE(text.find("[Writing] 2/2 out.gif"), string::npos);
    EXPECT_NE(text.find("Processed files:"), string::npos);
    EXPECT_NE(text.find("1. a.png"), string::npos);
    EXPECT_NE(text.find("2. b.png"), string::npos);
}

TEST(ConsolePresenter, DebugListIsCompleteWhenEventsWereDropped) {
    ProgressChannel channel(2);
    std::vector<string> files;
    for (uint32_t i = 0; i < 10; ++i) {
        files.push_back("f" + std::to_string(i) + ".png");
        channel.publish(sampling(files.back(), i, 10));
    }
    channel.publish(done("out.gif", files));
    EXPECT_GT(channel.getDroppedCount(), 0u);

    std::ostringstream out;
    GIFSeq::ConsolePresenter presenter(channel, out, true);
    presenter.start();
    ASSERT_TRUE(presenter.wait());

    EXPECT_EQ(presenter.getProcessedFiles(), files);
    const auto text = out.str();
    EXPECT_NE(text.find(" 1. f0.png"), string::npos);
    EXPECT_NE(text.find("10. f9.png"), string::npos);
}

TEST(ConsolePresenter, StopsWhenClosedWithoutResult) {
    ProgressChannel channel;
    std::ostringstream out;
    GIFSeq::ConsolePresenter presenter(channel, out, false);
    presenter.start();
    channel.publish(sampling("a.png", 0, 2));
    channel.close();
    EXPECT_FALSE(presenter.wait());
    EXPECT_EQ(out.str().find("Done!"), string::npos);
}
