#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "input_resolver.h"
#include "seq_exception.h"
#include "test_images.h"

using GIFSeq::InputException;
using std::string, std::vector;

class InputResolverTest : public ::testing::Test {
  protected:
    void
    SetUp() override {
        for (const auto* name : {"frame1.png", "frame2.png", "frame3.png", "other.txt", "intro.webp"}) {
            m_dir.touch(name);
        }
    }

    [[nodiscard]] string
    pattern(const string& base) const {
        return m_dir.path().string() + "/" + base;
    }

    TestSupport::TempDir m_dir;
};

TEST_F(InputResolverTest, AllowedExtensions) {
    EXPECT_TRUE(GIFSeq::isAllowedImage("a.png"));
    EXPECT_TRUE(GIFSeq::isAllowedImage("dir/a.webp"));
    EXPECT_TRUE(GIFSeq::isAllowedImage("A.PNG"));
    EXPECT_FALSE(GIFSeq::isAllowedImage("a.txt"));
    EXPECT_FALSE(GIFSeq::isAllowedImage("png"));
    EXPECT_FALSE(GIFSeq::isAllowedImage("dir.png/file"));
}

TEST_F(InputResolverTest, RegularExpressionMatchesInOrder) {
    const auto files = GIFSeq::expandInputPattern(pattern(R"(frame[0-9]+\.png)"));
    EXPECT_EQ(files, (vector<string>{m_dir.file("frame1.png"), m_dir.file("frame2.png"), m_dir.file("frame3.png")}));
}

TEST_F(InputResolverTest, GlobSkipsOtherExtensions) {
    EXPECT_EQ(GIFSeq::expandInputPattern(pattern("*")),
              (vector<string>{m_dir.file("frame1.png"),
                              m_dir.file("frame2.png"),
                              m_dir.file("frame3.png"),
                              m_dir.file("intro.webp")}));
    EXPECT_EQ(GIFSeq::expandInputPattern(pattern("frame?.png")).size(), 3u);
}

TEST_F(InputResolverTest, LiteralName) {
    EXPECT_EQ(GIFSeq::expandInputPattern(pattern("frame2.png")), vector<string>{m_dir.file("frame2.png")});
}

TEST_F(InputResolverTest, UppercaseExtensionIsAccepted) {
    m_dir.touch("SHOT.PNG");
    EXPECT_EQ(GIFSeq::expandInputPattern(pattern("SHOT*")), vector<string>{m_dir.file("SHOT.PNG")});
}

TEST_F(InputResolverTest, Failures) {
    EXPECT_THROW(GIFSeq::expandInputPattern(pattern("missing_dir/*.png")), InputException);
    EXPECT_THROW(GIFSeq::expandInputPattern(pattern("nothing*.png")), InputException);
    EXPECT_THROW(GIFSeq::expandInputPattern(pattern("other.txt")), InputException);
    EXPECT_THROW(GIFSeq::expandInputPattern(pattern("frame[0-9")), InputException);
}

TEST_F(InputResolverTest, PatternsKeepTheirOrder) {
    const auto files = GIFSeq::expandInputPatterns({pattern("intro.webp"), pattern("frame*.png")});
    EXPECT_EQ(files,
              (vector<string>{m_dir.file("intro.webp"),
                              m_dir.file("frame1.png"),
                              m_dir.file("frame2.png"),
                              m_dir.file("frame3.png")}));
}

TEST_F(InputResolverTest, Validation) {
    EXPECT_THROW(GIFSeq::validateInputFiles({}), InputException);
    EXPECT_THROW(GIFSeq::validateInputFiles({m_dir.file("other.txt")}), InputException);
    EXPECT_THROW(GIFSeq::validateInputFiles({m_dir.file("frame1.png"), m_dir.file("frame9.png")}), InputException);
    EXPECT_NO_THROW(GIFSeq::validateInputFiles({m_dir.file("frame1.png"), m_dir.file("intro.webp")}));
}
