#include <gtest/gtest.h>
#include <ssh/line_splitter.hpp>

TEST(LineSplitter, SplitsAcrossChunks) {
    LineSplitter s;
    std::string line;

    s.feed("Export");
    EXPECT_FALSE(s.next(line));
    s.feed("ing vm1\nDo");
    ASSERT_TRUE(s.next(line));
    EXPECT_EQ(line, "Exporting vm1");
    EXPECT_FALSE(s.next(line));
    s.feed("ne\n");
    ASSERT_TRUE(s.next(line));
    EXPECT_EQ(line, "Done");
    EXPECT_TRUE(s.empty());
}

TEST(LineSplitter, ManyLinesInOneChunk) {
    LineSplitter s;
    std::string line;
    s.feed("a\nb\n\nc\n");
    std::vector<std::string> got;
    while (s.next(line)) got.push_back(line);
    ASSERT_EQ(got.size(), 4u);
    EXPECT_EQ(got[0], "a");
    EXPECT_EQ(got[1], "b");
    EXPECT_EQ(got[2], "");
    EXPECT_EQ(got[3], "c");
}

TEST(LineSplitter, StripsCarriageReturn) {
    LineSplitter s;
    std::string line;
    s.feed("progress 50%\r\n");
    ASSERT_TRUE(s.next(line));
    EXPECT_EQ(line, "progress 50%");
}

TEST(LineSplitter, FlushReturnsUnterminatedTail) {
    LineSplitter s;
    std::string line;
    s.feed("first\nlast without newline");
    ASSERT_TRUE(s.flush(line));
    EXPECT_EQ(line, "first");
    ASSERT_TRUE(s.flush(line));
    EXPECT_EQ(line, "last without newline");
    EXPECT_FALSE(s.flush(line));
    EXPECT_TRUE(s.empty());
}

TEST(LineSplitter, OverlongLineIsCut) {
    LineSplitter s(4);
    std::string line;
    s.feed("abcdefghij\n");
    ASSERT_TRUE(s.next(line));
    EXPECT_EQ(line, "abcd");
    ASSERT_TRUE(s.next(line));
    EXPECT_EQ(line, "efgh");
    ASSERT_TRUE(s.next(line));
    EXPECT_EQ(line, "ij");
    EXPECT_FALSE(s.next(line));
}

TEST(LineSplitter, OverlongWithoutNewline) {
    LineSplitter s(4);
    std::string line;
    s.feed("abcdef");
    ASSERT_TRUE(s.next(line));
    EXPECT_EQ(line, "abcd");
    EXPECT_FALSE(s.next(line));
    ASSERT_TRUE(s.flush(line));
    EXPECT_EQ(line, "ef");
}

TEST(LineSplitter, LongStreamStaysCorrect) {
    LineSplitter s;
    std::string line;
    int count = 0;
    for (int i = 0; i < 1000; i++) {
        s.feed("line " + std::to_string(i) + "\n");
        while (s.next(line)) {
            EXPECT_EQ(line, "line " + std::to_string(count));
            count++;
        }
    }
    EXPECT_EQ(count, 1000);
}
