#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <set>

TEST(Utils, ShellQuote) {
    EXPECT_EQ(shell_quote("/root/run.py"), "'/root/run.py'");
    EXPECT_EQ(shell_quote("a b"), "'a b'");
    EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
    EXPECT_EQ(shell_quote(""), "''");
}

TEST(Utils, RemoteJoin) {
    EXPECT_EQ(remote_join("/root", "a.py"), "/root/a.py");
    EXPECT_EQ(remote_join("/root/", "a.py"), "/root/a.py");
    EXPECT_EQ(remote_join("", "a.py"), "a.py");
}

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("2222"), 2222);
    EXPECT_EQ(safe_stoi("abc", -1), -1);
    EXPECT_EQ(safe_stoi("99999999999999", -1), -1);
}

TEST(Utils, UuidFormat) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; i++) {
        std::string id = generate_uuid();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[8], '-');
        EXPECT_EQ(id[13], '-');
        EXPECT_EQ(id[14], '4');
        EXPECT_EQ(id[18], '-');
        EXPECT_NE(std::string("89ab").find(id[19]), std::string::npos);
        EXPECT_EQ(id[23], '-');
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 100u);
}

TEST(Utils, Trim) {
    std::string s = "  kvm \n";
    trim(s);
    EXPECT_EQ(s, "kvm");
    std::string blank = " \t ";
    trim(blank);
    EXPECT_TRUE(blank.empty());
}
