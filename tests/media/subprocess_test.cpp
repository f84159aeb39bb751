#include "relay/media/subprocess.hpp"

#include <gtest/gtest.h>

TEST(SubprocessTest, SplitsStdoutIntoLines) {
    std::vector<std::string> lines;
    auto outcome = relay::media::run_process({"sh", "-c", "printf 'one\\ntwo\\nthree'; echo oops >&2; exit 3"},
                                             [&lines](const std::string& line) {
                                                 lines.push_back(line);
                                                 return line != "two";
                                             });

    ASSERT_TRUE(outcome.is_ok()) << outcome.error();
    EXPECT_EQ(outcome.value().exit_code, 3);
    EXPECT_EQ(lines, (std::vector<std::string>{"one", "two", "three"}));
    EXPECT_EQ(outcome.value().stdout_text, "two\n");
    EXPECT_EQ(outcome.value().stderr_text, "oops\n");
}

TEST(SubprocessTest, EmptyCommandLineIsRejected) {
    auto outcome = relay::media::run_process({});
    ASSERT_TRUE(outcome.is_error());
}

TEST(SubprocessTest, MissingExecutableIsError) {
    auto outcome = relay::media::run_process({"/nonexistent/relay-test-binary"});
    ASSERT_TRUE(outcome.is_error());
    EXPECT_FALSE(outcome.error().empty());
}
