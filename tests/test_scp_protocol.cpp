#include <gtest/gtest.h>
#include <ssh/scp_protocol.hpp>

TEST(ScpProtocol, BuildControlLine) {
    EXPECT_EQ(build_control_line({0644, 10000, "data.bin"}), "C0644 10000 data.bin\n");
}

TEST(ScpProtocol, BuildControlLinePadsMode) {
    EXPECT_EQ(build_control_line({0755, 0, "run.sh"}), "C0755 0 run.sh\n");
    EXPECT_EQ(build_control_line({0600, 1, "key"}), "C0600 1 key\n");
}

TEST(ScpProtocol, ParseControlLine) {
    auto r = parse_control_line("C0644 10000 data.bin");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.mode, 0644u);
    EXPECT_EQ(r.value.size, 10000u);
    EXPECT_EQ(r.value.name, "data.bin");
}

TEST(ScpProtocol, NameRunsToEndOfLine) {
    auto r = parse_control_line("C0600 12 run log.txt");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.mode, 0600u);
    EXPECT_EQ(r.value.size, 12u);
    EXPECT_EQ(r.value.name, "run log.txt");
}

TEST(ScpProtocol, ParseLargeSize) {
    auto r = parse_control_line("C0600 8589934592 big.img");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.size, 8589934592ull);
}

TEST(ScpProtocol, MalformedLineIsReportedVerbatim) {
    const char* bad[] = {
        "",
        "D0755 0 dir",
        "C0644 10000",
        "C 0644 10 x",
        "C0644\t10\tx",
        "C0644  10 x",
        "C0644 10  x",
        "C644 10 x",
        "C0644 10 ",
        "C0944 10 x",
        "C0644 -1 x",
        "C0644 12ab x",
        "C0644 10 ../etc",
        "C0644 10 a/b",
    };
    for (const char* line : bad) {
        auto r = parse_control_line(line);
        ASSERT_TRUE(r.is_err()) << line;
        EXPECT_EQ(r.kind, ErrorKind::TransferProtocol);
        EXPECT_EQ(r.error, line);
    }
}

TEST(ScpProtocol, Commands) {
    EXPECT_EQ(scp_sink_command("/tmp/data.bin"), "rm -f /tmp/data.bin ; scp -t /tmp/data.bin");
    EXPECT_EQ(scp_source_command("logs/cockroach.log"), "scp -qrf logs/cockroach.log");
}
