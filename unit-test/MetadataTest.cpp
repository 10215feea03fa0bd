#include <signal.h>
#include <unistd.h>
#include <filesystem>
#include <fstream>
#include "gtest/gtest.h"
#include "runbox/metadata.hpp"

using namespace std;
using namespace runbox;
namespace fs = std::filesystem;

class MetadataTest : public ::testing::Test {
protected:
    void SetUp() override {
        metafile = fs::path(::testing::TempDir()) / ("runbox-meta-" + to_string(getpid()));
    }

    void TearDown() override {
        fs::remove(metafile);
    }

    fs::path metafile;
};

static resource_usage sample_usage() {
    resource_usage usage;
    usage.user_time = 0.25;
    usage.system_time = 0.125;
    usage.wall_time = 1.5;
    usage.peak_memory = 4 << 20;
    return usage;
}

TEST_F(MetadataTest, SuccessFields) {
    sandbox_result result(sandbox_status::success(3), sample_usage(), "full-isolation", false);
    write_metadata(metafile, result);

    auto meta = read_metadata(metafile);
    EXPECT_EQ(meta["status"], "success");
    EXPECT_EQ(meta["exitcode"], "3");
    EXPECT_EQ(meta.count("signal"), 0u);
    EXPECT_EQ(meta["wall-time"], "1.500");
    EXPECT_EQ(meta["user-time"], "0.250");
    EXPECT_EQ(meta["sys-time"], "0.125");
    EXPECT_EQ(meta["cpu-time"], "0.375");
    EXPECT_EQ(meta["memory-bytes"], to_string(4 << 20));
    EXPECT_EQ(meta["strategy"], "full-isolation");
    EXPECT_EQ(meta["reduced-guarantees"], "0");
    EXPECT_EQ(meta["cancelled"], "0");
}

TEST_F(MetadataTest, SignaledRoundTrip) {
    sandbox_result result(sandbox_status::signaled(SIGKILL), sample_usage(), "degraded-supervision", true, true);
    write_metadata(metafile, result);

    sandbox_result read = read_result_metadata(metafile);
    EXPECT_EQ(read.status(), sandbox_status::signaled(SIGKILL));
    EXPECT_EQ(read.usage(), sample_usage());
    EXPECT_EQ(read.strategy(), "degraded-supervision");
    EXPECT_TRUE(read.reduced_guarantees());
    EXPECT_TRUE(read.cancelled());
}

TEST_F(MetadataTest, LimitExceededRoundTrip) {
    sandbox_result result(sandbox_status::limit_exceeded(limit_kind::wall_time), sample_usage(), "full-isolation", false);
    write_metadata(metafile, result);

    EXPECT_EQ(read_metadata(metafile)["limit"], "wall-time");
    EXPECT_EQ(read_result_metadata(metafile).status(), sandbox_status::limit_exceeded(limit_kind::wall_time));
}

TEST_F(MetadataTest, InternalErrorKeepsMessage) {
    sandbox_result result(sandbox_status::internal(internal_error_kind::monitor_failed), sample_usage(),
                          "full-isolation", false, false, "unable to read /proc: No such file");
    write_metadata(metafile, result);

    EXPECT_EQ(read_metadata(metafile)["internal-error"], "monitor-failed: unable to read /proc: No such file");
    sandbox_result read = read_result_metadata(metafile);
    EXPECT_EQ(read.status(), sandbox_status::internal(internal_error_kind::monitor_failed));
    EXPECT_EQ(read.message(), "unable to read /proc: No such file");
}

TEST_F(MetadataTest, MissingStatusIsRejected) {
    ofstream(metafile) << "wall-time: 1.000\n";
    EXPECT_THROW(read_result_metadata(metafile), invalid_argument);

    ofstream(metafile) << "status: exploded\n";
    EXPECT_THROW(read_result_metadata(metafile), invalid_argument);
}
