#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <boost/json.hpp>
#include "keyprobe/config.hpp"
#include "keyprobe/console.hpp"
#include "keyprobe/error.hpp"
#include "keyprobe/logging.hpp"
#include "keyprobe/metrics.hpp"
#include "keyprobe/search.hpp"

using namespace keyprobe;
using ::testing::_;
using ::testing::Invoke;
using ::testing::Return;

namespace fs = std::filesystem;

class MockChecksumLookup : public LookupClient {
public:
    MOCK_METHOD(LookupResult, submit, (const std::string&), (override));
};

namespace {

LookupResult keyed(const std::string& key) {
    LookupResponse response;
    response.key = key;
    response.payload = boost::json::object{{"key", key}};
    return response;
}

LookupResult unkeyed() {
    LookupResponse response;
    response.payload = boost::json::object{{"status", "unknown"}};
    return response;
}

} // namespace

class RunSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("keyprobe_search_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::create_directories(dir_);
        report_path_ = (dir_ / "report.txt").string();
        failed_path_ = (dir_ / "failed.txt").string();
        config_ = default_config();
        lookup_ = std::make_shared<::testing::StrictMock<MockChecksumLookup>>();
        Metrics::getInstance().reset();
    }

    void TearDown() override {
        Logger::getInstance().set_level(LogLevel::OFF);
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void write_file(const std::string& path, const std::string& text) {
        std::ofstream out(path, std::ios::binary);
        out << text;
    }

    std::string read_file(const std::string& path) const {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    Outcome run() {
        return run_search(config_, report_path_, lookup_, reporter_);
    }

    fs::path dir_;
    std::string report_path_;
    std::string failed_path_;
    Config config_;
    std::shared_ptr<::testing::StrictMock<MockChecksumLookup>> lookup_;
    std::ostringstream out_;
    ConsoleReporter reporter_{out_};
};

TEST_F(RunSearchTest, StopsAtFirstMatch) {
    write_file(report_path_, "a.txt,AAA\nb.txt,BBB\nc.txt,CCC\n");

    EXPECT_CALL(*lookup_, submit("AAA")).Times(2).WillRepeatedly(Return(unkeyed()));
    EXPECT_CALL(*lookup_, submit("BBB")).Times(2).WillRepeatedly(Return(keyed("X")));
    EXPECT_CALL(*lookup_, submit("CCC")).Times(0);

    Outcome outcome = run();

    EXPECT_TRUE(outcome.matched());
    EXPECT_EQ(outcome.checksum, "BBB");
    EXPECT_EQ(outcome.processed, 1u);
    EXPECT_EQ(outcome.total, 3u);

    ASSERT_TRUE(fs::exists(failed_path_));
    EXPECT_EQ(read_file(failed_path_), "");

    std::string text = out_.str();
    EXPECT_NE(text.find("Found 3 checksums to process."), std::string::npos);
    EXPECT_NE(text.find("Checksum: BBB\n"), std::string::npos);
    EXPECT_NE(text.find(R"(Result: {"key":"X"})"), std::string::npos);
}

TEST_F(RunSearchTest, ExhaustsWithoutMatch) {
    write_file(report_path_, "a.txt,AAA\nb.txt,BBB\nc.txt,CCC\n");

    EXPECT_CALL(*lookup_, submit("AAA")).Times(2).WillRepeatedly(Return(unkeyed()));
    EXPECT_CALL(*lookup_, submit("BBB")).WillOnce(Return(keyed("X"))).WillOnce(Return(keyed("Y")));
    EXPECT_CALL(*lookup_, submit("CCC")).Times(2).WillRepeatedly(Return(keyed("")));

    Outcome outcome = run();

    EXPECT_FALSE(outcome.matched());
    EXPECT_EQ(outcome.processed, 3u);
    EXPECT_EQ(read_file(failed_path_), "");

    std::string text = out_.str();
    EXPECT_NE(text.find("Progress: 3/3 checksums checked (100.00%)\n"), std::string::npos);
    EXPECT_NE(text.find("Search complete. No matching key was found."), std::string::npos);
}

TEST_F(RunSearchTest, RecordsEveryFailedChecksum) {
    write_file(report_path_, "a.txt,AAA\nb.txt,BBB\nc.txt,CCC\n");

    EXPECT_CALL(*lookup_, submit("AAA")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*lookup_, submit("BBB")).WillOnce(Return(unkeyed())).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*lookup_, submit("CCC")).WillOnce(Return(std::nullopt));

    Outcome outcome = run();

    EXPECT_FALSE(outcome.matched());
    EXPECT_EQ(outcome.processed, 3u);
    EXPECT_EQ(read_file(failed_path_), "AAA\nBBB\nCCC\n");
    EXPECT_EQ(Metrics::getInstance().counter(METRIC_TOKENS_PROCESSED), 3);
}

TEST_F(RunSearchTest, AppendsToExistingFailureLog) {
    write_file(report_path_, "a.txt,AAA\n");
    write_file(failed_path_, "OLD\n");

    EXPECT_CALL(*lookup_, submit("AAA")).WillOnce(Return(std::nullopt));

    run();

    EXPECT_EQ(read_file(failed_path_), "OLD\nAAA\n");
}

TEST_F(RunSearchTest, UsesConfiguredFailureLogName) {
    config_.failed_log = "misses.log";
    write_file(report_path_, "a.txt,AAA\n");

    EXPECT_CALL(*lookup_, submit("AAA")).WillOnce(Return(std::nullopt));

    run();

    std::string custom_path = (dir_ / "misses.log").string();
    EXPECT_EQ(read_file(custom_path), "AAA\n");
    EXPECT_FALSE(fs::exists(failed_path_));
    EXPECT_NE(out_.str().find("'" + custom_path + "'"), std::string::npos);
}

TEST_F(RunSearchTest, MissingReportCreatesNoFailureLog) {
    EXPECT_CALL(*lookup_, submit(_)).Times(0);

    EXPECT_THROW(run(), FileNotFoundError);

    EXPECT_FALSE(fs::exists(failed_path_));
}

TEST_F(RunSearchTest, EmptyReportEndsQuietly) {
    write_file(report_path_, "no separator here\n\na,b,c\n");

    EXPECT_CALL(*lookup_, submit(_)).Times(0);

    Outcome outcome = run();

    EXPECT_FALSE(outcome.matched());
    EXPECT_EQ(outcome.total, 0u);
    EXPECT_EQ(outcome.processed, 0u);

    std::string text = out_.str();
    EXPECT_NE(text.find("No checksums found in the specified file."), std::string::npos);
    EXPECT_EQ(text.find("Starting search..."), std::string::npos);
    EXPECT_EQ(text.find("Total Execution Time"), std::string::npos);
}

TEST_F(RunSearchTest, LogLinesStartBelowProgressLine) {
    Logger::getInstance().set_level(LogLevel::ERROR);
    write_file(report_path_, "a.txt,AAA\nb.txt,BBB\n");

    EXPECT_CALL(*lookup_, submit("AAA")).WillOnce(Return(std::nullopt));
    EXPECT_CALL(*lookup_, submit("BBB")).WillOnce(Invoke([](const std::string&) -> LookupResult {
        LOG_ERROR("lookup service unreachable");
        return std::nullopt;
    }));

    run();

    EXPECT_NE(out_.str().find("(50.00%)\n\rProgress: 2/2"), std::string::npos);

    // Hook is removed once the run returns
    std::string before = out_.str();
    reporter_.progress(1, 1);
    LOG_ERROR("after the run");
    EXPECT_EQ(out_.str(), before + "\rProgress: 1/1 checksums checked (100.00%)");
}
