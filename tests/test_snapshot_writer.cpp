#include <filesystem>
#include <fstream>

#include <catch2/catch.hpp>
#include <opencv2/imgcodecs.hpp>

#include "logging_test_fixture.hpp"
#include "ipcam_player/snapshot_writer.hpp"

using namespace ipcam_player;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    ipcam_player::test::ensure_logger_initialized();
    return true;
}();

std::tm make_local_time(int year, int month, int day, int hour, int minute, int second) {
    std::tm local_time{};
    local_time.tm_year = year - 1900;
    local_time.tm_mon = month - 1;
    local_time.tm_mday = day;
    local_time.tm_hour = hour;
    local_time.tm_min = minute;
    local_time.tm_sec = second;
    return local_time;
}

LocalTimeSource fixed_time(std::tm local_time) {
    return [local_time]() { return local_time; };
}

std::filesystem::path fresh_directory(const std::string& name) {
    const auto directory = std::filesystem::temp_directory_path() / "ipcam_player_tests_snapshots" / name;
    std::filesystem::remove_all(directory);
    return directory;
}
}  // namespace

TEST_CASE("SnapshotWriter formats timestamps in 12-hour time") {
    REQUIRE(SnapshotWriter::format_timestamp(make_local_time(2024, 3, 7, 9, 5, 2)) == "03-07-2024_09-05-02AM");
    REQUIRE(SnapshotWriter::format_timestamp(make_local_time(2024, 12, 31, 23, 59, 59)) == "12-31-2024_11-59-59PM");
    REQUIRE(SnapshotWriter::format_timestamp(make_local_time(2024, 1, 1, 0, 0, 0)) == "01-01-2024_12-00-00AM");
    REQUIRE(SnapshotWriter::format_timestamp(make_local_time(2024, 1, 1, 12, 30, 0)) == "01-01-2024_12-30-00PM");
}

TEST_CASE("SnapshotWriter appends the timestamp before the extension") {
    const SnapshotWriter writer{fixed_time(make_local_time(2024, 3, 7, 14, 15, 16))};

    REQUIRE(writer.timestamped_path("captures/front.png") == std::filesystem::path{"captures/front_03-07-2024_02-15-16PM.png"});
    REQUIRE(writer.timestamped_path("captures/front.JPG") == std::filesystem::path{"captures/front_03-07-2024_02-15-16PM.jpg"});
    REQUIRE(writer.timestamped_path("front") == std::filesystem::path{"front_03-07-2024_02-15-16PM.png"});
    REQUIRE(writer.timestamped_path("front.tiff") == std::filesystem::path{"front_03-07-2024_02-15-16PM.png"});
}

TEST_CASE("SnapshotWriter reports a missing frame without writing") {
    const auto directory = fresh_directory("no_frame");
    const SnapshotWriter writer{fixed_time(make_local_time(2024, 3, 7, 9, 0, 0))};

    const SnapshotResult result = writer.save(cv::Mat{}, directory / "shot.png");

    REQUIRE_FALSE(result.ok());
    REQUIRE(result.error == SnapshotError::NoFrame);
    REQUIRE_FALSE(std::filesystem::exists(directory));
}

TEST_CASE("SnapshotWriter writes a decodable image of the rendered size") {
    const auto directory = fresh_directory("write");
    const SnapshotWriter writer{fixed_time(make_local_time(2024, 3, 7, 9, 0, 1))};
    const cv::Mat rendered(48, 64, CV_8UC3, cv::Scalar(10, 200, 30));

    const SnapshotResult result = writer.save(rendered, directory / "shot.png");

    REQUIRE(result.ok());
    REQUIRE(result.path == directory / "shot_03-07-2024_09-00-01AM.png");
    REQUIRE(std::filesystem::exists(result.path));

    const cv::Mat decoded = cv::imread(result.path.string(), cv::IMREAD_COLOR);
    REQUIRE(decoded.cols == 64);
    REQUIRE(decoded.rows == 48);
    REQUIRE(cv::norm(decoded, rendered, cv::NORM_INF) == 0.0);
}

TEST_CASE("SnapshotWriter reports write failures") {
    const auto directory = fresh_directory("blocked");
    std::filesystem::create_directories(directory);
    // A regular file where the snapshot directory should be.
    std::ofstream(directory / "taken") << "x";
    const SnapshotWriter writer{fixed_time(make_local_time(2024, 3, 7, 9, 0, 2))};

    const SnapshotResult result = writer.save(cv::Mat(8, 8, CV_8UC3, cv::Scalar::all(0)), directory / "taken" / "shot.png");

    REQUIRE(result.error == SnapshotError::WriteFailed);
}

TEST_CASE("SnapshotWriter reports a destination that cannot be opened for writing") {
    const auto directory = fresh_directory("occupied");
    const SnapshotWriter writer{fixed_time(make_local_time(2024, 3, 7, 9, 0, 3))};
    // A directory already sits at the exact file name the snapshot needs.
    std::filesystem::create_directories(directory / "shot_03-07-2024_09-00-03AM.png");

    const SnapshotResult result = writer.save(cv::Mat(8, 8, CV_8UC3, cv::Scalar::all(50)), directory / "shot.png");

    REQUIRE(result.error == SnapshotError::WriteFailed);
    REQUIRE(std::filesystem::is_directory(result.path));
}

TEST_CASE("SnapshotWriter encodes in the format named by the base path") {
    const auto directory = fresh_directory("jpeg");
    const SnapshotWriter writer{fixed_time(make_local_time(2024, 3, 7, 21, 0, 4))};

    const SnapshotResult result = writer.save(cv::Mat(32, 40, CV_8UC3, cv::Scalar(90, 90, 90)), directory / "night.JPEG");

    REQUIRE(result.ok());
    REQUIRE(result.path.filename() == "night_03-07-2024_09-00-04PM.jpeg");
    const cv::Mat decoded = cv::imread(result.path.string(), cv::IMREAD_COLOR);
    REQUIRE(decoded.cols == 40);
    REQUIRE(decoded.rows == 32);
}
