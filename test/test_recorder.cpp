#include <catch2/catch.hpp>

#include "physio/recorder.hpp"
#include "temp_dir.hpp"

using namespace Physio;

TEST_CASE("log file names get the BIOPAC suffix", "[recorder]") {
    TempDir dir;
    CHECK(Recorder::resolve_filename(dir.file("test"), false) == dir.file("test_BIOPAC_data.tsv"));
}

TEST_CASE("existing log files are not overwritten unless requested", "[recorder]") {
    TempDir dir;
    TempDir::touch(dir.file("test_BIOPAC_data.tsv"));

    CHECK(Recorder::resolve_filename(dir.file("test"), true) == dir.file("test_BIOPAC_data.tsv"));
    CHECK(Recorder::resolve_filename(dir.file("test"), false) == dir.file("test_2_BIOPAC_data.tsv"));

    TempDir::touch(dir.file("test_2_BIOPAC_data.tsv"));
    CHECK(Recorder::resolve_filename(dir.file("test"), false) == dir.file("test_3_BIOPAC_data.tsv"));
}

TEST_CASE("the header names one column per channel", "[recorder]") {
    TempDir dir;
    Recorder recorder(dir.file("header.tsv"), {0, 1, 2});
    REQUIRE(recorder.open() == 0);
    REQUIRE(recorder.close() == 0);

    CHECK(TempDir::read(dir.file("header.tsv")) == "timestamp\tchannel_0\tchannel_1\tchannel_2");
}

TEST_CASE("header columns carry the hardware channel index", "[recorder]") {
    TempDir dir;
    Recorder recorder(dir.file("sparse.tsv"), {0, 2, 5});
    REQUIRE(recorder.open() == 0);
    REQUIRE(recorder.close() == 0);

    CHECK(TempDir::read(dir.file("sparse.tsv")) == "timestamp\tchannel_0\tchannel_2\tchannel_5");
}

TEST_CASE("samples and messages are written as tab separated rows", "[recorder]") {
    TempDir dir;
    Recorder recorder(dir.file("rows.tsv"), {0, 1});
    REQUIRE(recorder.open() == 0);

    CHECK(recorder.write_sample(5, {1.5, -0.25}) == 0);
    CHECK(recorder.write_message(7, "stimulus onset") == 0);
    CHECK(recorder.write_sample(10, {0.123456789012, 2}) == 0);
    CHECK(recorder.flush() == 0);
    REQUIRE(recorder.close() == 0);

    CHECK(TempDir::read(dir.file("rows.tsv")) ==
        "timestamp\tchannel_0\tchannel_1"
        "\n5\t1.5\t-0.25"
        "\nMSG\t7\tstimulus onset"
        "\n10\t0.123456789\t2");
}

TEST_CASE("writing to a closed recorder fails", "[recorder]") {
    TempDir dir;
    Recorder recorder(dir.file("closed.tsv"), {0});
    CHECK_FALSE(recorder.is_open());
    CHECK(recorder.write_sample(0, {1.0}) != 0);
    CHECK(recorder.write_message(0, "lost") != 0);
    CHECK(recorder.flush() != 0);
}

TEST_CASE("a log file in a missing directory cannot be opened", "[recorder]") {
    TempDir dir;
    Recorder recorder(dir.file("missing/log.tsv"), {0});
    CHECK(recorder.open() != 0);
    CHECK_FALSE(recorder.is_open());
}
