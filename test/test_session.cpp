#include <catch2/catch.hpp>

#include "physio/session.hpp"
#include "physio/vendor_library.hpp"
#include "physio/returncode.hpp"
#include "fake_mpdev.hpp"
#include "temp_dir.hpp"
#include <algorithm>
#include <atomic>
#include <thread>

using namespace Physio;

namespace {
    struct SessionFixture {
        FakeMpDev fake{FAKE_MPDEV_PATH};
        TempDir dir;
        DeviceType* type = DeviceType::parse("MP150");
        ChannelSpec channels{3};
        MpDevice device;
        Session* session;

        SessionFixture() {
            if (VendorLibrary::load(FAKE_MPDEV_PATH) != 0) throw std::runtime_error("could not load fake library");
            session = new Session(&device);
        }

        ~SessionFixture() {
            delete session;
            delete type;
            VendorLibrary::unload();
        }

        session_params params() {
            session_params p = {type, CommunicationType::UDP, "auto", 200, &channels, dir.file("session"), false};
            return p;
        }

        std::string log_contents() {
            return TempDir::read(session->getLogFilename());
        }

        static long count_rows(const std::string& contents) {
            return std::count(contents.begin(), contents.end(), '\n');
        }
    };
}

TEST_CASE_METHOD(SessionFixture, "opening a session configures and starts the device", "[session]") {
    REQUIRE(session->open(params()) == MPSUCCESS);
    CHECK(session->is_open());
    CHECK(fake.is_connected());
    CHECK(fake.is_acquiring());
    CHECK(fake.type() == 101);
    CHECK(fake.interval_ms() == Approx(5.0));
    CHECK(fake.mask(2) == 1);
    CHECK(fake.mask(3) == 0);

    CHECK(session->getLogFilename() == dir.file("session_BIOPAC_data.tsv"));
    CHECK(log_contents() == "timestamp\tchannel_0\tchannel_1\tchannel_2");
}

TEST_CASE_METHOD(SessionFixture, "a failing startup step disconnects again", "[session]") {
    fake.fail_next("startAcquisition", MPBUSY);
    CHECK(session->open(params()) == MPBUSY);
    CHECK_FALSE(session->is_open());
    CHECK_FALSE(fake.is_connected());
    CHECK(fake.calls("disconnectMPDev") == 1);
}

TEST_CASE_METHOD(SessionFixture, "a failing connect is reported", "[session]") {
    fake.fail_next("connectMPDev", MPCOMERR);
    CHECK(session->open(params()) == MPCOMERR);
    CHECK(fake.calls("setSampleRate") == 0);
    CHECK(fake.calls("disconnectMPDev") == 0);
}

TEST_CASE_METHOD(SessionFixture, "the newest sample starts out as zeros", "[session]") {
    REQUIRE(session->open(params()) == MPSUCCESS);
    CHECK(session->sample() == std::vector<double>({0.0, 0.0, 0.0}));
}

TEST_CASE_METHOD(SessionFixture, "polling keeps the newest sample", "[session]") {
    REQUIRE(session->open(params()) == MPSUCCESS);
    REQUIRE(session->poll() == MPSUCCESS);
    CHECK(session->sample() == std::vector<double>({1.0, 1.25, 1.5}));

    REQUIRE(session->poll() == MPSUCCESS);
    REQUIRE(session->poll() == MPSUCCESS);
    CHECK(session->sample() == std::vector<double>({2.0, 2.25, 2.5}));
}

TEST_CASE_METHOD(SessionFixture, "repeated samples are only handled once", "[session]") {
    int new_samples = 0;
    session->set_sample_callback([&new_samples] (const std::vector<double>& sample) {
        new_samples++;
    });
    REQUIRE(session->open(params()) == MPSUCCESS);
    REQUIRE(session->start_recording_to_buffer(1) == MPSUCCESS);

    for (int i = 0; i < 6; i++) {
        REQUIRE(session->poll() == MPSUCCESS);
    }

    CHECK(new_samples == 3);
    CHECK(session->get_buffer() == std::vector<double>({1.25, 2.25, 3.25}));
}

TEST_CASE_METHOD(SessionFixture, "buffering can be stopped and restarted", "[session]") {
    REQUIRE(session->open(params()) == MPSUCCESS);
    REQUIRE(session->start_recording_to_buffer() == MPSUCCESS);
    CHECK(session->is_recording_to_buffer());
    REQUIRE(session->poll() == MPSUCCESS);
    session->stop_recording_to_buffer();
    REQUIRE(session->poll() == MPSUCCESS);
    REQUIRE(session->poll() == MPSUCCESS);
    CHECK(session->get_buffer() == std::vector<double>({1.0}));

    REQUIRE(session->start_recording_to_buffer(2) == MPSUCCESS);
    CHECK(session->get_buffer().empty());
    REQUIRE(session->poll() == MPSUCCESS);
    REQUIRE(session->poll() == MPSUCCESS);
    CHECK(session->get_buffer() == std::vector<double>({3.5}));
}

TEST_CASE_METHOD(SessionFixture, "only acquired channels can be buffered", "[session]") {
    REQUIRE(session->open(params()) == MPSUCCESS);
    CHECK(session->start_recording_to_buffer(3) == MPINVPARA);
    CHECK(session->start_recording_to_buffer(-1) == MPINVPARA);
    CHECK_FALSE(session->is_recording_to_buffer());
}

TEST_CASE_METHOD(SessionFixture, "samples are logged only while recording", "[session]") {
    REQUIRE(session->open(params()) == MPSUCCESS);
    REQUIRE(session->poll() == MPSUCCESS);

    session->start_recording();
    CHECK(session->is_recording());
    for (int i = 0; i < 4; i++) {
        REQUIRE(session->poll() == MPSUCCESS);
    }
    CHECK(session->stop_recording() == 0);
    CHECK_FALSE(session->is_recording());
    REQUIRE(session->poll() == MPSUCCESS);
    REQUIRE(session->poll() == MPSUCCESS);

    std::string contents = log_contents();
    CHECK(count_rows(contents) == 2);
    CHECK(contents.find("\t2.5\n") != std::string::npos);
    CHECK(contents.find("\t1.5") == std::string::npos);
}

TEST_CASE_METHOD(SessionFixture, "messages are logged with a timestamp", "[session]") {
    REQUIRE(session->open(params()) == MPSUCCESS);
    CHECK(session->log("baseline start") == 0);
    REQUIRE(session->close() == MPSUCCESS);

    std::string contents = log_contents();
    CHECK(contents.find("\nMSG\t") != std::string::npos);
    CHECK(contents.substr(contents.size() - 15) == "\tbaseline start");
}

TEST_CASE_METHOD(SessionFixture, "a failed poll changes nothing", "[session]") {
    REQUIRE(session->open(params()) == MPSUCCESS);
    REQUIRE(session->poll() == MPSUCCESS);

    fake.fail_next("getMostRecentSample", MPCOMERR);
    CHECK(session->poll() == MPCOMERR);
    CHECK(session->sample() == std::vector<double>({1.0, 1.25, 1.5}));
}

TEST_CASE_METHOD(SessionFixture, "the timestamp counts from the connection", "[session]") {
    REQUIRE(session->open(params()) == MPSUCCESS);
    int64_t first = session->get_timestamp();
    CHECK(first >= 0);
    CHECK(session->get_timestamp() >= first);
}

TEST_CASE_METHOD(SessionFixture, "closing stops recording and disconnects", "[session]") {
    REQUIRE(session->open(params()) == MPSUCCESS);
    session->start_recording();
    REQUIRE(session->poll() == MPSUCCESS);

    CHECK(session->close() == MPSUCCESS);
    CHECK_FALSE(session->is_recording());
    CHECK_FALSE(session->is_open());
    CHECK_FALSE(fake.is_connected());
    CHECK(count_rows(log_contents()) == 1);
}

TEST_CASE_METHOD(SessionFixture, "an existing log file is kept", "[session]") {
    TempDir::touch(dir.file("session_BIOPAC_data.tsv"));
    REQUIRE(session->open(params()) == MPSUCCESS);
    CHECK(session->getLogFilename() == dir.file("session_2_BIOPAC_data.tsv"));
}

TEST_CASE_METHOD(SessionFixture, "messages can be logged while the session is reopened", "[session]") {
    REQUIRE(session->open(params()) == MPSUCCESS);

    std::atomic<bool> done(false);
    std::thread control([this, &done] {
        while (!done) {
            session->log("marker");
            session->stop_recording();
            session->getLogFilename();
        }
    });

    for (int i = 0; i < 20; i++) {
        CHECK(session->close() == MPSUCCESS);
        CHECK(session->open(params()) == MPSUCCESS);
    }
    done = true;
    control.join();

    CHECK(session->getLogFilename() == dir.file("session_21_BIOPAC_data.tsv"));
}

TEST_CASE_METHOD(SessionFixture, "log columns name the selected hardware channels", "[session]") {
    ChannelSpec* sparse = ChannelSpec::parse("1,4");
    session_params p = params();
    p.channels = sparse;
    REQUIRE(session->open(p) == MPSUCCESS);
    CHECK(log_contents() == "timestamp\tchannel_1\tchannel_4");
    delete sparse;
}
