#include <gtest/gtest.h>
#include <nocturne/engine/settings.hpp>

namespace nocturne::engine::test {

using core::ErrorCode;
using transport::TransportTarget;

class SettingsTest : public ::testing::Test {
protected:
    core::Result<EngineSettings> load(const std::string& text) {
        auto loaded = config_.loadFromString(text);
        EXPECT_TRUE(loaded.is_ok());
        return loadEngineSettings(config_);
    }

    core::Config config_;
};

// Semua key opsional; config kosong memberi default
TEST_F(SettingsTest, DefaultsFromEmptyConfig) {
    auto settings = load("{}");
    ASSERT_TRUE(settings.is_ok()) << settings.error().what();

    const auto& s = settings.value();
    EXPECT_EQ(s.log_level, core::LogLevel::INFO);
    EXPECT_EQ(s.workers, 4u);
    EXPECT_EQ(s.transport_type, TransportType::Tcp);
    EXPECT_EQ(s.target.mode, TransportTarget::Mode::Listen);
    EXPECT_EQ(s.target.local.toString(), "0.0.0.0:5757");
    EXPECT_TRUE(s.target.remote.empty());
    EXPECT_EQ(s.max_payload_size, 509u);
    EXPECT_EQ(s.grace_period.count(), 250);
    EXPECT_EQ(s.settle_period.count(), 100);
    EXPECT_TRUE(s.publish_on_connect);
    EXPECT_TRUE(s.time_sync_on_connect);
    EXPECT_EQ(s.time_sync_interval, std::chrono::hours(1));
    EXPECT_EQ(s.max_frame_size, 64u * 1024u);
}

TEST_F(SettingsTest, FullDocument) {
    auto settings = load(R"({
        "log_level": "debug",
        "workers": 3,
        "transport": {
            "type": "udp",
            "mode": "connect",
            "peer_host": "192.168.4.1",
            "peer_port": 6000,
            "max_payload_size": 247
        },
        "dispatcher": { "grace_period_ms": 500, "settle_period_ms": 0 },
        "publisher": { "publish_on_connect": false, "time_sync_on_connect": false, "time_sync_interval_ms": 0 },
        "codec": { "max_frame_size": 4096 }
    })");
    ASSERT_TRUE(settings.is_ok()) << settings.error().what();

    const auto& s = settings.value();
    EXPECT_EQ(s.log_level, core::LogLevel::DEBUG);
    EXPECT_EQ(s.workers, 3u);
    EXPECT_EQ(s.transport_type, TransportType::Udp);
    EXPECT_EQ(s.target.mode, TransportTarget::Mode::Connect);
    EXPECT_EQ(s.target.remote.toString(), "192.168.4.1:6000");
    EXPECT_TRUE(s.target.local.empty());
    EXPECT_EQ(s.max_payload_size, 247u);
    EXPECT_EQ(s.grace_period.count(), 500);
    EXPECT_EQ(s.settle_period.count(), 0);
    EXPECT_FALSE(s.publish_on_connect);
    EXPECT_FALSE(s.time_sync_on_connect);
    EXPECT_EQ(s.time_sync_interval.count(), 0);
    EXPECT_EQ(s.max_frame_size, 4096u);
    EXPECT_STREQ(transportTypeName(s.transport_type), "udp");
}

TEST_F(SettingsTest, ConnectModeNeedsPeer) {
    auto settings = load(R"({"transport": {"mode": "connect"}})");
    EXPECT_EQ(settings.code(), ErrorCode::InvalidArgument);

    settings = load(R"({"transport": {"mode": "connect", "peer_host": "10.0.0.2"}})");
    EXPECT_EQ(settings.code(), ErrorCode::InvalidArgument);
}

TEST_F(SettingsTest, UnknownNamesRejected) {
    EXPECT_EQ(load(R"({"log_level": "loud"})").code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(load(R"({"transport": {"type": "bluetooth"}})").code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(load(R"({"transport": {"mode": "broadcast"}})").code(), ErrorCode::InvalidArgument);
}

TEST_F(SettingsTest, RangesEnforced) {
    EXPECT_EQ(load(R"({"workers": 1})").code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(load(R"({"transport": {"port": 70000}})").code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(load(R"({"transport": {"max_payload_size": 6}})").code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(load(R"({"dispatcher": {"grace_period_ms": -5}})").code(), ErrorCode::InvalidArgument);
    EXPECT_EQ(load(R"({"publisher": {"time_sync_interval_ms": -1}})").code(), ErrorCode::InvalidArgument);
    EXPECT_TRUE(load(R"({"transport": {"port": 0}})").is_ok());
}

// Tipe yang salah bukan alasan untuk diam-diam memakai default
TEST_F(SettingsTest, WrongTypesRejected) {
    EXPECT_EQ(load(R"({"workers": "four"})").code(), ErrorCode::InvalidData);
    EXPECT_EQ(load(R"({"publisher": {"publish_on_connect": "yes"}})").code(), ErrorCode::InvalidData);
}

TEST_F(SettingsTest, InvalidHostRejected) {
    EXPECT_EQ(load(R"({"transport": {"host": "car.local"}})").code(), ErrorCode::InvalidAddress);
}

TEST(SettingsValidateTest, RejectsUnrunnableValues) {
    EngineSettings settings;
    EXPECT_TRUE(validate(settings).is_ok());

    settings.workers = 1;
    EXPECT_EQ(validate(settings).code(), ErrorCode::InvalidArgument);
    settings.workers = 2;

    settings.transport_type = TransportType::Udp;
    settings.max_payload_size = 6;
    EXPECT_EQ(validate(settings).code(), ErrorCode::InvalidArgument);
    settings.max_payload_size = 7;
    EXPECT_TRUE(validate(settings).is_ok());

    settings.settle_period = std::chrono::milliseconds(-1);
    EXPECT_EQ(validate(settings).code(), ErrorCode::InvalidArgument);
    settings.settle_period = std::chrono::milliseconds(0);

    settings.time_sync_interval = std::chrono::milliseconds(-1);
    EXPECT_EQ(validate(settings).code(), ErrorCode::InvalidArgument);
}

} // namespace nocturne::engine::test
