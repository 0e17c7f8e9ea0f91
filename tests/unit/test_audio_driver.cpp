#include <gtest/gtest.h>
#include "AudioDriver.hpp"
#include "Logger.hpp"
#include <cstring>
#include <utility>

using namespace tonegen;

namespace {

// Device stand-in that settles on a fixed rate, as set_rate_near may.
class FixedRateDriver : public hal::AudioDriver {
public:
    FixedRateDriver(int rate, bool available) : rate_(rate), available_(available) {}

    bool start() override {
        running_ = available_;
        return available_;
    }
    void stop() override { running_ = false; ++stops_; }
    void set_callback(AudioCallback callback) override { callback_ = std::move(callback); }
    bool is_running() const override { return running_; }
    int sample_rate() const override { return rate_; }
    int block_size() const override { return 1024; }

    int stops() const { return stops_; }

private:
    int rate_;
    bool available_;
    bool running_ = false;
    int stops_ = 0;
    AudioCallback callback_;
};

} // namespace

TEST(AudioDriverTest, StartAtKeepsMatchingRate) {
    FixedRateDriver driver(44100, true);
    EXPECT_TRUE(driver.start_at(44100));
    EXPECT_TRUE(driver.is_running());
    EXPECT_EQ(driver.stops(), 0);
}

TEST(AudioDriverTest, StartAtRefusesNegotiatedRateMismatch) {
    while (AudioLogger::instance().pop_entry()) {}

    FixedRateDriver driver(48000, true);
    EXPECT_FALSE(driver.start_at(44100));
    EXPECT_FALSE(driver.is_running());
    EXPECT_EQ(driver.stops(), 1);

    bool logged = false;
    while (auto entry = AudioLogger::instance().pop_entry()) {
        if (std::strcmp(entry->tag, "RateMismatch") == 0 && entry->value == 48000.0f) logged = true;
    }
    EXPECT_TRUE(logged);
}

TEST(AudioDriverTest, StartAtReportsUnavailableDevice) {
    FixedRateDriver driver(44100, false);
    EXPECT_FALSE(driver.start_at(44100));
    EXPECT_FALSE(driver.is_running());
}
