#include <fanlog/log.hpp>

using namespace fanlog;

int main()
{
    // Console-only logger, which also becomes the default
    auto log = make_std_logger();
    log->set_level(log_level::debug);

    // Test basic logging
    log->info("Integration test successful!");
    log->debug("Debug message");
    log->warning("Warning message");

    // Test structured logging
    log->with({{"user_id", 12345}, {"ip", "192.168.1.1"}}).info("User login");

    // Test the default logger
    fanlog::infof("fanlog version {}", VERSION);

    log->close();
    return log->state() == logger_state::closed ? 0 : 1;
}
