#include <catch2/catch_test_macros.hpp>
#include "fanlog/log.hpp"
#include "stderr_capture.hpp"
#include <tao/json.hpp>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <system_error>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace fanlog;

namespace
{
struct fatal_intercepted
{
    int code;
};

// Logger writing every level to @p sink only, without console output
std::shared_ptr<logger> memory_logger(const std::shared_ptr<memory_writer> &sink, logger_options options = {})
{
    level_writers writers;
    writers.fill(sink);
    return std::make_shared<logger>("test", writers, std::vector<std::shared_ptr<log_writer>>{sink}, std::move(options));
}

// Writer that counts lines and cannot be closed
class counting_writer : public log_writer
{
  public:
    ssize_t write(const char *, size_t len) override
    {
        ++lines;
        return static_cast<ssize_t>(len);
    }

    std::string describe() const override { return "counting"; }

    std::atomic<int> lines{0};
};

// Closeable writer whose close always fails
class failing_close_writer : public memory_writer
{
  public:
    using memory_writer::memory_writer;

    void close() override { throw std::runtime_error("device gone"); }
};

// Closeable writer recording whether close ever overlapped a write
class overlap_writer : public log_writer, public log_closer
{
  public:
    ssize_t write(const char *, size_t len) override
    {
        writing = true;
        std::this_thread::sleep_for(std::chrono::microseconds(50));
        writing = false;
        return static_cast<ssize_t>(len);
    }

    std::string describe() const override { return "overlap"; }

    void close() override
    {
        if (writing) overlapped = true;
        std::this_thread::sleep_for(std::chrono::microseconds(200));
        if (writing) overlapped = true;
    }

    std::atomic<bool> writing{false};
    std::atomic<bool> overlapped{false};
};

bool starts_with(const std::string &s, std::string_view prefix) { return s.rfind(prefix, 0) == 0; }

bool ends_with(const std::string &s, std::string_view suffix)
{
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

TEST_CASE("Plain logger over a memory sink", "[logger]") {
    reset_default_logger();
    auto sink = std::make_shared<memory_writer>();
    auto log  = make_logger(sink);

    log->set_flags(flag_disable);
    log->set_level(log_level::debug);

    log->debug("debug message");
    log->info("info message");
    log->warning("warning message");
    log->error("error message");

    auto lines = sink->lines();
    REQUIRE(lines.size() == 4);
    REQUIRE(lines[0] == "DEBUG: debug message");
    REQUIRE(lines[1] == "INFO : info message");
    REQUIRE(lines[2] == "WARN : warning message");
    REQUIRE(lines[3] == "ERROR: error message");

    reset_default_logger();
}

TEST_CASE("Independent loggers do not share destinations", "[logger]") {
    reset_default_logger();
    auto sink_a = std::make_shared<memory_writer>("a");
    auto sink_b = std::make_shared<memory_writer>("b");

    auto log_a = make_logger(sink_a);
    auto log_b = make_logger(sink_b);
    REQUIRE(default_logger() == log_a);

    log_a->info("a1");
    log_a->info("a2");
    log_b->info("b1");
    fanlog::info("through default");

    REQUIRE(sink_a->lines().size() == 3);
    REQUIRE(sink_b->lines().size() == 1);
    REQUIRE(ends_with(sink_b->lines()[0], "b1"));

    reset_default_logger();
}

TEST_CASE("Severity filtering", "[logger]") {
    auto sink = std::make_shared<memory_writer>();
    auto log  = memory_logger(sink);
    log->set_flags(flag_disable);

    SECTION("Default threshold hides debug") {
        REQUIRE(log->level() == log_level::info);
        log->debug("hidden");
        log->info("shown");
        REQUIRE(sink->lines().size() == 1);
    }

    SECTION("Threshold") {
        log->set_level(log_level::error);
        log->warning("hidden");
        log->info("hidden");
        log->error("shown");
        REQUIRE(sink->lines().size() == 1);
        REQUIRE(log->level() == log_level::error);
    }

    SECTION("Mask") {
        log->set_level_mask(level_bit(log_level::debug) | level_bit(log_level::error));
        log->debug("shown");
        log->info("hidden");
        log->warning("hidden");
        log->error("shown");
        REQUIRE(sink->lines().size() == 2);
        REQUIRE(log->gate().uses_mask());
    }

    SECTION("Mask from options") {
        logger_options options;
        options.mask = level_bit(log_level::warning);
        auto masked  = memory_logger(sink, options);
        masked->set_flags(flag_disable);
        masked->info("hidden");
        masked->warning("shown");
        REQUIRE(sink->lines() == std::vector<std::string>{"WARN : shown"});
    }
}

TEST_CASE("Fatal", "[logger][fatal]") {
    auto sink = std::make_shared<memory_writer>();
    std::string seen;
    int calls = 0;

    logger_options options;
    options.flags    = flag_disable;
    options.on_fatal = [&](int code)
    {
        ++calls;
        seen = sink->str();
        throw fatal_intercepted{code};
    };
    auto log = memory_logger(sink, options);

    SECTION("The line is written before termination") {
        try {
            log->fatal("boom");
            FAIL("fatal returned");
        }
        catch (const fatal_intercepted &e) {
            REQUIRE(e.code == 1);
        }
        REQUIRE(calls == 1);
        REQUIRE(seen == "FATAL: boom\n");
        REQUIRE(log->state() == logger_state::closed);
        REQUIRE(sink->closed());
    }

    SECTION("Formatted variant") {
        REQUIRE_THROWS_AS(log->fatalf("code {}", 17), fatal_intercepted);
        REQUIRE(seen == "FATAL: code 17\n");
    }

    SECTION("Terminates even when the line is filtered") {
        log->set_level(log_level::off);
        REQUIRE_THROWS_AS(log->fatal("hidden"), fatal_intercepted);
        REQUIRE(calls == 1);
        REQUIRE(seen.empty());
    }

    SECTION("Fatal only threshold suppresses the rest") {
        log->set_level(log_level::fatal);
        log->debug("hidden");
        log->info("hidden");
        log->warning("hidden");
        log->error("hidden");
        REQUIRE(sink->str().empty());
        REQUIRE_THROWS_AS(log->fatal("shown"), fatal_intercepted);
        REQUIRE(seen == "FATAL: shown\n");
    }
}

TEST_CASE("Panic", "[logger][panic]") {
    auto sink = std::make_shared<memory_writer>();
    logger_options options;
    options.flags = flag_disable;

    SECTION("Throws panic_error after writing") {
        auto log = memory_logger(sink, options);
        try {
            log->panic("out of cheese");
            FAIL("panic returned");
        }
        catch (const panic_error &e) {
            REQUIRE(std::string(e.what()) == "out of cheese");
        }
        REQUIRE(sink->str() == "PANIC: out of cheese\n");
        REQUIRE(log->state() == logger_state::closed);
    }

    SECTION("Formatted variant") {
        auto log = memory_logger(sink, options);
        REQUIRE_THROWS_AS(log->panicf("disk {} full", "sda"), panic_error);
        REQUIRE(sink->str() == "PANIC: disk sda full\n");
    }

    SECTION("Panic hook replaces the exception") {
        std::string message;
        options.on_panic = [&](std::string_view msg) { message = msg; };
        auto log         = memory_logger(sink, options);
        log->panic("handled");
        REQUIRE(message == "handled");
        REQUIRE(sink->str() == "PANIC: handled\n");
    }
}

TEST_CASE("Runtime level dispatch", "[logger]") {
    auto sink = std::make_shared<memory_writer>();
    logger_options options;
    options.flags = flag_disable;
    options.level = log_level::debug;
    auto log      = memory_logger(sink, options);

    log->log(log_level::debug, "d");
    log->log(log_level::warning, "w");
    log->log(log_level::off, "never");
    REQUIRE(sink->lines() == std::vector<std::string>{"DEBUG: d", "WARN : w"});

    REQUIRE_THROWS_AS(log->log(log_level::panic, "p"), panic_error);
    REQUIRE(ends_with(sink->str(), "PANIC: p\n"));
}

TEST_CASE("Formatted messages", "[logger]") {
    auto sink = std::make_shared<memory_writer>();
    logger_options options;
    options.flags = flag_disable;
    options.level = log_level::debug;
    auto log      = memory_logger(sink, options);

    log->debugf("{} + {} = {}", 1, 2, 3);
    log->infof("user {}", std::string("bob"));
    log->warningf("{:.1f}%", 99.5);
    log->errorf("plain");

    REQUIRE(sink->lines() == std::vector<std::string>{"DEBUG: 1 + 2 = 3", "INFO : user bob", "WARN : 99.5%", "ERROR: plain"});
}

TEST_CASE("Structured fields", "[logger][fields]") {
    auto sink = std::make_shared<memory_writer>();
    logger_options options;
    options.flags = flag_disable;
    options.level = log_level::debug;
    auto log      = memory_logger(sink, options);

    SECTION("Fields appear on every level") {
        log_fields fields = merge_fields(log_fields{{"bool", true}, {"int", 7}, {"string", "test"}}, log_fields{{"second", 2}});
        log->with(fields).info("check field");
        log->with(fields).debug("check field");
        log->with(fields).error("check field");
        log->with(fields).warningf("check field");

        for (const auto &line : sink->lines()) {
            REQUIRE(ends_with(line, "bool=true int=7 second=2 string=test check field"));
        }
        REQUIRE(sink->lines().size() == 4);
    }

    SECTION("One-shot fields are cleared after the call") {
        log->with({{"request", 1}}).info("first");
        log->info("second");
        auto lines = sink->lines();
        REQUIRE(lines[0] == "INFO : request=1 first");
        REQUIRE(lines[1] == "INFO : second");
    }

    SECTION("One-shot fields are cleared by a filtered call") {
        log->set_level(log_level::info);
        log->with({{"request", 1}}).debug("filtered");
        log->info("next");
        REQUIRE(sink->lines() == std::vector<std::string>{"INFO : next"});
    }

    SECTION("Chained with calls merge") {
        log->with({{"a", 1}}).with({{"b", 2}, {"a", 3}}).info("m");
        REQUIRE(sink->lines()[0] == "INFO : a=3 b=2 m");
    }

    SECTION("Context fields persist") {
        log->with_context({{"service", "api"}});
        log->info("one");
        log->info("two");
        log->clear_context();
        log->info("three");
        REQUIRE(sink->lines() == std::vector<std::string>{"INFO : service=api one", "INFO : service=api two", "INFO : three"});
    }

    SECTION("Binding a new context replaces the old one") {
        log->with_context({{"request", 1}, {"user", "alice"}});
        log->info("first");
        log->with_context({{"request", 2}});
        log->info("second");
        REQUIRE(sink->lines() == std::vector<std::string>{"INFO : request=1 user=alice first", "INFO : request=2 second"});
    }

    SECTION("Context wins over one-shot fields") {
        log->with_context({{"who", "context"}});
        log->with({{"who", "call"}, {"extra", 1}}).info("m");
        REQUIRE(sink->lines()[0] == "INFO : extra=1 who=context m");
    }
}

TEST_CASE("Output flags", "[logger]") {
    auto sink = std::make_shared<memory_writer>();
    auto log  = memory_logger(sink);

    REQUIRE(log->flags() == flag_std);
    log->set_flags(flag_short_file);
    REQUIRE(log->flags() == flag_short_file);

    log->info("located");
    auto line = sink->lines().at(0);
    REQUIRE(starts_with(line, "INFO : test_logger.cpp:"));
    REQUIRE(ends_with(line, ": located"));

    sink->clear();
    log->set_flags(flag_msg_prefix);
    log->info("moved");
    REQUIRE(sink->lines().at(0) == "INFO : moved");
}

TEST_CASE("Formatter variants", "[logger]") {
    reset_default_logger();
    auto sink = std::make_shared<memory_writer>();

    SECTION("JSON") {
        auto log = make_json_logger(sink);
        log->set_flags(flag_std | flag_short_file);
        log->with({{"user", "bob"}}).warning("careful");

        auto line = sink->lines().at(0);
        REQUIRE(starts_with(line, "{\"time\":"));

        auto value = tao::json::from_string(line);
        REQUIRE(value.at("level").get_string() == "warning");
        REQUIRE(value.at("msg").get_string() == "careful");
        REQUIRE(value.at("user").get_string() == "bob");
        REQUIRE(starts_with(value.at("file").get_string(), "test_logger.cpp:"));
    }

    SECTION("Color") {
        auto log = make_color_logger(sink);
        log->set_flags(flag_disable);
        log->error("red");
        REQUIRE(sink->lines().at(0) == "\033[31mERROR: \033[0mred");
    }

    reset_default_logger();
}

TEST_CASE("Closing", "[logger]") {
    SECTION("Closes the explicit writer once") {
        reset_default_logger();
        auto sink = std::make_shared<memory_writer>();
        auto log  = make_logger(sink);
        REQUIRE(log->state() == logger_state::initialized);

        log->close();
        REQUIRE(log->state() == logger_state::closed);
        REQUIRE(sink->closed());

        log->close();
        REQUIRE(log->state() == logger_state::closed);
        reset_default_logger();
    }

    SECTION("Lines after close are dropped") {
        auto counter = std::make_shared<counting_writer>();
        level_writers writers;
        writers.fill(counter);
        logger log("closing", writers, {}, logger_options{});

        log.info("kept");
        log.close();
        log.info("dropped");
        log.error("dropped");
        REQUIRE(counter->lines.load() == 1);
    }

    SECTION("Destruction closes") {
        auto sink = std::make_shared<memory_writer>();
        memory_logger(sink)->info("bye");
        REQUIRE(sink->closed());
        REQUIRE(sink->lines().size() == 1);
    }
}

TEST_CASE("Close failures are reported", "[logger]") {
    auto sink = std::make_shared<failing_close_writer>("flaky");
    level_writers writers;
    writers.fill(sink);
    logger log("closing", writers, {sink}, logger_options{});

    stderr_capture capture;
    log.close();
    auto text = capture.text();

    REQUIRE(log.state() == logger_state::closed);
    REQUIRE(text.find("fanlog: close flaky failed: device gone") != std::string::npos);
}

TEST_CASE("Close does not race concurrent writes", "[logger][threads]") {
    auto writer = std::make_shared<overlap_writer>();
    level_writers writers;
    writers.fill(writer);
    logger_options options;
    options.flags = flag_disable;
    auto log = std::make_shared<logger>("racing", writers, std::vector<std::shared_ptr<log_writer>>{writer}, options);

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&log]
        {
            for (int i = 0; i < 200; ++i) log->info("busy");
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    {
        stderr_capture capture;
        log->close();
        for (auto &thread : threads) thread.join();
    }

    REQUIRE(log->state() == logger_state::closed);
    REQUIRE_FALSE(writer->overlapped.load());
}

TEST_CASE("Unreachable system log is reported at error level", "[logger][syslog]") {
    reset_default_logger();
    auto sink = std::make_shared<memory_writer>();

    logger_options options;
    options.flags = flag_disable;
    options.system_log_opener = [](const std::string &) -> system_log_writers
    {
        throw std::system_error(ECONNREFUSED, std::generic_category(), "Unix syslog delivery error");
    };

    stderr_capture capture;
    auto log = logger::create("unreachable", true, sink, options);
    capture.text();

    REQUIRE(log->state() == logger_state::initialized);
    auto lines = sink->lines();
    REQUIRE(lines.size() == 1);
    REQUIRE(starts_with(lines[0], "ERROR: Unix syslog delivery error"));

    log->info("still logging");
    REQUIRE(sink->lines().at(1) == "INFO : still logging");
    reset_default_logger();
}

TEST_CASE("System log writers receive every level", "[logger][syslog]") {
    reset_default_logger();
    auto system_sink = std::make_shared<memory_writer>("system");

    logger_options options;
    options.flags = flag_disable;
    options.level = log_level::debug;
    options.system_log_opener = [&system_sink](const std::string &name)
    {
        REQUIRE(name == "injected");
        system_log_writers writers;
        writers.by_level.fill(system_sink);
        return writers;
    };

    auto log = logger::create("injected", true, nullptr, options);
    {
        stderr_capture capture;
        log->debug("d");
        log->error("e");
        capture.text();
    }
    REQUIRE(system_sink->lines() == std::vector<std::string>{"DEBUG: d", "ERROR: e"});

    log->close();
    REQUIRE(system_sink->closed());
    reset_default_logger();
}

TEST_CASE("System log logger", "[logger][syslog]") {
    reset_default_logger();
    auto log = make_syslog_logger("fanlog-test");
    REQUIRE(log->name() == "fanlog-test");
    REQUIRE(log->state() == logger_state::initialized);
    log->info("fanlog system log test");
    log->close();
    REQUIRE(log->state() == logger_state::closed);
    reset_default_logger();
}

TEST_CASE("Concurrent logging", "[logger][threads]") {
    auto sink = std::make_shared<memory_writer>();
    logger_options options;
    options.flags = flag_disable;
    auto log      = memory_logger(sink, options);

    constexpr int thread_count = 8;
    constexpr int per_thread   = 200;

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&log, t]
        {
            for (int i = 0; i < per_thread; ++i) {
                log->infof("thread {} message {}", t, i);
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    auto lines = sink->lines();
    REQUIRE(lines.size() == thread_count * per_thread);
    for (const auto &line : lines) {
        REQUIRE(starts_with(line, "INFO : thread "));
    }
}
