#include <string>
#include "fanlog/log.hpp"

using namespace fanlog;

namespace
{
struct sample
{
    std::string a;

    std::string to_string() const { return "{" + a + "}"; }
};
} // namespace

int main()
{
    logger_options options;
    options.level    = log_level::debug;
    options.on_panic = [](std::string_view msg) { fmt::print(stderr, "recovered from panic: {}\n", msg); };

    auto log = make_color_logger(nullptr, options);
    log->with_context({{"_context", "bound"}});
    log->set_flags(flag_std | flag_microseconds);

    log->debug("debug");
    log->with({
                  {"asd", "bsd"},
                  {"lorem", "ipsum"},
                  {"bang", 10},
                  {"struct", sample{"aaaaaa"}},
              })
        .info("info");
    log->warning("warn");
    log->error("error");
    log->with({{"test", "check"}}).panic("panic");

    // The panic closed the logger; further lines are dropped with a notice on stderr
    log->fatal("fatal");
    return 0;
}
