#include <algorithm>
#include <iostream>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>
#include "fanlog/log.hpp"

using namespace fanlog;

void print_usage(const char* prog_name) {
    std::cerr << "Usage: " << prog_name << " [options]\n"
              << "Options:\n"
              << "  -w <format>       Output format: plain, json, color, syslog (default: plain)\n"
              << "  -f <file>         Also append to this file\n"
              << "  -c <config>       Configuration string, e.g. level=debug,flags=std|shortfile\n"
              << "  -t <threads>      Number of logging threads (default: 1)\n"
              << "  -n <lines>        Lines per thread (default: 10)\n"
              << "  -h                Show this help\n"
              << "FANLOG_CONFIG is applied before -c.\n";
}

int main(int argc, char *argv[])
{
    // Default parameters
    std::string format = "plain";
    std::string output_file;
    const char *config = nullptr;
    int thread_count   = 1;
    int line_count     = 10;

    // Parse command line arguments
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-w") == 0 && i + 1 < argc) {
            format = argv[++i];
        } else if (strcmp(argv[i], "-f") == 0 && i + 1 < argc) {
            output_file = argv[++i];
        } else if (strcmp(argv[i], "-c") == 0 && i + 1 < argc) {
            config = argv[++i];
        } else if (strcmp(argv[i], "-t") == 0 && i + 1 < argc) {
            thread_count = std::max(1, std::atoi(argv[++i]));
        } else if (strcmp(argv[i], "-n") == 0 && i + 1 < argc) {
            line_count = std::max(0, std::atoi(argv[++i]));
        } else if (strcmp(argv[i], "-h") == 0) {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    logger_options options;
    configure_from_env(options);
    if (config && !configure_from_string(options, config)) {
        std::cerr << "Error: invalid configuration: " << config << "\n";
        return 1;
    }

    std::shared_ptr<log_writer> writer;
    if (!output_file.empty()) {
        try {
            writer = std::make_shared<file_writer>(output_file);
        } catch (const std::exception &e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    // Create logger based on format
    std::shared_ptr<logger> log;
    if (format == "plain") {
        log = make_logger(writer, options);
    } else if (format == "json") {
        log = make_json_logger(writer, options);
    } else if (format == "color") {
        log = make_color_logger(writer, options);
    } else if (format == "syslog") {
        log = logger::create("fanlog-simple", true, writer, options);
    } else {
        std::cerr << "Error: unknown format: " << format << "\n";
        print_usage(argv[0]);
        return 1;
    }

    log->with_context({{"pid", static_cast<int64_t>(::getpid())}});
    log->infof("Starting log test with format: {}", format);
    log->debugf("Output file: {}", output_file.empty() ? "(none)" : output_file);
    log->with({{"threads", thread_count}, {"lines", line_count}}).info("configuration");

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&log, t, line_count] {
            for (int i = 0; i < line_count; ++i) {
                // one-shot fields belong to the logger, not the thread
                log->infof("Hello world from worker {} iteration {}", t, i);
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    // The default logger is the one created above
    fanlog::warning("done through the default logger");
    log->close();
    return 0;
}
