#pragma once

#include <string>

namespace cronkit::config {

struct SchedulerConfig {
    int worker_threads = 4;
    // 0 lets the pool grow without bound while every worker is busy.
    int max_worker_threads = 32;
    std::string log_level = "info";
};

struct HttpConfig {
    bool enabled = false;
    std::string host = "127.0.0.1";
    int port = 18790;
};

struct Config {
    SchedulerConfig scheduler;
    HttpConfig http;
    std::string jobs_file;
};

}  // namespace cronkit::config
