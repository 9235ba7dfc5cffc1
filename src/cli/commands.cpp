#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "config/config_loader.hpp"
#include "config/job_definitions.hpp"
#include "scheduler/errors.hpp"
#include "scheduler/scheduler.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

namespace {

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

class MessageJob : public cronkit::scheduler::Job {
public:
    explicit MessageJob(std::string message) : message_(std::move(message)) {}

    void Execute(const cronkit::scheduler::JobContext& context) override {
        std::cout << "[job] " << (context.name.empty() ? "(anonymous)" : context.name)
                  << " fire=" << context.fire_number
                  << " at=" << cronkit::utils::FormatIso(context.fired_at)
                  << " " << message_ << std::endl;
    }

private:
    std::string message_;
};

nlohmann::json OptionalTime(const std::optional<cronkit::scheduler::TimePoint>& tp) {
    return tp.has_value() ? nlohmann::json(cronkit::utils::FormatIso(*tp)) : nlohmann::json(nullptr);
}

nlohmann::json BuildJobJson(const cronkit::scheduler::JobInfo& info) {
    return {
        {"name", info.name.empty() ? nlohmann::json(nullptr) : nlohmann::json(info.name)},
        {"kind", cronkit::scheduler::ToString(info.kind)},
        {"trigger", info.trigger},
        {"next_fire", OptionalTime(info.next_fire)},
        {"remaining", info.remaining.has_value() ? nlohmann::json(*info.remaining) : nlohmann::json(nullptr)},
        {"fire_count", info.fire_count},
        {"skip_count", info.skip_count},
        {"in_flight", info.in_flight},
        {"concurrent", info.allow_concurrent},
        {"state", cronkit::scheduler::ToString(info.state)}
    };
}

nlohmann::json BuildStatusJson(const cronkit::scheduler::SchedulerStatus& status) {
    return {
        {"running", status.running},
        {"jobs", status.jobs},
        {"next_wake", OptionalTime(status.next_wake)},
        {"worker_threads", status.worker_threads},
        {"queued_runs", status.queued_runs}
    };
}

std::size_t RegisterDefinitions(cronkit::scheduler::Scheduler& scheduler,
                                const std::vector<cronkit::config::JobDefinition>& definitions) {
    std::size_t registered = 0;
    for (const auto& definition : definitions) {
        std::shared_ptr<cronkit::scheduler::Job> job = std::make_shared<MessageJob>(definition.message);
        try {
            if (!definition.at.has_value()) {
                scheduler.AddJobFromConfig(job, definition.config);
            } else if (definition.times > 1) {
                const auto period = cronkit::scheduler::ConfigPeriod(definition.config)
                                        .value_or(cronkit::scheduler::Duration(0));
                if (!scheduler.FireJobAt({}, job, definition.config, *definition.at, definition.times, period)) {
                    continue;
                }
            } else {
                scheduler.FireJobAt({}, job, definition.config, *definition.at);
            }
            ++registered;
        } catch (const cronkit::scheduler::InvalidArgumentError& ex) {
            std::cerr << "[cli] skipping job: " << ex.what() << std::endl;
        }
    }
    return registered;
}

int RunScheduler(const std::string& jobs_file_arg) {
    auto config = cronkit::config::LoadConfig();
    cronkit::utils::SetLogConfig({cronkit::utils::ParseLogLevel(config.scheduler.log_level)});

    const std::string jobs_file = jobs_file_arg.empty() ? config.jobs_file : jobs_file_arg;
    std::vector<cronkit::config::JobDefinition> definitions;
    if (!jobs_file.empty()) {
        try {
            definitions = cronkit::config::LoadJobDefinitions(jobs_file);
        } catch (const cronkit::scheduler::InvalidArgumentError& ex) {
            std::cout << ex.what() << std::endl;
            return 1;
        }
    }

    cronkit::scheduler::Scheduler scheduler(config.scheduler);
    const auto registered = RegisterDefinitions(scheduler, definitions);
    std::cout << "registered " << registered << " of " << definitions.size() << " jobs" << std::endl;

    httplib::Server http_server;
    std::thread http_thread;
    if (config.http.enabled) {
        http_server.Get("/jobs", [&scheduler](const httplib::Request&, httplib::Response& res) {
            nlohmann::json json = nlohmann::json::array();
            for (const auto& info : scheduler.ListJobs()) {
                json.push_back(BuildJobJson(info));
            }
            res.set_content(json.dump(2), "application/json");
        });
        http_server.Get("/status", [&scheduler](const httplib::Request&, httplib::Response& res) {
            res.set_content(BuildStatusJson(scheduler.GetStatus()).dump(2), "application/json");
        });
        const std::string host = config.http.host;
        const int port = config.http.port;
        http_thread = std::thread([&http_server, host, port]() {
            if (!http_server.listen(host, port)) {
                std::cerr << "[http] server failed to listen on " << host << ":" << port << std::endl;
            }
        });
    }

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    scheduler.Start();
    std::cout << "cronkit started. Press Ctrl+C to stop." << std::endl;
    while (g_signal == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (config.http.enabled) {
        http_server.stop();
    }
    if (http_thread.joinable()) {
        http_thread.join();
    }
    scheduler.Stop();
    return 0;
}

int PrintNextFireTimes(const std::string& expression, int count) {
    try {
        const auto trigger = cronkit::scheduler::Trigger::Cron(expression);
        auto reference = cronkit::utils::Now();
        for (int i = 0; i < count; ++i) {
            const auto next = trigger.NextCronMatch(reference);
            if (!next.has_value()) {
                std::cout << "(no further fire times)" << std::endl;
                break;
            }
            std::cout << cronkit::utils::FormatIso(*next) << std::endl;
            reference = *next;
        }
    } catch (const cronkit::scheduler::InvalidArgumentError& ex) {
        std::cout << ex.what() << std::endl;
        return 1;
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc >= 2 && std::string(argv[1]) == "run") {
        return RunScheduler(argc >= 3 ? argv[2] : "");
    }

    if (argc >= 3 && std::string(argv[1]) == "next") {
        int count = 5;
        if (argc >= 4) {
            try {
                count = std::stoi(argv[3]);
            } catch (const std::exception&) {
                std::cout << "count must be an integer" << std::endl;
                return 1;
            }
        }
        return PrintNextFireTimes(argv[2], count);
    }

    std::cout << "Usage: cronkit_cli run [jobs.json] | cronkit_cli next \"<expression>\" [count]" << std::endl;
    return 1;
}
