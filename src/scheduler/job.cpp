#include "scheduler/job.hpp"

#include <cmath>
#include <type_traits>
#include <utility>

#include "scheduler/errors.hpp"

namespace cronkit::scheduler {
namespace {

class FunctionJob : public Job {
public:
    explicit FunctionJob(std::function<void(const JobContext&)> fn)
        : fn_(std::move(fn)) {}

    void Execute(const JobContext& context) override {
        fn_(context);
    }

private:
    std::function<void(const JobContext&)> fn_;
};

}  // namespace

std::shared_ptr<Job> MakeJob(std::function<void(const JobContext&)> fn) {
    if (!fn) {
        return nullptr;
    }
    return std::make_shared<FunctionJob>(std::move(fn));
}

void ValidateTask(const JobTask& task) {
    if (const auto* job = std::get_if<std::shared_ptr<Job>>(&task)) {
        if (!*job) {
            throw InvalidArgumentError("job is neither a Job nor a Runnable: null Job");
        }
        return;
    }
    if (!std::get<Runnable>(task)) {
        throw InvalidArgumentError("job is neither a Job nor a Runnable: empty Runnable");
    }
}

void ValidateConfig(const JobConfig& config) {
    if (config.is_null()) {
        return;
    }
    if (!config.is_object()) {
        throw InvalidArgumentError("job config must be an object, got " + std::string(config.type_name()));
    }
    for (const auto& [key, value] : config.items()) {
        if (value.is_object() || value.is_array() || value.is_binary()) {
            throw InvalidArgumentError("job config value for '" + key + "' must be a scalar, got " +
                                       std::string(value.type_name()));
        }
    }
}

std::optional<Duration> ConfigPeriod(const JobConfig& config) {
    if (!config.is_object()) {
        return std::nullopt;
    }
    auto it = config.find(kPropertyPeriod);
    if (it == config.end() || !it->is_number()) {
        return std::nullopt;
    }
    return Duration(std::llround(it->get<double>() * 1000.0));
}

void RunTask(const JobTask& task, const JobContext& context) {
    std::visit([&context](const auto& target) {
        using T = std::decay_t<decltype(target)>;
        if constexpr (std::is_same_v<T, std::shared_ptr<Job>>) {
            target->Execute(context);
        } else {
            target();
        }
    }, task);
}

}  // namespace cronkit::scheduler
