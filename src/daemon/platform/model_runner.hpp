#pragma once

#include <expected>
#include <filesystem>
#include <stop_token>
#include <string>

struct RunnerParams {
    std::string language = "auto";
    int threads = 4;
};

// On-device speech model runtime. Not reentrant: callers must confine every
// call to a single thread.
class ModelRunner {
public:
    virtual ~ModelRunner() = default;

    // Loads (or verifies) the model. Error text is shown to the user.
    virtual std::expected<void, std::string> load(const std::filesystem::path& model) = 0;
    virtual const std::filesystem::path& loaded_model() const = 0;

    struct Failure {
        bool cancelled = false;
        std::string message;
    };

    virtual std::expected<std::string, Failure> run(const std::filesystem::path& wav,
                                                    const RunnerParams& params,
                                                    std::stop_token stop) = 0;
};
