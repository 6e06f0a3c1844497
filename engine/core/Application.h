// Core frame loop orchestrator.
#pragma once

#include <string>

#include "ApplicationListener.h"
#include "Time.h"

namespace Starfall {

struct ApplicationConfig {
    double targetFps{60.0};
    unsigned long maxFrames{0};  // 0 runs until quit is requested
    bool pace{true};             // sleep to hold the target frame rate
    bool fixedStep{false};       // feed 1/targetFps instead of measured wall time
};

class Application {
public:
    Application(ApplicationListener& listener, ApplicationConfig config = {});
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    bool initialize();
    void run();
    void requestQuit(const std::string& reason);

    bool running() const { return running_; }
    const TimeStep& timeStep() const { return timeStep_; }
    const ApplicationConfig& config() const { return config_; }

private:
    ApplicationListener& listener_;
    ApplicationConfig config_;
    bool initialized_{false};
    bool running_{false};
    TimeStep timeStep_{};
};

}  // namespace Starfall
