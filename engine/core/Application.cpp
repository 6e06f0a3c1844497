#include "Application.h"

#include <chrono>
#include <thread>

#include "Logger.h"

namespace Starfall {

Application::Application(ApplicationListener& listener, ApplicationConfig config)
    : listener_(listener), config_(config) {}

Application::~Application() {
    if (initialized_) {
        listener_.onShutdown();
    }
}

bool Application::initialize() {
    if (config_.targetFps <= 0.0) {
        logError("Application requires a positive target frame rate.");
        return false;
    }
    initialized_ = true;
    running_ = listener_.onInitialize(*this);
    return running_;
}

void Application::run() {
    using clock = std::chrono::steady_clock;
    const double targetDelta = 1.0 / config_.targetFps;

    auto last = clock::now();
    while (running_) {
        auto now = clock::now();
        std::chrono::duration<double> dt = now - last;
        last = now;

        timeStep_.deltaSeconds = config_.fixedStep ? targetDelta : dt.count();
        timeStep_.elapsedSeconds += timeStep_.deltaSeconds;
        ++timeStep_.frame;

        listener_.onUpdate(*this, timeStep_);

        if (config_.maxFrames != 0 && timeStep_.frame >= config_.maxFrames) {
            requestQuit("frame limit reached");
        }

        if (config_.pace) {
            std::chrono::duration<double> spent = clock::now() - now;
            if (spent.count() < targetDelta) {
                std::this_thread::sleep_for(std::chrono::duration<double>(targetDelta - spent.count()));
            }
        }
    }

    logInfo("Application loop exited after " + std::to_string(timeStep_.frame) + " frames.");
}

void Application::requestQuit(const std::string& reason) {
    if (!running_) {
        return;
    }
    running_ = false;
    logInfo("Shutdown requested: " + reason);
}

}  // namespace Starfall
