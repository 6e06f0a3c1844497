// Engine-level application lifecycle interface.
#pragma once

namespace Starfall {

class Application;
struct TimeStep;

class ApplicationListener {
public:
    virtual ~ApplicationListener() = default;

    virtual bool onInitialize(Application& app) = 0;
    virtual void onUpdate(Application& app, const TimeStep& step) = 0;
    virtual void onShutdown() = 0;
};

}  // namespace Starfall
