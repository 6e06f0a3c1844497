// Time structures used by the main loop.
#pragma once

namespace Starfall {

struct TimeStep {
    double deltaSeconds{0.0};
    double elapsedSeconds{0.0};
    unsigned long frame{0};
};

}  // namespace Starfall
