// Fatal invariant violations raised by gameplay passes.
#pragma once

#include <stdexcept>
#include <string>

namespace Starfall {

// Signals corrupted world setup (e.g. a missing or duplicated singleton actor).
// Not recoverable within the frame that raised it.
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

}  // namespace Starfall
