// Ownership side shared by actors and the bullets they fire.
#pragma once

namespace Shooter {

enum class Side { Player, Enemy };

struct Faction {
    Side side{Side::Enemy};
};

}  // namespace Shooter
