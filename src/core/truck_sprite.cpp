#include "valtime/core/truck_sprite.hpp"

namespace valtime {

const Sprite& truckSprite() {
    static const Sprite sprite{{
        U"▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒",
        U"▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒",
        U"▛▀▀▀▀▀▀▀▀▀▀▀▀▀▀▀▀▀▀▀█▒▒▒▒▒",
        U"▌▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒█▄▄▄▒▒",
        U"▌▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒█▒▒▐▒▒",
        U"▌▒▒▒▀▀▜▒▀▀▜▒▛▜▒▛▜▒▒▒█║█▐▒▒",
        U"▌▄▄▒▄▄▟▒▄▄▟║▙▟▒▙▟▒▒▒█║▌▐▒▒",
        U"▌▒▒▒▌▒▒▒▌▒▒▒▌▌▒▌▌▒▒▒█████▒",
        U"▌▒▒▒▙▄▄▒▙▄▄▒▌▙▒▌▙▒▒▒█████▒",
        U"▌▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒▒█████▒",
        U"▙▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄▄█████▒",
        U"▒▒▛▜▛▜▒▒▒▒▒▒▒▒▒▒▛▜▛▜▒▒▒▒▒▒",
        U"▒▒▙▟▙▟▒▒▒▒▒▒▒▒▒▒▙▟▙▟▒▒▒▒▒▒",
    }};
    return sprite;
}

}  // namespace valtime
