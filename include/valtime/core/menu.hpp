#pragma once

/**
 * @file menu.hpp
 * @brief Immutable menu graph: root plus one level of submenus
 *
 * The root lists submenu names. Each submenu carries an ActionKind that
 * decides what selecting one of its options does:
 *
 *   VoiceWheel{wheelKey}  drive the game's own voice wheel (wheel digit, line digit)
 *   Animation             play the named animation
 *   FreeText              send the option label as a chat message
 *
 * Options are 1-indexed for hotkeys. The graph is built once and never
 * changes; the state machine only holds pointers into it.
 */

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace valtime {

struct VoiceWheelAction {
    int wheelKey = 0;  ///< Digit that selects this category on the native wheel

    bool operator==(const VoiceWheelAction&) const = default;
};

struct AnimationAction {
    bool operator==(const AnimationAction&) const = default;
};

struct FreeTextAction {
    bool operator==(const FreeTextAction&) const = default;
};

using ActionKind = std::variant<VoiceWheelAction, AnimationAction, FreeTextAction>;

[[nodiscard]] const char* actionKindName(const ActionKind& kind);

struct MenuNode {
    std::string name;
    std::vector<std::string> options;
    std::optional<ActionKind> action;  ///< Empty for the root

    [[nodiscard]] bool isRoot() const { return !action.has_value(); }
    [[nodiscard]] size_t optionCount() const { return options.size(); }

    /// 1-based option label, nullopt if out of range
    [[nodiscard]] std::optional<std::string> option(size_t n) const;
};

class MenuGraph {
public:
    static constexpr const char* ROOT_NAME = "Main";

    /// @param rootOptions  Root labels, in hotkey order
    /// @param submenus     Submenus with an ActionKind each
    /// @throws std::invalid_argument if a submenu has no ActionKind or a name repeats
    MenuGraph(std::vector<std::string> rootOptions, std::vector<MenuNode> submenus);

    // Node pointers must stay valid for the graph's lifetime
    MenuGraph(const MenuGraph&) = delete;
    MenuGraph& operator=(const MenuGraph&) = delete;
    MenuGraph(MenuGraph&&) = default;
    MenuGraph& operator=(MenuGraph&&) = default;

    [[nodiscard]] const MenuNode& root() const { return nodes_.front(); }

    /// Submenu by name, nullptr if none
    [[nodiscard]] const MenuNode* find(std::string_view name) const;

    /// Submenu reached from root option n (1-based), nullptr if the option
    /// is out of range or does not name a submenu
    [[nodiscard]] const MenuNode* submenuAt(size_t n) const;

    [[nodiscard]] size_t submenuCount() const { return nodes_.size() - 1; }

private:
    std::vector<MenuNode> nodes_;  // [0] is the root
};

/// The stock catalog: Rocket League (free text), Animations, and the four
/// voice-wheel categories.
[[nodiscard]] MenuGraph buildDefaultMenu();

// View data for the host UI
[[nodiscard]] std::string headerTitle(const MenuNode& node);
[[nodiscard]] std::string footerHint(const MenuNode& node);

}  // namespace valtime
