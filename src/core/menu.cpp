#include "valtime/core/menu.hpp"

#include <cctype>
#include <set>
#include <stdexcept>

namespace valtime {

const char* actionKindName(const ActionKind& kind) {
    if (std::holds_alternative<VoiceWheelAction>(kind)) return "VoiceWheel";
    if (std::holds_alternative<AnimationAction>(kind)) return "Animation";
    return "FreeText";
}

std::optional<std::string> MenuNode::option(size_t n) const {
    if (n < 1 || n > options.size()) {
        return std::nullopt;
    }
    return options[n - 1];
}

MenuGraph::MenuGraph(std::vector<std::string> rootOptions, std::vector<MenuNode> submenus) {
    nodes_.reserve(submenus.size() + 1);

    MenuNode root;
    root.name = ROOT_NAME;
    root.options = std::move(rootOptions);
    nodes_.push_back(std::move(root));

    std::set<std::string> seen;
    for (auto& node : submenus) {
        if (!node.action) {
            throw std::invalid_argument("MenuGraph: submenu '" + node.name + "' has no action kind");
        }
        if (node.name == ROOT_NAME || !seen.insert(node.name).second) {
            throw std::invalid_argument("MenuGraph: duplicate menu name '" + node.name + "'");
        }
        nodes_.push_back(std::move(node));
    }
}

const MenuNode* MenuGraph::find(std::string_view name) const {
    for (size_t i = 1; i < nodes_.size(); ++i) {
        if (nodes_[i].name == name) {
            return &nodes_[i];
        }
    }
    return nullptr;
}

const MenuNode* MenuGraph::submenuAt(size_t n) const {
    auto label = root().option(n);
    if (!label) {
        return nullptr;
    }
    return find(*label);
}

// ============================================================================
// Default catalog
// ============================================================================

MenuGraph buildDefaultMenu() {
    std::vector<std::string> rootOptions = {
        "Rocket League", "Animations", "Combat", "Tactics", "Social", "Strategy",
    };

    std::vector<MenuNode> submenus;
    submenus.push_back({"Rocket League",
                        {"What a save!", "Nice shot!", "Thanks!", "Well played!"},
                        FreeTextAction{}});
    submenus.push_back({"Animations", {"Truck"}, AnimationAction{}});
    submenus.push_back({"Combat",
                        {"Need Support", "Caution here!", "Need Healing!", "On My Way", "Ultimate Status"},
                        VoiceWheelAction{1}});
    submenus.push_back({"Tactics",
                        {"I'll Take Point", "Let's rush them!", "Be Quiet", "Fall Back!", "Play For Picks"},
                        VoiceWheelAction{2}});
    submenus.push_back({"Social",
                        {"Thanks", "Commend", "Yes", "No", "Sorry", "Hello"},
                        VoiceWheelAction{3}});
    submenus.push_back({"Strategy",
                        {"Going A", "Going B", "Going C", "Going Mid"},
                        VoiceWheelAction{4}});

    return MenuGraph(std::move(rootOptions), std::move(submenus));
}

std::string headerTitle(const MenuNode& node) {
    if (node.isRoot()) {
        return "COMMUNICATION";
    }
    std::string title = node.name;
    for (char& c : title) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return title;
}

std::string footerHint(const MenuNode& node) {
    return node.isRoot() ? "Close" : "Back";
}

}  // namespace valtime
