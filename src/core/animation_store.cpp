#include "valtime/core/animation_store.hpp"
#include "valtime/core/errors.hpp"
#include "valtime/core/frame_generator.hpp"
#include "valtime/core/truck_sprite.hpp"

#include <nlohmann/json.hpp>

#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <sstream>
#include <stdexcept>

namespace valtime {

using json = nlohmann::json;

namespace {

constexpr const char* KEY_ANIMATIONS = "animations";
constexpr const char* KEY_SKIP_FRAMES = "skip_frames";
constexpr const char* KEY_FRAME_DELAY = "frame_delay";

/// Integer stride in [1, INT_MAX], or an integral float in the same range
std::optional<int> readStride(const json& value) {
    constexpr auto maxStride = std::numeric_limits<int>::max();
    if (value.is_number_unsigned()) {
        auto v = value.get<uint64_t>();
        if (v >= 1 && v <= static_cast<uint64_t>(maxStride)) {
            return static_cast<int>(v);
        }
    } else if (value.is_number_integer()) {
        auto v = value.get<int64_t>();
        if (v >= 1 && v <= maxStride) {
            return static_cast<int>(v);
        }
    } else if (value.is_number_float()) {
        double v = value.get<double>();
        if (std::isfinite(v) && v >= 1.0 && v <= static_cast<double>(maxStride) &&
            std::floor(v) == v) {
            return static_cast<int>(v);
        }
    }
    return std::nullopt;
}

AnimationSettings parseEntry(const std::string& name, const json& entry,
                             AnimationSettings settings) {
    auto skipIt = entry.find(KEY_SKIP_FRAMES);
    if (skipIt != entry.end()) {
        if (auto stride = readStride(*skipIt)) {
            settings.skipStride = *stride;
        } else {
            std::cerr << "[AnimationStore] WARNING: '" << name << "' has invalid "
                      << KEY_SKIP_FRAMES << ", using " << settings.skipStride << '\n';
        }
    }

    auto delayIt = entry.find(KEY_FRAME_DELAY);
    if (delayIt != entry.end()) {
        if (delayIt->is_number() && isValidFrameDelay(Seconds(delayIt->get<double>()))) {
            settings.frameDelay = Seconds(delayIt->get<double>());
        } else {
            std::cerr << "[AnimationStore] WARNING: '" << name << "' has invalid "
                      << KEY_FRAME_DELAY << ", using " << settings.frameDelay.count() << "s\n";
        }
    }

    return settings;
}

}  // namespace

AnimationStore::AnimationStore(std::filesystem::path configPath,
                               size_t screenWidth, char32_t background)
    : configPath_(std::move(configPath))
    , screenWidth_(screenWidth)
    , background_(background)
{
    installBuiltins();
    resetConfigToDefaults();
}

void AnimationStore::installBuiltins() {
    FrameGenerator generator(truckSprite(), screenWidth_, background_);
    Entry entry;
    entry.frames = std::make_shared<const FrameSequence>(generator.generateAll());
    animations_[std::string(TRUCK_ANIMATION_NAME)] = std::move(entry);
}

void AnimationStore::resetConfigToDefaults() {
    config_ = defaultsLocked();
}

std::map<std::string, AnimationSettings> AnimationStore::defaultsLocked() const {
    std::map<std::string, AnimationSettings> defaults;
    for (const auto& [name, entry] : animations_) {
        defaults[name] = entry.defaults;
    }
    return defaults;
}

bool AnimationStore::load() {
    std::unique_lock lock(mutex_);

    std::ifstream in(configPath_, std::ios::binary);
    if (!in.is_open()) {
        resetConfigToDefaults();
        return false;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    try {
        config_ = parseConfig(buffer.str(), defaultsLocked());
    } catch (const ConfigLoadError& e) {
        std::cerr << "[AnimationStore] WARNING: " << configPath_.string() << ": " << e.what()
                  << ", using defaults\n";
        resetConfigToDefaults();
        return false;
    }

    return true;
}

void AnimationStore::save(const std::string& name, int skipStride, Seconds frameDelay) {
    if (skipStride < 1) {
        throw std::invalid_argument("skip stride must be at least 1");
    }
    if (!isValidFrameDelay(frameDelay)) {
        throw std::invalid_argument("frame delay must be in (0, 60] seconds");
    }

    std::unique_lock lock(mutex_);
    config_[name] = AnimationSettings{skipStride, frameDelay};
    writeSnapshotLocked();
}

void AnimationStore::writeSnapshotLocked() const {
    std::error_code ec;
    auto parent = configPath_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw PersistenceError("Failed to create directory " + parent.string() +
                                   ": " + ec.message());
        }
    }

    std::ofstream out(configPath_, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw PersistenceError("Failed to open config for writing: " + configPath_.string());
    }

    out << formatConfig(config_) << '\n';
    if (!out.good()) {
        throw PersistenceError("Failed to write config: " + configPath_.string());
    }
}

Animation AnimationStore::get(const std::string& name) const {
    std::shared_lock lock(mutex_);

    auto it = animations_.find(name);
    if (it == animations_.end()) {
        throw NotFoundError("Unknown animation: " + name);
    }

    Animation animation;
    animation.name = name;
    animation.frames = it->second.frames;
    animation.settings = resolveLocked(name);
    return animation;
}

bool AnimationStore::has(std::string_view name) const {
    std::shared_lock lock(mutex_);
    return animations_.find(name) != animations_.end();
}

std::vector<std::string> AnimationStore::names() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(animations_.size());
    for (const auto& [name, entry] : animations_) {
        result.push_back(name);
    }
    return result;
}

std::vector<std::string> AnimationStore::configuredNames() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> result;
    result.reserve(config_.size());
    for (const auto& [name, settings] : config_) {
        result.push_back(name);
    }
    return result;
}

AnimationSettings AnimationStore::settings(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return resolveLocked(name);
}

AnimationSettings AnimationStore::resolveLocked(const std::string& name) const {
    auto configIt = config_.find(name);
    if (configIt != config_.end()) {
        return configIt->second;
    }
    auto animIt = animations_.find(name);
    if (animIt != animations_.end()) {
        return animIt->second.defaults;
    }
    return AnimationSettings{};
}

void AnimationStore::addAnimation(const std::string& name, FrameSequence frames,
                                  std::optional<AnimationSettings> defaults) {
    std::unique_lock lock(mutex_);
    Entry entry;
    entry.frames = std::make_shared<const FrameSequence>(std::move(frames));
    if (defaults) {
        entry.defaults = *defaults;
    }
    animations_[name] = std::move(entry);
}

bool AnimationStore::importAnimation(const std::string& name, const std::filesystem::path& path) {
    auto file = loadAnimationFile(path);
    if (!file) {
        return false;
    }

    AnimationSettings defaults;
    defaults.frameDelay = file->delay;
    addAnimation(name, std::move(file->frames), defaults);

    std::cout << "[AnimationStore] Imported '" << name << "' from " << path.string() << '\n';
    return true;
}

void AnimationStore::exportAnimation(const std::string& name,
                                     const std::filesystem::path& path) const {
    Animation animation = get(name);

    AnimationFile file;
    file.frames = *animation.frames;
    file.delay = animation.settings.frameDelay;
    saveAnimationFile(path, file);
}

std::map<std::string, AnimationSettings>
AnimationStore::parseConfig(std::string_view text,
                            const std::map<std::string, AnimationSettings>& defaults) {
    json root = json::parse(text.begin(), text.end(), nullptr, false);
    if (root.is_discarded()) {
        throw ConfigLoadError("config is not valid JSON");
    }
    if (!root.is_object()) {
        throw ConfigLoadError("config root is not an object");
    }

    // Accept both {"animations": {...}} and the bare mapping
    const json* table = &root;
    auto animationsIt = root.find(KEY_ANIMATIONS);
    if (animationsIt != root.end()) {
        if (!animationsIt->is_object()) {
            throw ConfigLoadError("'animations' is not an object");
        }
        table = &*animationsIt;
    }

    std::map<std::string, AnimationSettings> config = defaults;
    for (auto it = table->begin(); it != table->end(); ++it) {
        if (!it.value().is_object()) {
            std::cerr << "[AnimationStore] WARNING: entry '" << it.key()
                      << "' is not an object, skipped\n";
            continue;
        }

        AnimationSettings base;
        auto defIt = defaults.find(it.key());
        if (defIt != defaults.end()) {
            base = defIt->second;
        }
        config[it.key()] = parseEntry(it.key(), it.value(), base);
    }

    return config;
}

std::string AnimationStore::formatConfig(const std::map<std::string, AnimationSettings>& config) {
    json table = json::object();
    for (const auto& [name, settings] : config) {
        table[name] = {
            {KEY_SKIP_FRAMES, settings.skipStride},
            {KEY_FRAME_DELAY, settings.frameDelay.count()},
        };
    }

    json root;
    root[KEY_ANIMATIONS] = std::move(table);
    return root.dump(2);
}

}  // namespace valtime
