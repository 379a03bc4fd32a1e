#include "valtime/core/animation_file.hpp"
#include "valtime/core/errors.hpp"
#include "valtime/core/frame_list.hpp"
#include "valtime/core/text.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>

namespace valtime {

using json = nlohmann::json;

std::optional<AnimationFile> parseAnimationFile(std::string_view text) {
    json root = json::parse(text.begin(), text.end(), nullptr, false);
    if (root.is_discarded() || !root.is_object()) {
        return std::nullopt;
    }

    AnimationFile file;

    auto framesIt = root.find("frames");
    if (framesIt != root.end() && framesIt->is_array()) {
        size_t index = 0;
        for (const auto& entry : *framesIt) {
            if (entry.is_string()) {
                file.frames.push_back(FrameList::parseFrameText(entry.get<std::string>()));
            } else if (entry.is_array()) {
                Frame frame;
                for (const auto& line : entry) {
                    if (line.is_string()) {
                        frame.lines.push_back(utf8ToUtf32(line.get<std::string>()));
                    } else {
                        std::cerr << "[AnimationFile] WARNING: frame " << index
                                  << " has a non-text line, skipped\n";
                    }
                }
                file.frames.push_back(std::move(frame));
            } else {
                std::cerr << "[AnimationFile] WARNING: frame " << index
                          << " is neither text nor a list of lines, skipped\n";
            }
            ++index;
        }
    }

    auto delayIt = root.find("delay");
    if (delayIt != root.end()) {
        if (delayIt->is_number() && isValidFrameDelay(Seconds(delayIt->get<double>()))) {
            file.delay = Seconds(delayIt->get<double>());
        } else {
            std::cerr << "[AnimationFile] WARNING: invalid delay, using "
                      << file.delay.count() << "s\n";
        }
    }

    return file;
}

std::string formatAnimationFile(const AnimationFile& file) {
    json frames = json::array();
    for (const auto& frame : file.frames) {
        json lines = json::array();
        for (const auto& line : frame.lines) {
            lines.push_back(utf32ToUtf8(line));
        }
        frames.push_back(std::move(lines));
    }

    json root;
    root["frames"] = std::move(frames);
    root["delay"] = file.delay.count();
    return root.dump(2);
}

std::optional<AnimationFile> loadAnimationFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        std::cerr << "[AnimationFile] Cannot open file: " << path.string() << '\n';
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << in.rdbuf();

    auto file = parseAnimationFile(buffer.str());
    if (!file) {
        std::cerr << "[AnimationFile] Not an animation file: " << path.string() << '\n';
    }
    return file;
}

void saveAnimationFile(const std::filesystem::path& path, const AnimationFile& file) {
    std::error_code ec;
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            throw PersistenceError("Failed to create directory " + parent.string() +
                                   ": " + ec.message());
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw PersistenceError("Failed to open file for writing: " + path.string());
    }

    out << formatAnimationFile(file) << '\n';
    if (!out.good()) {
        throw PersistenceError("Failed to write animation file: " + path.string());
    }
}

}  // namespace valtime
