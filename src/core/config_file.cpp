#include "valtime/core/config_file.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace valtime {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

bool ConfigFile::load(const std::filesystem::path& path) {
    path_ = path;
    lines_.clear();
    keyToLine_.clear();

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    parse(buffer.str());
    return true;
}

void ConfigFile::parse(std::string_view content) {
    lines_.clear();
    keyToLine_.clear();

    size_t pos = 0;
    while (pos < content.size()) {
        size_t lineEnd = content.find('\n', pos);
        std::string_view text;
        if (lineEnd == std::string_view::npos) {
            text = content.substr(pos);
            pos = content.size();
        } else {
            text = content.substr(pos, lineEnd - pos);
            pos = lineEnd + 1;
        }
        if (!text.empty() && text.back() == '\r') {
            text.remove_suffix(1);
        }

        Line line = parseLine(text);
        if (line.isKeyValue) {
            // Later lines override earlier ones for the same key
            keyToLine_[line.key] = lines_.size();
        }
        lines_.push_back(std::move(line));
    }
}

ConfigFile::Line ConfigFile::parseLine(std::string_view text) {
    Line line;
    line.content = std::string(text);

    // Comments, blanks and indented lines carry no key
    if (text.empty() || text[0] == '#' || std::isspace(static_cast<unsigned char>(text[0]))) {
        return line;
    }

    auto colonPos = text.find(':');
    if (colonPos == std::string_view::npos) {
        return line;
    }

    std::string_view key = trim(text.substr(0, colonPos));
    if (key.empty()) {
        return line;
    }

    size_t valueStart = colonPos + 1;
    while (valueStart < text.size() && std::isspace(static_cast<unsigned char>(text[valueStart]))) {
        ++valueStart;
    }
    size_t valueEnd = text.size();
    while (valueEnd > valueStart && std::isspace(static_cast<unsigned char>(text[valueEnd - 1]))) {
        --valueEnd;
    }

    line.key = std::string(key);
    line.valueStart = valueStart;
    line.valueEnd = valueEnd;
    line.isKeyValue = true;
    return line;
}

bool ConfigFile::save() {
    if (path_.empty()) {
        return false;
    }

    auto parent = path_.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }

    std::ofstream file(path_, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    if (lines_.empty() && !header_.empty()) {
        file << header_;
        if (header_.back() != '\n') {
            file << '\n';
        }
    }

    for (const auto& line : lines_) {
        file << line.content << '\n';
    }

    return file.good();
}

// ============================================================================
// Read
// ============================================================================

const ConfigFile::Line* ConfigFile::findLine(std::string_view key) const {
    auto it = keyToLine_.find(std::string(key));
    if (it == keyToLine_.end()) {
        return nullptr;
    }
    return &lines_[it->second];
}

bool ConfigFile::has(std::string_view key) const {
    return findLine(key) != nullptr;
}

std::optional<std::string> ConfigFile::raw(std::string_view key) const {
    const Line* line = findLine(key);
    if (!line) {
        return std::nullopt;
    }
    return line->content.substr(line->valueStart, line->valueEnd - line->valueStart);
}

std::string ConfigFile::getString(std::string_view key, std::string_view defaultVal) const {
    auto value = raw(key);
    return value ? *value : std::string(defaultVal);
}

std::optional<int64_t> ConfigFile::tryInt(std::string_view key) const {
    auto value = raw(key);
    if (!value || value->empty()) {
        return std::nullopt;
    }

    const char* begin = value->c_str();
    char* end = nullptr;
    long long parsed;
    if (value->size() > 2 && (*value)[0] == '0' && ((*value)[1] == 'x' || (*value)[1] == 'X')) {
        parsed = std::strtoll(begin, &end, 16);
    } else {
        parsed = std::strtoll(begin, &end, 10);
    }

    if (end != begin + value->size()) {
        return std::nullopt;
    }
    return static_cast<int64_t>(parsed);
}

int64_t ConfigFile::getInt(std::string_view key, int64_t defaultVal) const {
    return tryInt(key).value_or(defaultVal);
}

bool ConfigFile::getBool(std::string_view key, bool defaultVal) const {
    auto value = raw(key);
    if (!value) {
        return defaultVal;
    }
    if (*value == "true" || *value == "yes" || *value == "1") {
        return true;
    }
    if (*value == "false" || *value == "no" || *value == "0") {
        return false;
    }
    return defaultVal;
}

// ============================================================================
// Write
// ============================================================================

void ConfigFile::setImpl(std::string_view key, const std::string& formattedValue) {
    auto it = keyToLine_.find(std::string(key));

    if (it != keyToLine_.end()) {
        // Replace just the value, keep any trailing text after it
        auto& line = lines_[it->second];
        std::string tail = line.content.substr(line.valueEnd);
        line.content = line.content.substr(0, line.valueStart) + formattedValue + tail;
        line.valueEnd = line.valueStart + formattedValue.size();
    } else {
        Line newLine;
        newLine.key = std::string(key);
        newLine.content = std::string(key) + ": " + formattedValue;
        newLine.valueStart = key.size() + 2;
        newLine.valueEnd = newLine.content.size();
        newLine.isKeyValue = true;

        keyToLine_[newLine.key] = lines_.size();
        lines_.push_back(std::move(newLine));
    }
}

void ConfigFile::set(std::string_view key, std::string_view value) {
    setImpl(key, std::string(value));
}

void ConfigFile::set(std::string_view key, int64_t value) {
    setImpl(key, std::to_string(value));
}

void ConfigFile::set(std::string_view key, bool value) {
    setImpl(key, value ? "true" : "false");
}

}  // namespace valtime
