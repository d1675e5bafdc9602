#include "tagreg/config_file.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tagreg {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

}  // anonymous namespace

bool ConfigFile::load(const std::filesystem::path& path) {
    path_ = path;
    lines_.clear();
    keyToLine_.clear();
    values_.clear();
    loaded_ = false;
    dirty_ = false;

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return false;
    }
    parseLines(buffer.str());

    loaded_ = true;
    return true;
}

void ConfigFile::parseLines(std::string_view content) {
    size_t pos = 0;
    size_t lineNum = 0;

    while (pos < content.size()) {
        // Find end of line
        size_t lineEnd = content.find('\n', pos);
        std::string_view lineView;
        if (lineEnd == std::string_view::npos) {
            lineView = content.substr(pos);
            pos = content.size();
        } else {
            lineView = content.substr(pos, lineEnd - pos);
            pos = lineEnd + 1;
        }

        // Remove trailing \r
        if (!lineView.empty() && lineView.back() == '\r') {
            lineView.remove_suffix(1);
        }

        Line line;
        line.content = std::string(lineView);

        // Key-value lines start in column 0 and are not comments
        if (!lineView.empty() && lineView[0] != '#' &&
            !std::isspace(static_cast<unsigned char>(lineView[0]))) {

            auto colonPos = lineView.find(':');
            if (colonPos != std::string_view::npos) {
                std::string key(trim(lineView.substr(0, colonPos)));

                size_t valueStart = colonPos + 1;
                while (valueStart < lineView.size() &&
                       std::isspace(static_cast<unsigned char>(lineView[valueStart]))) {
                    valueStart++;
                }

                line.key = key;
                line.valueStart = valueStart;
                line.isKeyValue = true;

                // Later lines override earlier for same key
                keyToLine_[key] = lineNum;
                values_[key] = std::string(trim(lineView.substr(valueStart)));
            }
        }

        lines_.push_back(std::move(line));
        lineNum++;
    }
}

bool ConfigFile::save() {
    return saveAs(path_);
}

bool ConfigFile::saveAs(const std::filesystem::path& path) {
    auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        return false;
    }

    // A file that was never loaded gets the header first; after this save the
    // header is ordinary file content
    std::vector<Line> headerLines;
    if (!loaded_ && !header_.empty()) {
        std::string_view rest = header_;
        if (rest.back() == '\n') rest.remove_suffix(1);
        while (true) {
            auto nl = rest.find('\n');
            headerLines.push_back(Line{std::string(rest.substr(0, nl))});
            if (nl == std::string_view::npos) break;
            rest.remove_prefix(nl + 1);
        }
    }

    for (const auto& line : headerLines) {
        file << line.content << '\n';
    }
    for (const auto& line : lines_) {
        file << line.content << '\n';
    }

    if (!file.good()) {
        return false;
    }

    if (!headerLines.empty()) {
        for (auto& [key, index] : keyToLine_) {
            index += headerLines.size();
        }
        lines_.insert(lines_.begin(), headerLines.begin(), headerLines.end());
        header_.clear();
    }

    path_ = path;
    loaded_ = true;
    dirty_ = false;
    return true;
}

bool ConfigFile::has(std::string_view key) const {
    return keyToLine_.find(std::string(key)) != keyToLine_.end();
}

std::optional<std::string> ConfigFile::raw(std::string_view key) const {
    auto it = values_.find(std::string(key));
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string ConfigFile::getString(std::string_view key, std::string_view defaultVal) const {
    auto value = raw(key);
    if (!value || value->empty()) {
        return std::string(defaultVal);
    }
    return *value;
}

int64_t ConfigFile::getInt(std::string_view key, int64_t defaultVal) const {
    auto value = raw(key);
    if (!value) return defaultVal;
    return parseInt(*value).value_or(defaultVal);
}

bool ConfigFile::getBool(std::string_view key, bool defaultVal) const {
    auto value = raw(key);
    if (!value) return defaultVal;
    return parseBool(*value).value_or(defaultVal);
}

std::optional<int64_t> ConfigFile::parseInt(std::string_view text) {
    if (text.empty()) return std::nullopt;

    std::string s(text);
    char* end = nullptr;
    errno = 0;
    long long v;

    // Check for hex prefix
    if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        v = std::strtoll(s.c_str(), &end, 16);
    } else {
        v = std::strtoll(s.c_str(), &end, 10);
    }

    if (end == s.c_str() || *end != '\0' || errno == ERANGE) {
        return std::nullopt;
    }
    return static_cast<int64_t>(v);
}

std::optional<bool> ConfigFile::parseBool(std::string_view text) {
    if (text == "true" || text == "yes" || text == "on") return true;
    if (text == "false" || text == "no" || text == "off") return false;
    return std::nullopt;
}

int ConfigFile::findLine(std::string_view key) const {
    auto it = keyToLine_.find(std::string(key));
    if (it != keyToLine_.end()) {
        return static_cast<int>(it->second);
    }
    return -1;
}

void ConfigFile::setImpl(std::string_view key, const std::string& formattedValue) {
    int lineIdx = findLine(key);

    if (lineIdx >= 0) {
        // Update existing line - replace just the value portion
        auto& line = lines_[static_cast<size_t>(lineIdx)];
        line.content = line.content.substr(0, line.valueStart) + formattedValue;
    } else {
        Line newLine;
        newLine.key = std::string(key);
        newLine.content = std::string(key) + ": " + formattedValue;
        newLine.valueStart = key.size() + 2;  // "key: " length
        newLine.isKeyValue = true;

        keyToLine_[std::string(key)] = lines_.size();
        lines_.push_back(std::move(newLine));
    }

    values_[std::string(key)] = formattedValue;
    dirty_ = true;
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

void ConfigFile::remove(std::string_view key) {
    int lineIdx = findLine(key);
    if (lineIdx >= 0) {
        // Comment out the line instead of removing it
        auto& line = lines_[static_cast<size_t>(lineIdx)];
        line.content = "# " + line.content;
        line.isKeyValue = false;

        keyToLine_.erase(std::string(key));
        values_.erase(std::string(key));
        dirty_ = true;
    }
}

}  // namespace tagreg
