#include "Config.h"
#include "Logger.h"
#include <algorithm>
#include <cctype>
#include <fstream>

namespace PinDrop {

    bool Config::loadFromFile(const std::string& path) {
        std::ifstream file(path);
        if (!file.is_open()) {
            return false;
        }
        size_t count = parse(file, path);
        Logger::instance().log(LogLevel::DEBUG, "Loaded " + std::to_string(count) + " settings from " + path, "Config");
        return true;
    }

    size_t Config::parse(std::istream& in, const std::string& origin) {
        auto& logger = Logger::instance();
        std::map<std::string, std::string> parsed;

        std::string line;
        size_t lineNumber = 0;
        while (std::getline(in, line)) {
            ++lineNumber;
            std::string text = trim(line);
            if (text.empty() || text[0] == '#') {
                continue;
            }

            size_t eq = text.find('=');
            std::string key = eq == std::string::npos ? "" : trim(text.substr(0, eq));
            if (key.empty()) {
                logger.log(LogLevel::WARN, origin + ":" + std::to_string(lineNumber) +
                           ": expected key=value, ignoring '" + text + "'", "Config");
                continue;
            }
            parsed[key] = trim(text.substr(eq + 1));
        }

        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& entry : parsed) {
            settings_[entry.first] = std::move(entry.second);
        }
        return parsed.size();
    }

    bool Config::hasKey(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return settings_.count(key) > 0;
    }

    std::vector<std::string> Config::keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        result.reserve(settings_.size());
        for (const auto& entry : settings_) {
            result.push_back(entry.first);
        }
        return result;
    }

    std::string Config::get(const std::string& key, const std::string& defaultValue) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = settings_.find(key);
        return it == settings_.end() ? defaultValue : it->second;
    }

    void Config::set(const std::string& key, const std::string& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        settings_[key] = value;
    }

    int Config::getInt(const std::string& key, int defaultValue) const {
        std::string text = get(key);
        if (text.empty()) {
            return defaultValue;
        }
        try {
            size_t used = 0;
            int value = std::stoi(text, &used);
            return used == text.size() ? value : defaultValue;
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    size_t Config::getSize(const std::string& key, size_t defaultValue) const {
        std::string text = get(key);
        // stoull accepts a leading '-' and wraps it
        if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
            return defaultValue;
        }
        try {
            size_t used = 0;
            unsigned long long value = std::stoull(text, &used);
            return used == text.size() ? static_cast<size_t>(value) : defaultValue;
        } catch (const std::exception&) {
            return defaultValue;
        }
    }

    bool Config::getBool(const std::string& key, bool defaultValue) const {
        std::string text = get(key);
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (text == "true" || text == "yes" || text == "on" || text == "1") return true;
        if (text == "false" || text == "no" || text == "off" || text == "0") return false;
        return defaultValue;
    }

    pd::Result<void> Config::validate(const std::unordered_map<std::string, Validator>& schema) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : settings_) {
            auto rule = schema.find(entry.first);
            if (rule == schema.end() || !rule->second) {
                continue;
            }
            if (!rule->second(entry.first, entry.second)) {
                return pd::Err(pd::ErrorCode::InvalidConfig,
                               "Invalid value for '" + entry.first + "': " + entry.second);
            }
        }
        return pd::Ok();
    }

    std::vector<std::string> Config::unknownKeys(const std::unordered_map<std::string, Validator>& schema) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> unknown;
        for (const auto& entry : settings_) {
            if (schema.find(entry.first) == schema.end()) {
                unknown.push_back(entry.first);
            }
        }
        return unknown;
    }

    std::string Config::trim(const std::string& value) {
        const char* blanks = " \t\r\n";
        auto first = value.find_first_not_of(blanks);
        if (first == std::string::npos) {
            return "";
        }
        auto last = value.find_last_not_of(blanks);
        return value.substr(first, last - first + 1);
    }

}
