#pragma once

#include "Result.h"
#include <functional>
#include <istream>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace PinDrop {

    /**
     * @brief Flat key=value settings read from pindrop.conf
     *
     * Format: one `key=value` per line. Lines starting with `#` are
     * comments; whitespace around keys and values is dropped. A line
     * without '=' is skipped with a warning naming its origin and line.
     * When a key repeats, the last line wins.
     */
    class Config {
    public:
        using Validator = std::function<bool(const std::string& key, const std::string& value)>;

        Config() = default;

        /// False when the file cannot be opened
        bool loadFromFile(const std::string& path);

        /// Parses settings from a stream; origin only labels warnings. Returns the number of settings read.
        size_t parse(std::istream& in, const std::string& origin);

        bool hasKey(const std::string& key) const;
        std::vector<std::string> keys() const;

        std::string get(const std::string& key, const std::string& defaultValue = "") const;
        void set(const std::string& key, const std::string& value);

        // Typed getters return defaultValue for missing or unparsable values
        int getInt(const std::string& key, int defaultValue = 0) const;
        size_t getSize(const std::string& key, size_t defaultValue = 0) const;
        bool getBool(const std::string& key, bool defaultValue = false) const;

        /**
         * @brief Check present keys against their validators
         *
         * Keys are checked in sorted order and the first failure is
         * returned as InvalidConfig naming the key and value.
         */
        pd::Result<void> validate(const std::unordered_map<std::string, Validator>& schema) const;

        /// Keys present here that the schema does not know
        std::vector<std::string> unknownKeys(const std::unordered_map<std::string, Validator>& schema) const;

    private:
        std::map<std::string, std::string> settings_;
        mutable std::mutex mutex_;

        static std::string trim(const std::string& value);
    };

}
