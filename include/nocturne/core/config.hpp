#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>
#include <cstdint>
#include <type_traits>

#include <nocturne/core/error.hpp>

namespace nocturne::core {

// Forward declarations
class ConfigNode;
using ConfigNodePtr = std::shared_ptr<ConfigNode>;

struct ConfigArray;

// Tipe nilai yang didukung dalam konfigurasi
using ConfigValue = std::variant<
    std::nullptr_t,    // Untuk nilai null
    bool,              // Untuk nilai boolean
    int64_t,           // Untuk nilai integer
    double,            // Untuk nilai floating point
    std::string,       // Untuk nilai string
    std::shared_ptr<ConfigArray>,  // Untuk array
    ConfigNodePtr      // Untuk object/nested config
>;

struct ConfigArray {
    std::vector<ConfigValue> items;
};

// Class untuk node konfigurasi
class ConfigNode : public std::enable_shared_from_this<ConfigNode> {
public:
    using Map = std::unordered_map<std::string, ConfigValue>;

    ConfigNode() = default;
    explicit ConfigNode(Map values) : values_(std::move(values)) {}

    static ConfigNodePtr create() {
        return std::make_shared<ConfigNode>();
    }

    static ConfigNodePtr create(Map values) {
        return std::make_shared<ConfigNode>(std::move(values));
    }

    // Akses nilai
    template<typename T>
    Result<T> get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return {ErrorCode::ResourceNotFound, "Configuration key not found: " + key};
        }
        return convert<T>(key, it->second);
    }

    // Lookup with a dotted path, e.g. "transport.port"
    template<typename T>
    Result<T> find(const std::string& path) const {
        auto dot = path.find('.');
        if (dot == std::string::npos) {
            return get<T>(path);
        }

        auto child = get<ConfigNodePtr>(path.substr(0, dot));
        if (!child) {
            return child.error();
        }
        return child.value()->find<T>(path.substr(dot + 1));
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        values_[key] = std::forward<T>(value);
    }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    void remove(const std::string& key) {
        values_.erase(key);
    }

    // Buat atau dapat nested config
    ConfigNodePtr getOrCreateObject(const std::string& key) {
        auto it = values_.find(key);
        if (it != values_.end()) {
            if (auto* node = std::get_if<ConfigNodePtr>(&it->second)) {
                return *node;
            }
        }

        auto node = create();
        values_[key] = node;
        return node;
    }

    const Map& values() const { return values_; }
    Map& values() { return values_; }

private:
    template<typename T>
    static Result<T> convert(const std::string& key, const ConfigValue& value) {
        // Integers written in JSON are accepted wherever a double is requested
        if constexpr (std::is_same_v<T, double>) {
            if (const auto* i = std::get_if<int64_t>(&value)) {
                return static_cast<double>(*i);
            }
        }

        if (const auto* v = std::get_if<T>(&value)) {
            return *v;
        }
        return {ErrorCode::InvalidData, "Invalid type for key: " + key};
    }

    Map values_;
};

// Konfigurasi dokumen (root node + JSON I/O)
class Config {
public:
    Config() : root_(ConfigNode::create()) {}

    static Config& instance() {
        static Config instance;
        return instance;
    }

    Result<void> loadFromFile(const std::filesystem::path& path);
    Result<void> saveToFile(const std::filesystem::path& path) const;

    Result<void> loadFromString(std::string_view data);
    Result<std::string> saveToString() const;

    ConfigNodePtr root() { return root_; }
    const ConfigNodePtr root() const { return root_; }

    template<typename T>
    Result<T> get(const std::string& path) const {
        return root_->find<T>(path);
    }

    // Returns the configured value, or the fallback when the key is absent.
    // A present key with the wrong type is still an error.
    template<typename T>
    Result<T> getOr(const std::string& path, T fallback) const {
        auto result = root_->find<T>(path);
        if (!result && result.code() == ErrorCode::ResourceNotFound) {
            return fallback;
        }
        return result;
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        root_->set(key, std::forward<T>(value));
    }

    bool has(const std::string& key) const {
        return root_->has(key);
    }

    void remove(const std::string& key) {
        root_->remove(key);
    }

    void clear() {
        root_ = ConfigNode::create();
    }

private:
    ConfigNodePtr root_;
};

// Helper untuk akses global config
inline Config& config() {
    return Config::instance();
}

} // namespace nocturne::core
