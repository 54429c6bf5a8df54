#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

namespace relaysync
{
namespace storage
{
/**
 * @brief An interface for a simple durable key-value store.
 * @remark Implementations must be safe to call from multiple threads.
 */
class IPersistence
{
public:
    virtual ~IPersistence() = default;

    /**
     * @brief Reads the value stored under the given key.
     * @returns The stored value, or `std::nullopt` if nothing is stored under the key.
     */
    virtual std::optional<std::string> get(const std::string& key) = 0;

    /**
     * @brief Stores a value under the given key, replacing any previous value.
     * @throws `std::runtime_error` if the value could not be stored durably.
     */
    virtual void set(const std::string& key, const std::string& value) = 0;
};

/**
 * @brief A process-lifetime key-value store.
 */
class InMemoryPersistence : public IPersistence
{
public:
    std::optional<std::string> get(const std::string& key) override;

    void set(const std::string& key, const std::string& value) override;

private:
    std::mutex _propertyMutex;

    std::unordered_map<std::string, std::string> _values;
};

/**
 * @brief A key-value store backed by a single JSON object file.
 * @remark The whole file is rewritten on every `set`, through a temporary file that replaces the existing
 * one, so a crash never leaves a partially written store behind.
 */
class JsonFilePersistence : public IPersistence
{
public:
    /**
     * @param path The path of the store file.  The file is created on the first `set`.
     * @remark A file that cannot be parsed is logged and treated as empty.
     */
    JsonFilePersistence(std::filesystem::path path);

    std::optional<std::string> get(const std::string& key) override;

    void set(const std::string& key, const std::string& value) override;

private:
    std::mutex _propertyMutex;

    std::filesystem::path _path;

    nlohmann::json _document;

    void _load();

    void _flush();
};
} // namespace storage
} // namespace relaysync
