#include <enclosure-cache/config_parser.hpp>
#include <enclosure-cache/logger.hpp>
#include <enclosure-cache/media_url.hpp>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

namespace EnclosureCache
{

namespace
{

    void readBool(const nlohmann::json &section, const char *key, bool &target)
    {
        if (!section.contains(key))
        {
            return;
        }

        if (section[key].is_boolean())
        {
            target = section[key].get<bool>();
        }
        else
        {
            Logger::warn(LogCategory::CONFIG, "'{}' must be a boolean, keeping {}", key, target);
        }
    }

    void readString(const nlohmann::json &section, const char *key, std::string &target)
    {
        if (!section.contains(key))
        {
            return;
        }

        if (section[key].is_string() && !section[key].get<std::string>().empty())
        {
            target = section[key].get<std::string>();
        }
        else
        {
            Logger::warn(LogCategory::CONFIG, "'{}' must be a non-empty string, keeping '{}'", key, target);
        }
    }

    // Accepts unsigned integers in [minimum, maximum]
    template <typename T>
    void readUnsigned(const nlohmann::json &section, const char *key, T &target, uint64_t minimum, uint64_t maximum)
    {
        if (!section.contains(key))
        {
            return;
        }

        const auto &value = section[key];
        if (value.is_number_unsigned() && value.get<uint64_t>() >= minimum && value.get<uint64_t>() <= maximum)
        {
            target = static_cast<T>(value.get<uint64_t>());
        }
        else
        {
            Logger::warn(LogCategory::CONFIG, "'{}' must be an integer between {} and {}, keeping {}", key, minimum,
                         maximum, target);
        }
    }

    const nlohmann::json *section(const nlohmann::json &document, const char *name)
    {
        if (!document.contains(name))
        {
            return nullptr;
        }

        if (!document[name].is_object())
        {
            Logger::warn(LogCategory::CONFIG, "'{}' must be an object, using defaults", name);
            return nullptr;
        }

        return &document[name];
    }

} // namespace

std::optional<Config> ConfigParser::parseJsonFile(std::string_view file_path)
{
    const std::filesystem::path path(file_path);
    Logger::debug(LogCategory::CONFIG, "opening config file: {}", path.string());

    std::ifstream file(path, std::ios::in);
    if (!file.is_open())
    {
        if (std::filesystem::exists(path))
        {
            Logger::error(LogCategory::CONFIG, "config file exists but cannot be opened: {}", path.string());
        }
        else
        {
            Logger::error(LogCategory::CONFIG, "config file does not exist: {}", path.string());
        }

        return std::nullopt;
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    Logger::debug(LogCategory::CONFIG, "read {} bytes from config file", content.size());

    return parseJsonString(content);
}

std::optional<Config> ConfigParser::parseJsonString(std::string_view json_content)
{
    try
    {
        const nlohmann::json j = nlohmann::json::parse(json_content);
        if (!j.is_object())
        {
            Logger::error(LogCategory::CONFIG, "config document must be a JSON object");
            return std::nullopt;
        }

        Config config;

        if (const auto *settings = section(j, "settings"))
        {
            readBool(*settings, "allow_cellular_downloads", config.settings.allow_cellular_downloads);
            readBool(*settings, "allow_cellular_streaming", config.settings.allow_cellular_streaming);
            readBool(*settings, "automatic_downloads", config.settings.automatic_downloads);
        }

        if (const auto *repository = section(j, "repository"))
        {
            auto &rc = config.repository;
            readString(*repository, "cache_directory", rc.cache_directory);
            readUnsigned(*repository, "removal_budget", rc.removal_budget, 0, UINT32_MAX);
            readUnsigned(*repository, "stale_after_hours", rc.stale_after_hours, 0, UINT32_MAX);
            readUnsigned(*repository, "max_preloads_per_run", rc.max_preloads_per_run, 1, SIZE_MAX);
            readUnsigned(*repository, "worker_threads", rc.worker_threads, 1, 256);
            readUnsigned(*repository, "transfer_threads", rc.transfer_threads, 1, 256);

            std::string representative = rc.representative_url;
            readString(*repository, "representative_url", representative);
            if (MediaUrl::parse(representative) && !MediaUrl::parse(representative)->host().empty())
            {
                rc.representative_url = representative;
            }
            else
            {
                Logger::warn(LogCategory::CONFIG, "'representative_url' must be a URL with a host, keeping '{}'",
                             rc.representative_url);
            }
        }

        if (const auto *reachability = section(j, "reachability"))
        {
            auto &rc = config.reachability;
            readUnsigned(*reachability, "watch_interval_ms", rc.watch_interval_ms, 10, 3600000);

            if (reachability->contains("constrained_interface_prefixes"))
            {
                const auto &prefixes = (*reachability)["constrained_interface_prefixes"];
                if (prefixes.is_array())
                {
                    rc.constrained_interface_prefixes.clear();
                    for (const auto &prefix : prefixes)
                    {
                        if (prefix.is_string())
                        {
                            rc.constrained_interface_prefixes.push_back(prefix.get<std::string>());
                        }
                        else
                        {
                            Logger::warn(LogCategory::CONFIG, "ignoring non-string interface prefix");
                        }
                    }
                }
                else
                {
                    Logger::warn(LogCategory::CONFIG, "'constrained_interface_prefixes' must be an array");
                }
            }
        }

        if (const auto *metrics = section(j, "metrics"))
        {
            readBool(*metrics, "enabled", config.metrics.enabled);
            readString(*metrics, "bind_address", config.metrics.bind_address);
            readUnsigned(*metrics, "port", config.metrics.port, 1, 65535);
            readString(*metrics, "endpoint_path", config.metrics.endpoint_path);
        }

        if (const auto *logging = section(j, "logging"))
        {
            readString(*logging, "level", config.logging.level);
            readString(*logging, "output", config.logging.output);
            readString(*logging, "file", config.logging.file);
            readString(*logging, "categories", config.logging.categories);
        }

        Logger::debug(LogCategory::CONFIG, "configuration parsing completed");
        return config;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error(LogCategory::CONFIG, "JSON parsing error: {}", e.what());
        return std::nullopt;
    }
}

} // namespace EnclosureCache
