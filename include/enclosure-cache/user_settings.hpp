#pragma once

#include "../types/user_data_policy.hpp"
#include <mutex>

namespace EnclosureCache
{

class UserSettings
{
    public:
    virtual ~UserSettings() = default;

    virtual UserDataPolicy snapshot() const = 0;
};

// In-memory settings, updated by whoever owns the preferences
class StaticUserSettings : public UserSettings
{
    public:
    explicit StaticUserSettings(const UserDataPolicy &initial = {}) : policy(initial)
    {
    }

    UserDataPolicy snapshot() const override
    {
        std::lock_guard<std::mutex> lock(settings_mutex);
        return policy;
    }

    void update(const UserDataPolicy &next)
    {
        std::lock_guard<std::mutex> lock(settings_mutex);
        policy = next;
    }

    private:
    mutable std::mutex settings_mutex{};
    UserDataPolicy policy;
};

} // namespace EnclosureCache
