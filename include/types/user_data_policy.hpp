#pragma once

namespace EnclosureCache
{

struct UserDataPolicy
{
    bool allow_cellular_downloads = false;
    bool allow_cellular_streaming = false;
    bool automatic_downloads = true;

    bool operator==(const UserDataPolicy &) const = default;
};

} // namespace EnclosureCache
