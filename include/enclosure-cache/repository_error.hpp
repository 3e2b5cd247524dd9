#pragma once

#include "../types/reachability_status.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace EnclosureCache
{

enum class ErrorKind : std::uint8_t
{
    POLICY_DENIAL, // Deliberate "will not transfer now", not a failure
    ENUMERATION, // Queue source failed to list items
    MISSING_ENTRIES, // Some queued items could not be found, non-fatal
    TRANSFER, // Transfer engine failed for one URL
    PROBE_INSTALL // Reachability callback could not be installed
};

class RepositoryError : public std::runtime_error
{
    public:
    RepositoryError(ErrorKind kind, const std::string &message, std::optional<DenialReason> reason = std::nullopt)
    : std::runtime_error(message), kind_(kind), reason_(reason)
    {
    }

    static RepositoryError denied(DenialReason reason);
    static RepositoryError enumeration(const std::string &message);
    static RepositoryError missingEntries(const std::string &message);
    static RepositoryError transfer(const std::string &message);
    static RepositoryError probeInstall(const std::string &host);

    ErrorKind kind() const
    {
        return kind_;
    }

    // Set for POLICY_DENIAL only
    std::optional<DenialReason> denialReason() const
    {
        return reason_;
    }

    bool isDenial() const
    {
        return kind_ == ErrorKind::POLICY_DENIAL;
    }

    static std::string kindToString(ErrorKind kind);

    private:
    ErrorKind kind_;
    std::optional<DenialReason> reason_;
};

} // namespace EnclosureCache
