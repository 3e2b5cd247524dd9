#include <enclosure-cache/download_policy.hpp>
#include <enclosure-cache/repository_error.hpp>

namespace EnclosureCache
{

RepositoryError RepositoryError::denied(DenialReason reason)
{
    return RepositoryError(ErrorKind::POLICY_DENIAL, "denied by data policy: " + DownloadPolicy::denialReasonToString(reason),
                           reason);
}

RepositoryError RepositoryError::enumeration(const std::string &message)
{
    return RepositoryError(ErrorKind::ENUMERATION, message);
}

RepositoryError RepositoryError::missingEntries(const std::string &message)
{
    return RepositoryError(ErrorKind::MISSING_ENTRIES, message);
}

RepositoryError RepositoryError::transfer(const std::string &message)
{
    return RepositoryError(ErrorKind::TRANSFER, message);
}

RepositoryError RepositoryError::probeInstall(const std::string &host)
{
    return RepositoryError(ErrorKind::PROBE_INSTALL, "could not install reachability callback for '" + host + "'");
}

std::string RepositoryError::kindToString(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::POLICY_DENIAL:
        return "policy_denial";
    case ErrorKind::ENUMERATION:
        return "enumeration";
    case ErrorKind::MISSING_ENTRIES:
        return "missing_entries";
    case ErrorKind::TRANSFER:
        return "transfer";
    case ErrorKind::PROBE_INSTALL:
        return "probe_install";
    default:
        return "unknown";
    }
}

} // namespace EnclosureCache
