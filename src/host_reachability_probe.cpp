#include "../include/enclosure-cache/host_reachability_probe.hpp"
#include "../include/enclosure-cache/download_policy.hpp"
#include "../include/enclosure-cache/logger.hpp"
#include "../include/enclosure-cache/string_utils.hpp"
#include <arpa/inet.h>
#include <cstring>
#include <ifaddrs.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace EnclosureCache
{

namespace
{

    bool sameAddress(const sockaddr *a, const sockaddr *b)
    {
        if (a == nullptr || b == nullptr || a->sa_family != b->sa_family)
        {
            return false;
        }

        if (a->sa_family == AF_INET)
        {
            const auto *a4 = reinterpret_cast<const sockaddr_in *>(a);
            const auto *b4 = reinterpret_cast<const sockaddr_in *>(b);
            return a4->sin_addr.s_addr == b4->sin_addr.s_addr;
        }

        if (a->sa_family == AF_INET6)
        {
            const auto *a6 = reinterpret_cast<const sockaddr_in6 *>(a);
            const auto *b6 = reinterpret_cast<const sockaddr_in6 *>(b);
            return std::memcmp(&a6->sin6_addr, &b6->sin6_addr, sizeof(in6_addr)) == 0;
        }

        return false;
    }

    // Name of the local interface owning address, empty if none does
    std::string interfaceFor(const sockaddr *address)
    {
        ifaddrs *interfaces = nullptr;
        if (getifaddrs(&interfaces) != 0)
        {
            return {};
        }

        std::string name;
        for (const ifaddrs *it = interfaces; it != nullptr; it = it->ifa_next)
        {
            if (sameAddress(it->ifa_addr, address))
            {
                name = it->ifa_name;
                break;
            }
        }

        freeifaddrs(interfaces);
        return name;
    }

} // namespace

HostReachabilityProbe::HostReachabilityProbe(std::string host, const ReachabilityConfig &config)
: state(std::make_shared<WatchState>())
{
    state->host = std::move(host);
    state->constrained_prefixes = config.constrained_interface_prefixes;
    state->interval = std::chrono::milliseconds(config.watch_interval_ms);
}

HostReachabilityProbe::~HostReachabilityProbe()
{
    invalidate();

    if (!watch_thread.joinable())
    {
        return;
    }

    // Destroyed from our own callback, the thread exits on its own
    if (watch_thread.get_id() == std::this_thread::get_id())
    {
        watch_thread.detach();
    }
    else
    {
        watch_thread.join();
    }
}

ReachabilityStatus HostReachabilityProbe::check(const std::string &host, const std::vector<std::string> &constrained_prefixes)
{
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_DGRAM;

    addrinfo *res = nullptr;
    int ret = getaddrinfo(host.c_str(), "443", &hints, &res);
    if (ret != 0 || res == nullptr)
    {
        if (res)
        {
            freeaddrinfo(res);
        }
        // No verdict without an address
        Logger::debug(LogCategory::REACHABILITY, "cannot resolve '{}': {}", host, gai_strerror(ret));
        return ReachabilityStatus::UNKNOWN;
    }

    ReachabilityStatus status = ReachabilityStatus::UNREACHABLE;

    for (const addrinfo *ai = res; ai != nullptr; ai = ai->ai_next)
    {
        int sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0)
        {
            continue;
        }

        // Connecting a datagram socket only selects a route, nothing is sent
        if (connect(sock, ai->ai_addr, ai->ai_addrlen) != 0)
        {
            close(sock);
            continue;
        }

        sockaddr_storage local{};
        socklen_t local_len = sizeof(local);
        const bool named = getsockname(sock, reinterpret_cast<sockaddr *>(&local), &local_len) == 0;
        close(sock);

        status = ReachabilityStatus::REACHABLE;
        if (named)
        {
            const std::string interface_name = interfaceFor(reinterpret_cast<const sockaddr *>(&local));
            for (const auto &prefix : constrained_prefixes)
            {
                if (!prefix.empty() && StringUtils::startsWith(interface_name, prefix))
                {
                    status = ReachabilityStatus::CELLULAR;
                    break;
                }
            }
        }
        break;
    }

    freeaddrinfo(res);
    return status;
}

ReachabilityStatus HostReachabilityProbe::currentStatus()
{
    return check(state->host, state->constrained_prefixes);
}

bool HostReachabilityProbe::activate(ReachabilityStatus initial, ReachabilityCallback callback)
{
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (state->stopped || watch_thread.joinable())
        {
            return false;
        }
        state->callback = std::move(callback);
    }

    try
    {
        watch_thread = std::thread(&HostReachabilityProbe::watch, state, initial);
    }
    catch (const std::system_error &e)
    {
        Logger::error(LogCategory::REACHABILITY, "could not start watch thread for '{}': {}", state->host, e.what());
        return false;
    }

    return true;
}

void HostReachabilityProbe::invalidate()
{
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->stopped = true;
        state->callback = nullptr;
    }
    state->wakeup.notify_all();
}

void HostReachabilityProbe::watch(std::shared_ptr<WatchState> state, ReachabilityStatus last)
{
    while (true)
    {
        {
            std::unique_lock<std::mutex> lock(state->mutex);
            if (state->wakeup.wait_for(lock, state->interval,
                                       [&state]
                                       {
                                           return state->stopped;
                                       }))
            {
                return;
            }
        }

        const ReachabilityStatus status = check(state->host, state->constrained_prefixes);
        if (status == last)
        {
            continue;
        }

        Logger::debug(LogCategory::REACHABILITY, "'{}' changed from {} to {}", state->host,
                      DownloadPolicy::reachabilityToString(last), DownloadPolicy::reachabilityToString(status));
        last = status;

        ReachabilityCallback callback;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (state->stopped)
            {
                return;
            }
            callback = state->callback;
        }

        if (callback)
        {
            callback(status);
        }
    }
}

std::unique_ptr<ReachabilityProbe> HostReachabilityProbeFactory::makeProbe(const std::string &host)
{
    if (host.empty())
    {
        return nullptr;
    }

    return std::make_unique<HostReachabilityProbe>(host, config);
}

} // namespace EnclosureCache
