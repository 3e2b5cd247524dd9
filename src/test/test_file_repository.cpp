#include "test_fakes.hpp"
#include <catch2/catch_test_macros.hpp>
#include <enclosure-cache/file_repository.hpp>
#include <future>

using namespace EnclosureCache;
using namespace EnclosureCache::Testing;
using namespace std::chrono_literals;

namespace
{

struct RepositoryFixture
{
    FakeTransferClient transfer;
    FakeQueueSource queue;
    StaticUserSettings settings;
    FakeProbeFactory probes;
    FakeClock clock;
    RepositoryConfig config;
    WorkerPool pool{ 1 };
    std::unique_ptr<FileRepository> repository;

    FileRepository &make()
    {
        repository = std::make_unique<FileRepository>(transfer, queue, settings, probes, pool, config, clock.source());
        return *repository;
    }

    void useSettings(bool cellular_downloads, bool cellular_streaming, bool automatic_downloads = true)
    {
        UserDataPolicy policy;
        policy.allow_cellular_downloads = cellular_downloads;
        policy.allow_cellular_streaming = cellular_streaming;
        policy.automatic_downloads = automatic_downloads;
        settings.update(policy);
    }

    std::optional<RepositoryError> preloadQueue(bool also_remove_stale_files)
    {
        std::promise<std::optional<RepositoryError>> finished;
        auto result = finished.get_future();

        repository->preloadQueue(also_remove_stale_files,
                                 [&finished](const std::optional<RepositoryError> &error)
                                 {
                                     finished.set_value(error);
                                 });

        auto error = result.get();
        pool.waitIdle();
        return error;
    }

    std::optional<RepositoryError> resolveError(const std::string &str, bool allow_streaming)
    {
        try
        {
            repository->resolve(url(str), allow_streaming);
        }
        catch (const RepositoryError &e)
        {
            return e;
        }
        return std::nullopt;
    }

    void queueEpisodes(size_t count)
    {
        for (size_t i = 1; i <= count; ++i)
        {
            queue.items.push_back("https://cdn.example.com/ep" + std::to_string(i) + ".mp3");
        }
    }
};

} // namespace

TEST_CASE("resolve serves cached files before asking anybody", "[repository][resolve]")
{
    RepositoryFixture f;
    f.make();
    f.transfer.cache("https://cdn.example.com/ep1.mp3");

    auto allow_streaming = GENERATE(true, false);
    auto status = GENERATE(ReachabilityStatus::UNKNOWN, ReachabilityStatus::UNREACHABLE);
    f.probes.status = status;

    auto playable = f.repository->resolve(url("https://cdn.example.com/ep1.mp3"), allow_streaming);

    REQUIRE(playable == FakeTransferClient::localFor(url("https://cdn.example.com/ep1.mp3")));
    REQUIRE(f.probes.probes.empty());
    REQUIRE(f.transfer.started.empty());
}

TEST_CASE("resolve on cellular with downloads off", "[repository][resolve]")
{
    RepositoryFixture f;
    f.useSettings(false, true);
    f.probes.status = ReachabilityStatus::CELLULAR;
    f.make();

    SECTION("Without streaming the denial comes back unchanged")
    {
        auto error = f.resolveError("https://cdn.example.com/ep1.mp3", false);
        REQUIRE(error.has_value());
        REQUIRE(error->isDenial());
        REQUIRE(error->denialReason() == DenialReason::DOWNLOADING_ONLY_OVER_CELLULAR);
        REQUIRE(f.transfer.started.empty());
    }

    SECTION("With streaming the remote URL is played directly")
    {
        auto playable = f.repository->resolve(url("https://cdn.example.com/ep1.mp3"), true);
        REQUIRE(playable == url("https://cdn.example.com/ep1.mp3"));
        REQUIRE(f.transfer.started.empty());
    }

    SECTION("The probe stays armed for when the network changes")
    {
        f.repository->resolve(url("https://cdn.example.com/ep1.mp3"), true);
        REQUIRE(f.repository->isProbeArmed());
        REQUIRE(f.probes.probes.at(0)->host == "cdn.example.com");
    }
}

TEST_CASE("resolve when streaming itself is denied", "[repository][resolve]")
{
    RepositoryFixture f;
    f.make();

    SECTION("Unknown reachability")
    {
        f.probes.status = ReachabilityStatus::UNKNOWN;
        auto error = f.resolveError("https://cdn.example.com/ep1.mp3", true);
        REQUIRE(error.has_value());
        REQUIRE(error->denialReason() == DenialReason::UNKNOWN_REACHABILITY);
    }

    SECTION("Cellular with everything off")
    {
        f.useSettings(false, false);
        f.probes.status = ReachabilityStatus::CELLULAR;
        auto error = f.resolveError("https://cdn.example.com/ep1.mp3", true);
        REQUIRE(error.has_value());
        REQUIRE(error->denialReason() == DenialReason::ALL_OFF);
    }

    SECTION("Cellular with downloads only")
    {
        f.useSettings(true, false);
        f.probes.status = ReachabilityStatus::CELLULAR;
        auto error = f.resolveError("https://cdn.example.com/ep1.mp3", true);
        REQUIRE(error.has_value());
        REQUIRE(error->denialReason() == DenialReason::STREAMING_ONLY_OVER_CELLULAR);
    }

    REQUIRE(f.transfer.started.empty());
}

TEST_CASE("resolve starts transfers when allowed", "[repository][resolve]")
{
    RepositoryFixture f;
    f.probes.status = ReachabilityStatus::REACHABLE;
    f.make();

    SECTION("Pending transfers hand back the remote URL")
    {
        auto playable = f.repository->resolve(url("https://cdn.example.com/ep1.mp3"), false);
        REQUIRE(playable == url("https://cdn.example.com/ep1.mp3"));
        REQUIRE(f.transfer.started == std::vector<std::string>{ "https://cdn.example.com/ep1.mp3" });
    }

    SECTION("Finished transfers hand back the local file")
    {
        f.transfer.complete_on_start = true;
        auto playable = f.repository->resolve(url("https://cdn.example.com/ep1.mp3"), true);
        REQUIRE(playable.isFileUrl());
    }

    SECTION("Engine failures propagate")
    {
        f.transfer.failing.insert("https://cdn.example.com/ep1.mp3");
        auto error = f.resolveError("https://cdn.example.com/ep1.mp3", false);
        REQUIRE(error.has_value());
        REQUIRE(error->kind() == ErrorKind::TRANSFER);
    }

    SECTION("Manual downloads leave the URL alone")
    {
        f.useSettings(false, false, false);
        auto playable = f.repository->resolve(url("https://cdn.example.com/ep1.mp3"), false);
        REQUIRE(playable == url("https://cdn.example.com/ep1.mp3"));
        REQUIRE(f.transfer.started.empty());
    }
}

TEST_CASE("resolve does not probe for local sources", "[repository][resolve]")
{
    RepositoryFixture f;
    f.probes.status = ReachabilityStatus::UNKNOWN;
    f.make();

    f.repository->resolve(url("file:///media/podcasts/ep1.mp3"), false);

    REQUIRE(f.probes.probes.empty());
    REQUIRE(f.transfer.started == std::vector<std::string>{ "file:///media/podcasts/ep1.mp3" });
}

TEST_CASE("resolveAsync reports through the callback", "[repository][resolve]")
{
    RepositoryFixture f;
    f.make();

    std::promise<std::pair<std::optional<MediaUrl>, std::optional<RepositoryError>>> finished;
    auto result = finished.get_future();

    SECTION("Success")
    {
        f.probes.status = ReachabilityStatus::REACHABLE;
        f.repository->resolveAsync(url("https://cdn.example.com/ep1.mp3"), false,
                                   [&finished](const std::optional<MediaUrl> &playable,
                                               const std::optional<RepositoryError> &error)
                                   {
                                       finished.set_value({ playable, error });
                                   });

        auto [playable, error] = result.get();
        REQUIRE(playable == url("https://cdn.example.com/ep1.mp3"));
        REQUIRE_FALSE(error.has_value());
    }

    SECTION("Denial")
    {
        f.probes.status = ReachabilityStatus::UNKNOWN;
        f.repository->resolveAsync(url("https://cdn.example.com/ep1.mp3"), true,
                                   [&finished](const std::optional<MediaUrl> &playable,
                                               const std::optional<RepositoryError> &error)
                                   {
                                       finished.set_value({ playable, error });
                                   });

        auto [playable, error] = result.get();
        REQUIRE_FALSE(playable.has_value());
        REQUIRE(error.has_value());
        REQUIRE(error->isDenial());
    }
}

TEST_CASE("preload swallows errors", "[repository][resolve]")
{
    RepositoryFixture f;
    f.probes.status = ReachabilityStatus::REACHABLE;
    f.make();
    f.transfer.failing.insert("https://cdn.example.com/ep1.mp3");

    f.repository->preload(url("https://cdn.example.com/ep1.mp3"));
    f.repository->preload(url("https://cdn.example.com/ep2.mp3"));
    f.pool.waitIdle();

    REQUIRE(f.transfer.started ==
            std::vector<std::string>{ "https://cdn.example.com/ep1.mp3", "https://cdn.example.com/ep2.mp3" });
}

TEST_CASE("preloadQueue with automatic downloads off does nothing", "[repository][queue]")
{
    RepositoryFixture f;
    f.useSettings(true, true, false);
    f.probes.status = ReachabilityStatus::REACHABLE;
    f.queueEpisodes(5);
    f.transfer.cache("https://cdn.example.com/old.mp3");
    f.make();

    auto also_remove = GENERATE(false, true);
    auto error = f.preloadQueue(also_remove);

    REQUIRE_FALSE(error.has_value());
    REQUIRE(f.transfer.started.empty());
    REQUIRE(f.transfer.remove_all_calls == 0);
    REQUIRE(f.transfer.swept.empty());
}

TEST_CASE("preloadQueue starts every uncached item on an open network", "[repository][queue]")
{
    RepositoryFixture f;
    f.probes.status = ReachabilityStatus::REACHABLE;
    f.queueEpisodes(3);
    f.make();

    auto error = f.preloadQueue(false);

    REQUIRE_FALSE(error.has_value());
    REQUIRE(f.transfer.started == f.queue.items);
    REQUIRE_FALSE(f.repository->lastPreloadError().has_value());
}

TEST_CASE("preloadQueue stops at the per run ceiling", "[repository][queue]")
{
    RepositoryFixture f;
    f.probes.status = ReachabilityStatus::REACHABLE;
    f.queueEpisodes(100);
    for (size_t i = 0; i < 10; ++i)
    {
        f.transfer.cache(f.queue.items[i]);
    }
    f.make();

    auto error = f.preloadQueue(false);

    REQUIRE_FALSE(error.has_value());
    REQUIRE(f.transfer.started.size() == 64);

    std::vector<std::string> expected(f.queue.items.begin() + 10, f.queue.items.begin() + 74);
    REQUIRE(f.transfer.started == expected);
}

TEST_CASE("preloadQueue skips duplicate queue entries", "[repository][queue]")
{
    RepositoryFixture f;
    f.probes.status = ReachabilityStatus::REACHABLE;
    f.queue.items = { "https://cdn.example.com/ep1.mp3", "https://cdn.example.com/ep1.mp3",
                      "https://cdn.example.com/ep2.mp3" };
    f.make();

    f.preloadQueue(false);

    REQUIRE(f.transfer.started ==
            std::vector<std::string>{ "https://cdn.example.com/ep1.mp3", "https://cdn.example.com/ep2.mp3" });
}

TEST_CASE("preloadQueue denied on cellular waits for the network", "[repository][queue]")
{
    RepositoryFixture f;
    f.useSettings(false, true);
    f.probes.status = ReachabilityStatus::CELLULAR;
    f.queueEpisodes(3);
    f.transfer.cache("https://cdn.example.com/old.mp3");
    f.make();

    auto error = f.preloadQueue(true);

    REQUIRE(error.has_value());
    REQUIRE(error->denialReason() == DenialReason::DOWNLOADING_ONLY_OVER_CELLULAR);
    REQUIRE(f.transfer.started.empty());
    REQUIRE(f.transfer.remove_all_calls == 0);
    REQUIRE(f.repository->isProbeArmed());
    REQUIRE(f.probes.probes.at(0)->host == "apple.com");
    REQUIRE(f.repository->lastPreloadError().has_value());

    SECTION("Becoming reachable preloads the queue again")
    {
        f.probes.status = ReachabilityStatus::REACHABLE;
        f.probes.probes.at(0)->fire(ReachabilityStatus::REACHABLE);
        f.pool.waitIdle();

        REQUIRE(f.transfer.started == f.queue.items);
        REQUIRE_FALSE(f.repository->lastPreloadError().has_value());

        // The resumed run leaves cached files alone
        REQUIRE(f.transfer.remove_all_calls == 0);
    }

    SECTION("Other changes do not")
    {
        f.probes.probes.at(0)->fire(ReachabilityStatus::UNREACHABLE);
        f.pool.waitIdle();

        REQUIRE(f.transfer.started.empty());
    }

    SECTION("Flushing drops the probe")
    {
        f.repository->flush();
        REQUIRE_FALSE(f.repository->isProbeArmed());
        REQUIRE(f.probes.probes.at(0)->destroyed);
    }
}

TEST_CASE("preloadQueue reports the first error", "[repository][queue]")
{
    RepositoryFixture f;
    f.probes.status = ReachabilityStatus::REACHABLE;
    f.queueEpisodes(3);
    f.transfer.failing.insert(f.queue.items[0]);
    f.make();

    SECTION("Transfer errors do not stop the run")
    {
        auto error = f.preloadQueue(false);
        REQUIRE(error.has_value());
        REQUIRE(error->kind() == ErrorKind::TRANSFER);
        REQUIRE(f.transfer.started == f.queue.items);
    }

    SECTION("Enumeration errors win over transfer errors")
    {
        f.queue.result = RepositoryError::enumeration("queue unavailable");
        auto error = f.preloadQueue(false);
        REQUIRE(error.has_value());
        REQUIRE(error->kind() == ErrorKind::ENUMERATION);
        REQUIRE(f.transfer.started == f.queue.items);
    }

    SECTION("Missing entries are not reported")
    {
        f.transfer.failing.clear();
        f.queue.result = RepositoryError::missingEntries("2 entries gone");
        auto error = f.preloadQueue(false);
        REQUIRE_FALSE(error.has_value());
        REQUIRE(f.transfer.started == f.queue.items);
    }
}

TEST_CASE("preloadQueue removes stale unqueued files", "[repository][removal]")
{
    RepositoryFixture f;
    f.probes.status = ReachabilityStatus::REACHABLE;
    f.queue.items = { "https://cdn.example.com/queued.mp3" };
    f.transfer.cache("https://cdn.example.com/queued.mp3", f.clock.now - 200h);
    f.transfer.cache("https://cdn.example.com/old.mp3", f.clock.now - 200h);
    f.transfer.cache("https://cdn.example.com/recent.mp3", f.clock.now - 1h);
    f.make();

    SECTION("Only when asked")
    {
        f.preloadQueue(false);
        REQUIRE(f.transfer.remove_all_calls == 0);
        REQUIRE_FALSE(f.repository->lastRemovalTime().has_value());
    }

    SECTION("Queued and recent files survive")
    {
        auto error = f.preloadQueue(true);

        REQUIRE_FALSE(error.has_value());
        REQUIRE(f.transfer.remove_all_calls == 1);
        REQUIRE(f.transfer.kept.count("https://cdn.example.com/queued.mp3") == 1);
        REQUIRE(f.transfer.swept == std::vector<std::string>{ "https://cdn.example.com/old.mp3" });
        REQUIRE(f.transfer.started.empty());
        REQUIRE(f.repository->lastRemovalTime() == f.clock.now);
        REQUIRE(f.repository->removalBudget() == f.config.removal_budget);
    }
}

TEST_CASE("Removal approval", "[repository][removal]")
{
    RepositoryFixture f;
    f.make();
    auto &repository = *f.repository;
    const auto stale = f.clock.now - 100h;

    SECTION("The budget runs out after sixteen files")
    {
        for (int i = 0; i < 16; ++i)
        {
            REQUIRE(repository.approveRemoval(url("https://cdn.example.com/ep.mp3"), stale));
        }

        REQUIRE(repository.removalBudget() == 0);

        for (int i = 0; i < 4; ++i)
        {
            REQUIRE_FALSE(repository.approveRemoval(url("https://cdn.example.com/ep.mp3"), stale));
        }

        REQUIRE(repository.removalBudget() == 0);
    }

    SECTION("Recently modified files are never removed")
    {
        REQUIRE_FALSE(repository.approveRemoval(url("https://cdn.example.com/ep.mp3"), f.clock.now - 1h));
        REQUIRE_FALSE(repository.approveRemoval(url("https://cdn.example.com/ep.mp3"), f.clock.now - 72h));
        REQUIRE(repository.removalBudget() == 16);

        REQUIRE(repository.approveRemoval(url("https://cdn.example.com/ep.mp3"), f.clock.now - 73h));
        REQUIRE(repository.removalBudget() == 15);
    }

    SECTION("A new run restores the budget")
    {
        f.probes.status = ReachabilityStatus::REACHABLE;
        for (int i = 0; i < 20; ++i)
        {
            repository.approveRemoval(url("https://cdn.example.com/ep.mp3"), stale);
        }

        f.preloadQueue(false);
        REQUIRE(repository.removalBudget() == 16);
    }
}

TEST_CASE("Removal approval uses the configured limits", "[repository][removal]")
{
    RepositoryFixture f;
    f.config.removal_budget = 2;
    f.config.stale_after_hours = 1;
    f.make();

    REQUIRE(f.repository->approveRemoval(url("https://cdn.example.com/a.mp3"), f.clock.now - 2h));
    REQUIRE(f.repository->approveRemoval(url("https://cdn.example.com/b.mp3"), f.clock.now - 2h));
    REQUIRE_FALSE(f.repository->approveRemoval(url("https://cdn.example.com/c.mp3"), f.clock.now - 2h));
}

TEST_CASE("Cellular transport follows the download setting", "[repository]")
{
    RepositoryFixture f;
    f.make();

    f.useSettings(false, true);
    REQUIRE_FALSE(f.repository->allowsCellularTransport());

    f.useSettings(true, false);
    REQUIRE(f.repository->allowsCellularTransport());
}

TEST_CASE("Transfer housekeeping", "[repository]")
{
    RepositoryFixture f;
    f.make();
    f.transfer.cache("https://cdn.example.com/ep1.mp3");

    SECTION("removeCachedFile removes and cancels")
    {
        f.repository->removeCachedFile(url("https://cdn.example.com/ep1.mp3"));
        f.pool.waitIdle();

        REQUIRE(f.transfer.removed == std::vector<std::string>{ "https://cdn.example.com/ep1.mp3" });
        REQUIRE(f.transfer.cancelled == std::vector<std::string>{ "https://cdn.example.com/ep1.mp3" });
        REQUIRE_FALSE(f.transfer.localFile(url("https://cdn.example.com/ep1.mp3")).has_value());
    }

    SECTION("cancelTransfer only cancels")
    {
        f.repository->cancelTransfer(url("https://cdn.example.com/ep1.mp3"));
        f.pool.waitIdle();

        REQUIRE(f.transfer.cancelled == std::vector<std::string>{ "https://cdn.example.com/ep1.mp3" });
        REQUIRE(f.transfer.removed.empty());
    }

    SECTION("Background events are forwarded")
    {
        bool done = false;
        f.repository->handleBackgroundTransferEvents("session-1",
                                                     [&done]
                                                     {
                                                         done = true;
                                                     });

        REQUIRE(done);
        REQUIRE(f.transfer.sessions == std::vector<std::string>{ "session-1" });
    }
}

TEST_CASE("The repository registers itself as removal approver", "[repository]")
{
    RepositoryFixture f;
    f.make();
    REQUIRE(f.transfer.approver == f.repository.get());

    f.repository.reset();
    REQUIRE(f.transfer.approver == nullptr);
}
