#include <enclosure-cache/config_parser.hpp>
#include <enclosure-cache/directory_transfer_client.hpp>
#include <enclosure-cache/file_repository.hpp>
#include <enclosure-cache/host_reachability_probe.hpp>
#include <enclosure-cache/json_queue_source.hpp>
#include <enclosure-cache/logger.hpp>
#include <enclosure-cache/metrics_collector.hpp>
#include <enclosure-cache/time_utils.hpp>
#include <future>
#include <optional>
#include <string>

using namespace EnclosureCache;

struct ProgramOptions
{
    std::string config_file;
    std::string queue_file = "queue.json";
    std::string resolve_url;
    bool allow_streaming = false;
    bool preload_queue = false;
    bool remove_stale = false;
    bool show_help = false;

    // Override the logging section of the config when set
    std::optional<std::string> log_level;
    std::optional<std::string> log_output;
    std::optional<std::string> log_file;
};

void printUsage()
{
    std::string usage =
    "Usage: enclosure-cache [OPTIONS]\n"
    "\n"
    "Options:\n"
    "  -c, --config FILE      Configuration file (JSON)\n"
    "  -q, --queue FILE       Playback queue document (default: queue.json)\n"
    "  -r, --resolve URL      Resolve an enclosure to the URL to play from\n"
    "  -s, --stream           Allow streaming while resolving\n"
    "  -p, --preload-queue    Download everything in the queue\n"
    "      --remove-stale     Also remove cached files no longer queued\n"
    "  -h, --help             Show this help message\n"
    "\n"
    "Application Logging Options:\n"
    "  -l, --log-level LEVEL  Set log level: trace, debug, info, warn, error, fatal, off (default: info)\n"
    "  -o, --log-output TYPE  Set output: console, file, both, disabled (default: console)\n"
    "  -f, --log-file FILE    Log file path (default: enclosure-cache.log)\n"
    "\n"
    "Examples:\n"
    "  enclosure-cache --config enclosure-cache.json --preload-queue --remove-stale\n"
    "  enclosure-cache --resolve https://example.com/episode.mp3 --stream\n"
    "  enclosure-cache --queue queue.json --preload-queue --log-level debug --log-output both";

    Logger::info(usage);
}

const char *getNextArg(char **argv, int &i, int argc)
{
    if (i + 1 < argc)
    {
        return argv[++i];
    }
    return nullptr;
}

ProgramOptions parseCommandLine(int argc, char **argv)
{
    ProgramOptions options;

    for (int i = 1; i < argc; i++)
    {
        std::string arg{ argv[i] };

        if (arg == "-c" || arg == "--config" || arg == "-q" || arg == "--queue" || arg == "-r" ||
            arg == "--resolve" || arg == "-l" || arg == "--log-level" || arg == "-o" || arg == "--log-output" ||
            arg == "-f" || arg == "--log-file")
        {
            const char *value = getNextArg(argv, i, argc);
            if (!value)
            {
                Logger::error("Error: {} requires a value", arg);
                options.show_help = true;
                break;
            }

            if (arg == "-c" || arg == "--config")
                options.config_file = value;
            else if (arg == "-q" || arg == "--queue")
                options.queue_file = value;
            else if (arg == "-r" || arg == "--resolve")
                options.resolve_url = value;
            else if (arg == "-l" || arg == "--log-level")
                options.log_level = value;
            else if (arg == "-o" || arg == "--log-output")
                options.log_output = value;
            else
                options.log_file = value;
        }
        else if (arg == "-s" || arg == "--stream")
        {
            options.allow_streaming = true;
        }
        else if (arg == "-p" || arg == "--preload-queue")
        {
            options.preload_queue = true;
        }
        else if (arg == "--remove-stale")
        {
            options.preload_queue = true;
            options.remove_stale = true;
        }
        else if (arg == "-h" || arg == "--help")
        {
            options.show_help = true;
            break;
        }
        else
        {
            Logger::error("Unknown argument: {}", arg);
            options.show_help = true;
            break;
        }
    }

    return options;
}

void configureLogging(const LoggingConfig &logging, const ProgramOptions &options)
{
    const LogOutput output = Logger::parseOutput(options.log_output.value_or(logging.output));

    Logger::initialize(Logger::parseLevel(options.log_level.value_or(logging.level)), output);
    Logger::setCategoriesFromString(logging.categories);
    if (output == LogOutput::FILE || output == LogOutput::BOTH)
    {
        Logger::setLogFile(options.log_file.value_or(logging.file));
    }
}

int resolveOne(FileRepository &repository, DirectoryTransferClient &transfer_client, const ProgramOptions &options)
{
    auto url = MediaUrl::parse(options.resolve_url);
    if (!url)
    {
        Logger::error("Not a URL: {}", options.resolve_url);
        return 1;
    }

    try
    {
        MediaUrl playable = repository.resolve(*url, options.allow_streaming);

        // A pending copy finishes before we report
        if (playable == *url && !url->isFileUrl())
        {
            Logger::info("Play from: {}", playable.str());
            return 0;
        }

        transfer_client.waitIdle();
        auto local = transfer_client.localFile(*url);
        Logger::info("Play from: {}", local ? local->str() : playable.str());
        return 0;
    }
    catch (const RepositoryError &e)
    {
        if (e.isDenial())
        {
            Logger::warn("Not transferring {}: {}", url->str(), DownloadPolicy::denialReasonToString(*e.denialReason()));
            return 2;
        }

        Logger::error("Resolving {} failed: {}", url->str(), e.what());
        return 1;
    }
}

int preloadQueue(FileRepository &repository, WorkerPool &worker_pool, DirectoryTransferClient &transfer_client, bool remove_stale)
{
    std::promise<std::optional<RepositoryError>> finished;
    auto result = finished.get_future();

    repository.preloadQueue(remove_stale,
                            [&finished](const std::optional<RepositoryError> &error)
                            {
                                finished.set_value(error);
                            });

    const std::optional<RepositoryError> error = result.get();
    worker_pool.waitIdle();
    transfer_client.waitIdle();

    if (auto removed = repository.lastRemovalTime())
    {
        Logger::info("Stale files swept at {}", TimeUtils::formatTimestamp(*removed));
    }

    if (!error)
    {
        Logger::info("Queue preloaded");
        return 0;
    }

    if (error->isDenial())
    {
        Logger::warn("Queue not preloaded: {}", DownloadPolicy::denialReasonToString(*error->denialReason()));
        return 2;
    }

    Logger::error("Queue preloading failed: {}", error->what());
    return 1;
}

int main(int argc, char **argv)
{
    Logger::initialize(LogLevel::INFO, LogOutput::CONSOLE);

    ProgramOptions options = parseCommandLine(argc, argv);
    if (options.show_help || (options.resolve_url.empty() && !options.preload_queue))
    {
        printUsage();
        return options.show_help ? 0 : 1;
    }

    Config config;
    if (!options.config_file.empty())
    {
        auto parsed = ConfigParser::parseJsonFile(options.config_file);
        if (!parsed)
        {
            Logger::error("Failed to load configuration from {}", options.config_file);
            return 1;
        }
        config = std::move(*parsed);
    }

    configureLogging(config.logging, options);

    if (config.metrics.enabled)
    {
        GlobalMetrics::initialize(config.metrics);
        Logger::info(LogCategory::METRICS, "metrics available at {}", GlobalMetrics::instance().getMetricsUrl());
    }

    int exit_code = 0;
    try
    {
        WorkerPool worker_pool(config.repository.worker_threads);
        DirectoryTransferClient transfer_client(config.repository.cache_directory, config.repository.transfer_threads);
        JsonQueueSource queue_source(options.queue_file);
        StaticUserSettings user_settings(config.settings);
        HostReachabilityProbeFactory probe_factory(config.reachability);

        {
            FileRepository repository(transfer_client, queue_source, user_settings, probe_factory, worker_pool,
                                      config.repository);

            if (!options.resolve_url.empty())
            {
                exit_code = resolveOne(repository, transfer_client, options);
            }

            if (options.preload_queue && exit_code == 0)
            {
                exit_code = preloadQueue(repository, worker_pool, transfer_client, options.remove_stale);
            }

            repository.flush();
        }

        worker_pool.shutdown();
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        Logger::error("Cache directory error: {}", e.what());
        exit_code = 1;
    }

    GlobalMetrics::shutdown();
    Logger::shutdown();
    return exit_code;
}
