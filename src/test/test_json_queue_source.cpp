#include <catch2/catch_test_macros.hpp>
#include <enclosure-cache/json_queue_source.hpp>
#include <filesystem>
#include <fstream>

using namespace EnclosureCache;

namespace
{
std::vector<std::string> collect(std::string_view json, std::optional<RepositoryError> &error)
{
    std::vector<std::string> urls;
    error = JsonQueueSource::enumerateString(json,
                                             [&urls](const MediaUrl &url)
                                             {
                                                 urls.push_back(url.str());
                                             });
    return urls;
}
} // namespace

TEST_CASE("JsonQueueSource enumerates in queue order", "[queue]")
{
    std::optional<RepositoryError> error;
    auto urls = collect(R"({"episodes": [
        {"title": "First", "enclosure": "https://cdn.example.com/1.mp3"},
        {"title": "Second", "enclosure": "https://cdn.example.com/2.mp3"},
        {"enclosure": "https://cdn.example.com/3.m4a"}
    ]})",
                        error);

    REQUIRE_FALSE(error.has_value());
    REQUIRE(urls == std::vector<std::string>{ "https://cdn.example.com/1.mp3", "https://cdn.example.com/2.mp3",
                                              "https://cdn.example.com/3.m4a" });
}

TEST_CASE("JsonQueueSource skips episodes without enclosures", "[queue]")
{
    std::optional<RepositoryError> error;
    auto urls = collect(R"({"episodes": [
        {"title": "Text only"},
        {"title": "Null", "enclosure": null},
        {"title": "Audio", "enclosure": "https://cdn.example.com/1.mp3"}
    ]})",
                        error);

    REQUIRE_FALSE(error.has_value());
    REQUIRE(urls == std::vector<std::string>{ "https://cdn.example.com/1.mp3" });
}

TEST_CASE("JsonQueueSource reports unreadable entries but keeps going", "[queue]")
{
    std::optional<RepositoryError> error;
    auto urls = collect(R"({"episodes": [
        {"title": "Broken", "enclosure": "not a url"},
        {"title": 42, "enclosure": 17},
        "just a string",
        {"title": "Audio", "enclosure": "https://cdn.example.com/1.mp3"}
    ]})",
                        error);

    REQUIRE(error.has_value());
    REQUIRE(error->kind() == ErrorKind::MISSING_ENTRIES);
    REQUIRE(urls == std::vector<std::string>{ "https://cdn.example.com/1.mp3" });
}

TEST_CASE("JsonQueueSource enumeration failures", "[queue]")
{
    std::optional<RepositoryError> error;

    SECTION("Malformed JSON")
    {
        REQUIRE(collect("{\"episodes\": [", error).empty());
        REQUIRE(error.has_value());
        REQUIRE(error->kind() == ErrorKind::ENUMERATION);
    }

    SECTION("No episodes array")
    {
        REQUIRE(collect(R"({"episodes": {}})", error).empty());
        REQUIRE(error.has_value());
        REQUIRE(error->kind() == ErrorKind::ENUMERATION);
    }

    SECTION("Missing file")
    {
        JsonQueueSource source("/nonexistent/queue.json");
        error = source.enumerate(
        [](const MediaUrl &)
        {
        });
        REQUIRE(error.has_value());
        REQUIRE(error->kind() == ErrorKind::ENUMERATION);
    }
}

TEST_CASE("JsonQueueSource reads its file on every enumeration", "[queue]")
{
    const auto path = std::filesystem::temp_directory_path() / "enclosure-cache-queue-test.json";
    JsonQueueSource source(path);

    auto write = [&path](const std::string &content)
    {
        std::ofstream file(path, std::ios::trunc);
        file << content;
    };

    size_t seen = 0;
    auto count = [&seen](const MediaUrl &)
    {
        seen++;
    };

    write(R"({"episodes": [{"enclosure": "https://cdn.example.com/1.mp3"}]})");
    REQUIRE_FALSE(source.enumerate(count).has_value());
    REQUIRE(seen == 1);

    write(R"({"episodes": []})");
    seen = 0;
    REQUIRE_FALSE(source.enumerate(count).has_value());
    REQUIRE(seen == 0);

    std::filesystem::remove(path);
}
