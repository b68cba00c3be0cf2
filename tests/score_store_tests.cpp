#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sandpit/scores/score_store.h>
#include <string>
#include <variant>

namespace fs = std::filesystem;
using namespace sandpit::scores;

[[noreturn]] static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

static std::chrono::system_clock::time_point fixed_time()
{
    // 2024-03-01 12:30:45 UTC
    return std::chrono::system_clock::time_point(std::chrono::seconds(1709296245));
}

static std::int64_t save_ok(ScoreStore& store, std::string_view name, std::int64_t score)
{
    const auto result = store.save_score(name, score);
    if (const auto* err = std::get_if<ScoreError>(&result))
    {
        fail("save_score(" + std::string(name) + ") failed: " + err->message);
    }
    return std::get<std::int64_t>(result);
}

static void expect_save_error(ScoreStore& store, std::string_view name, std::int64_t score,
                              const std::string& needle)
{
    const auto result = store.save_score(name, score);
    const auto* err = std::get_if<ScoreError>(&result);
    if (err == nullptr || err->message.find(needle) == std::string::npos)
    {
        fail("expected save_score error containing '" + needle + "'");
    }
}

static void expect_ranking(const ScoreStore& store, std::size_t limit,
                           const std::vector<std::pair<std::string, std::int64_t>>& expected)
{
    const auto top = store.list_top_scores(limit);
    if (top.size() != expected.size())
    {
        fail("ranking size: got " + std::to_string(top.size()));
    }
    for (std::size_t i = 0; i < top.size(); ++i)
    {
        if (top[i].name != expected[i].first || top[i].score != expected[i].second)
        {
            fail("ranking position " + std::to_string(i) + ": got " + top[i].name + " " +
                 std::to_string(top[i].score));
        }
    }
}

static void test_memory_store()
{
    MemoryScoreStore store(fixed_time);
    if (save_ok(store, "Mia", 75) != 1 || save_ok(store, "Leo", 90) != 2 || save_ok(store, "Ana", 90) != 3)
    {
        fail("ids are assigned in insertion order");
    }
    expect_ranking(store, 3, {{"Leo", 90}, {"Ana", 90}, {"Mia", 75}});
    expect_ranking(store, 10, {{"Leo", 90}, {"Ana", 90}, {"Mia", 75}});
    expect_ranking(store, 2, {{"Leo", 90}, {"Ana", 90}});

    // A limit that cuts through a tie keeps the earlier entry.
    expect_ranking(store, 1, {{"Leo", 90}});
    save_ok(store, "Eva", 90);
    expect_ranking(store, 3, {{"Leo", 90}, {"Ana", 90}, {"Eva", 90}});
    expect_ranking(store, 2, {{"Leo", 90}, {"Ana", 90}});

    const auto top = store.list_top_scores(1);
    if (top[0].created_at != "2024-03-01 12:30:45")
    {
        fail("created_at: " + top[0].created_at);
    }

    expect_save_error(store, "   ", 50, "name must be between 1 and 40");
    expect_save_error(store, std::string(41, 'x'), 50, "name must be between 1 and 40");
    expect_save_error(store, "Zed", 101, "score must be between 0 and 100");
    expect_save_error(store, "Zed", -1, "score must be between 0 and 100");

    // Names are trimmed; the limit counts characters, not bytes.
    save_ok(store, "  Zoë  ", 10);
    save_ok(store, std::string(38, 'x') + "\xC3\xA9\xC3\xA9", 0);
    const auto all = store.list_top_scores(kDefaultLimit);
    if (all.size() != 6 || all[4].name != "Zoë")
    {
        fail("trimmed name should be stored");
    }
}

static void test_file_store()
{
    const fs::path path = fs::temp_directory_path() / "sandpit_score_store_tests.jsonl";
    (void)fs::remove(path);

    {
        auto opened = FileScoreStore::open(path.string(), fixed_time);
        if (!std::holds_alternative<std::unique_ptr<FileScoreStore>>(opened))
        {
            fail("opening a missing file creates an empty store");
        }
        auto& store = *std::get<std::unique_ptr<FileScoreStore>>(opened);
        save_ok(store, "Mia", 75);
        save_ok(store, "Leo", 90);
        save_ok(store, "Ana", 90);
        expect_ranking(store, 10, {{"Leo", 90}, {"Ana", 90}, {"Mia", 75}});
    }

    {
        // Reopening reloads the records and continues the ids.
        auto opened = FileScoreStore::open(path.string(), fixed_time);
        auto& store = *std::get<std::unique_ptr<FileScoreStore>>(opened);
        expect_ranking(store, 10, {{"Leo", 90}, {"Ana", 90}, {"Mia", 75}});
        if (save_ok(store, "Kai", 95) != 4)
        {
            fail("ids continue after reopening");
        }
        expect_ranking(store, 2, {{"Kai", 95}, {"Leo", 90}});
    }

    {
        std::ifstream in(path);
        std::string first;
        std::getline(in, first);
        if (first != R"({"created_at":"2024-03-01 12:30:45","id":1,"name":"Mia","score":75})")
        {
            fail("record format: " + first);
        }
    }

    {
        std::ofstream out(path, std::ios::app);
        out << "{not json\n";
    }
    {
        const auto opened = FileScoreStore::open(path.string(), fixed_time);
        const auto* err = std::get_if<ScoreError>(&opened);
        if (err == nullptr || err->message.find(":5: malformed score record") == std::string::npos)
        {
            fail("a corrupt line must be reported with its line number");
        }
    }

    (void)fs::remove(path);
}

int main()
{
    test_memory_store();
    test_file_store();
    std::cout << "OK\n";
    return 0;
}
