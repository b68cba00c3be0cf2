#include <algorithm>
#include <ctime>
#include <fstream>
#include <optional>
#include <sandpit/json/json.h>
#include <sandpit/scores/score_store.h>
#include <sandpit/source/utf8.h>
#include <utility>

namespace sandpit::scores
{
namespace
{

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::chrono::system_clock::time_point now(const Clock& clock)
{
    return clock ? clock() : std::chrono::system_clock::now();
}

std::variant<ScoreRecord, ScoreError> make_record(std::int64_t id, std::string_view name,
                                                  std::int64_t score, const Clock& clock)
{
    auto normalized = normalize_name(name);
    if (auto* error = std::get_if<ScoreError>(&normalized))
    {
        return std::move(*error);
    }
    if (score < kMinScore || score > kMaxScore)
    {
        return ScoreError{.message = "score must be between " + std::to_string(kMinScore) +
                                     " and " + std::to_string(kMaxScore)};
    }
    return ScoreRecord{.id = id,
                       .name = std::get<std::string>(std::move(normalized)),
                       .score = score,
                       .created_at = utc_timestamp(now(clock))};
}

std::string encode_record(const ScoreRecord& r)
{
    using sandpit::json::Json;
    Json::Object obj;
    obj.emplace("created_at", Json{r.created_at});
    obj.emplace("id", Json{static_cast<double>(r.id)});
    obj.emplace("name", Json{r.name});
    obj.emplace("score", Json{static_cast<double>(r.score)});
    return sandpit::json::serialize(Json{std::move(obj)});
}

std::optional<ScoreRecord> decode_record(std::string_view line)
{
    const auto parsed = sandpit::json::parse_json(line);
    if (!parsed.has_value() || !parsed->is_object())
    {
        return std::nullopt;
    }
    const auto& obj = *parsed->as_object();
    const auto id = sandpit::json::get_unsigned(obj, "id");
    const auto score = sandpit::json::get_unsigned(obj, "score");
    auto name = sandpit::json::get_string(obj, "name");
    auto created_at = sandpit::json::get_string(obj, "created_at");
    if (!id.has_value() || !score.has_value() || !name.has_value() || !created_at.has_value())
    {
        return std::nullopt;
    }
    return ScoreRecord{.id = static_cast<std::int64_t>(*id),
                       .name = std::move(*name),
                       .score = static_cast<std::int64_t>(*score),
                       .created_at = std::move(*created_at)};
}

} // namespace

std::variant<std::string, ScoreError> normalize_name(std::string_view name)
{
    while (!name.empty() && is_space(name.front()))
    {
        name.remove_prefix(1);
    }
    while (!name.empty() && is_space(name.back()))
    {
        name.remove_suffix(1);
    }
    const std::size_t length = sandpit::source::code_point_count(name);
    if (length == 0 || length > kMaxNameLength)
    {
        return ScoreError{.message = "name must be between 1 and " +
                                     std::to_string(kMaxNameLength) + " characters"};
    }
    return std::string(name);
}

std::string utc_timestamp(std::chrono::system_clock::time_point when)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return std::string(buf, n);
}

std::vector<ScoreRecord> top_scores(std::vector<ScoreRecord> records, std::size_t limit)
{
    std::stable_sort(records.begin(), records.end(),
                     [](const ScoreRecord& a, const ScoreRecord& b)
                     {
                         if (a.score != b.score)
                         {
                             return a.score > b.score;
                         }
                         return a.id < b.id;
                     });
    if (records.size() > limit)
    {
        records.resize(limit);
    }
    return records;
}

MemoryScoreStore::MemoryScoreStore(Clock clock) : clock_(std::move(clock)) {}

SaveResult MemoryScoreStore::save_score(std::string_view name, std::int64_t score)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto record = make_record(static_cast<std::int64_t>(records_.size()) + 1, name, score, clock_);
    if (auto* error = std::get_if<ScoreError>(&record))
    {
        return std::move(*error);
    }
    records_.push_back(std::get<ScoreRecord>(std::move(record)));
    return records_.back().id;
}

std::vector<ScoreRecord> MemoryScoreStore::list_top_scores(std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return top_scores(records_, limit);
}

FileScoreStore::FileScoreStore(std::string path, Clock clock, std::vector<ScoreRecord> records)
    : path_(std::move(path)), clock_(std::move(clock)), records_(std::move(records))
{
}

std::variant<std::unique_ptr<FileScoreStore>, ScoreError> FileScoreStore::open(std::string path,
                                                                               Clock clock)
{
    std::vector<ScoreRecord> records;
    std::ifstream in(path);
    if (in)
    {
        std::string line;
        std::size_t line_no = 0;
        while (std::getline(in, line))
        {
            ++line_no;
            if (line.empty())
            {
                continue;
            }
            auto record = decode_record(line);
            if (!record.has_value())
            {
                return ScoreError{.message = path + ":" + std::to_string(line_no) +
                                             ": malformed score record"};
            }
            records.push_back(std::move(*record));
        }
        if (in.bad())
        {
            return ScoreError{.message = "failed to read " + path};
        }
    }
    return std::unique_ptr<FileScoreStore>(
        new FileScoreStore(std::move(path), std::move(clock), std::move(records)));
}

SaveResult FileScoreStore::save_score(std::string_view name, std::int64_t score)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::int64_t next_id = 1;
    for (const auto& r : records_)
    {
        next_id = std::max(next_id, r.id + 1);
    }
    auto record = make_record(next_id, name, score, clock_);
    if (auto* error = std::get_if<ScoreError>(&record))
    {
        return std::move(*error);
    }
    auto& stored = std::get<ScoreRecord>(record);

    std::ofstream out(path_, std::ios::app);
    out << encode_record(stored) << "\n";
    out.flush();
    if (!out)
    {
        return ScoreError{.message = "failed to write " + path_};
    }
    records_.push_back(std::move(stored));
    return records_.back().id;
}

std::vector<ScoreRecord> FileScoreStore::list_top_scores(std::size_t limit) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return top_scores(records_, limit);
}

} // namespace sandpit::scores
