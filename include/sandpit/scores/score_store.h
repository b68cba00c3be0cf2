#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

/**
 * @file score_store.h
 * @brief Persistence of quiz scores: `save_score` and `list_top_scores`.
 */

namespace sandpit::scores
{

inline constexpr std::size_t kMaxNameLength = 40;
inline constexpr std::int64_t kMinScore = 0;
inline constexpr std::int64_t kMaxScore = 100;
inline constexpr std::size_t kDefaultLimit = 10;

struct ScoreRecord
{
    std::int64_t id = 0;
    std::string name;
    std::int64_t score = 0;
    std::string created_at; /**< UTC, "YYYY-MM-DD HH:MM:SS". */
};

struct ScoreError
{
    std::string message;
};

using SaveResult = std::variant<std::int64_t, ScoreError>;
using Clock = std::function<std::chrono::system_clock::time_point()>;

/** @brief Trim `name` and check it is 1..kMaxNameLength characters. */
[[nodiscard]] std::variant<std::string, ScoreError> normalize_name(std::string_view name);

/** @brief "YYYY-MM-DD HH:MM:SS" in UTC. */
[[nodiscard]] std::string utc_timestamp(std::chrono::system_clock::time_point when);

/** @brief Highest score first; equal scores in insertion (id) order. */
[[nodiscard]] std::vector<ScoreRecord> top_scores(std::vector<ScoreRecord> records,
                                                  std::size_t limit);

class ScoreStore
{
  public:
    virtual ~ScoreStore() = default;

    /** @brief Validate and store a score; returns the new record id (1, 2, ...). */
    [[nodiscard]] virtual SaveResult save_score(std::string_view name, std::int64_t score) = 0;

    [[nodiscard]] virtual std::vector<ScoreRecord> list_top_scores(std::size_t limit) const = 0;
};

/** @brief Thread-safe in-memory store. */
class MemoryScoreStore : public ScoreStore
{
  public:
    explicit MemoryScoreStore(Clock clock = {});

    [[nodiscard]] SaveResult save_score(std::string_view name, std::int64_t score) override;
    [[nodiscard]] std::vector<ScoreRecord> list_top_scores(std::size_t limit) const override;

  private:
    Clock clock_;
    mutable std::mutex mutex_;
    std::vector<ScoreRecord> records_;
};

/**
 * @brief Append-only JSON-lines file store. Existing records are loaded on open and ids
 * continue after the highest one found.
 */
class FileScoreStore : public ScoreStore
{
  public:
    [[nodiscard]] static std::variant<std::unique_ptr<FileScoreStore>, ScoreError>
    open(std::string path, Clock clock = {});

    [[nodiscard]] SaveResult save_score(std::string_view name, std::int64_t score) override;
    [[nodiscard]] std::vector<ScoreRecord> list_top_scores(std::size_t limit) const override;

    [[nodiscard]] const std::string& path() const { return path_; }

  private:
    FileScoreStore(std::string path, Clock clock, std::vector<ScoreRecord> records);

    std::string path_;
    Clock clock_;
    mutable std::mutex mutex_;
    std::vector<ScoreRecord> records_;
};

} // namespace sandpit::scores
