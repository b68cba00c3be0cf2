#include <charconv>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <sandpit/cli/cli.h>
#include <sandpit/config/config.h>
#include <sandpit/diag/render.h>
#include <sandpit/engine/engine.h>
#include <sandpit/lexer/lexer.h>
#include <sandpit/log/log.h>
#include <sandpit/parser/parser.h>
#include <sandpit/result/envelope.h>
#include <sandpit/scores/score_store.h>
#include <sandpit/source/line_map.h>
#include <sandpit/source/source_file.h>
#include <sandpit/validate/validator.h>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace sandpit::cli
{

namespace
{

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitUsage = 2;

void print_usage(std::ostream& out)
{
    out << "sandpit: run untrusted Python-subset scripts in an isolated runner\n\n";
    out << "usage:\n";
    out << "  sandpit --help\n";
    out << "  sandpit run [--config <file>] [--timeout-ms <n>] [--runner <path>] [--json] "
           "<file|->\n";
    out << "  sandpit check <file|->\n";
    out << "  sandpit lex <file|->\n";
    out << "  sandpit parse <file|->\n";
    out << "  sandpit scores add --db <file> <name> <score>\n";
    out << "  sandpit scores top --db <file> [--limit <n>]\n";
    out << "  sandpit doctor [--config <file>] [--runner <path>]\n";
}

bool is_help_flag(std::string_view arg)
{
    return arg == "--help" || arg == "-h" || arg == "help";
}

int usage_error(std::string_view message)
{
    std::cerr << "error: " << message << "\n\n";
    print_usage(std::cerr);
    return kExitUsage;
}

std::optional<std::int64_t> parse_int(std::string_view text)
{
    std::int64_t value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (first != last && *first == '+')
    {
        ++first;
    }
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || first == last)
    {
        return std::nullopt;
    }
    return value;
}

/**
 * @brief Option scanner accepting both `--name value` and `--name=value`.
 */
class Args
{
  public:
    explicit Args(std::vector<std::string_view> args) : args_(std::move(args)) {}

    [[nodiscard]] bool done() const { return i_ >= args_.size(); }
    [[nodiscard]] std::string_view peek() const { return args_[i_]; }
    void skip() { ++i_; }

    /** Returns true if the current argument is `name`; value goes to `out`, errors to `err`. */
    bool option(std::string_view name, std::optional<std::string>& out, std::string& err)
    {
        const std::string_view a = args_[i_];
        if (a == name)
        {
            if (i_ + 1 >= args_.size())
            {
                err = "expected a value after " + std::string(name);
                return true;
            }
            out = std::string(args_[i_ + 1]);
            i_ += 2;
            return true;
        }
        if (a.size() > name.size() && a.starts_with(name) && a[name.size()] == '=')
        {
            const auto value = a.substr(name.size() + 1);
            if (value.empty())
            {
                err = "expected a value after " + std::string(name) + "=";
                return true;
            }
            out = std::string(value);
            ++i_;
            return true;
        }
        return false;
    }

  private:
    std::vector<std::string_view> args_;
    std::size_t i_ = 0;
};

struct EngineFlags
{
    std::optional<std::string> config_path;
    std::optional<std::string> timeout_ms;
    std::optional<std::string> runner;
};

std::optional<sandpit::config::Config> build_config(const EngineFlags& flags)
{
    using sandpit::config::Config;
    using sandpit::config::ConfigError;
    using sandpit::config::ConfigResult;

    ConfigResult result = Config{};
    if (flags.config_path.has_value())
    {
        result = sandpit::config::load_file(std::get<Config>(result), *flags.config_path);
    }
    if (std::holds_alternative<Config>(result))
    {
        result = sandpit::config::apply_env(std::get<Config>(result), sandpit::config::process_env());
    }
    if (std::holds_alternative<Config>(result) && flags.timeout_ms.has_value())
    {
        result = sandpit::config::set_value(std::get<Config>(result), "timeout_ms", *flags.timeout_ms);
    }
    if (std::holds_alternative<Config>(result) && flags.runner.has_value())
    {
        result = sandpit::config::set_value(std::get<Config>(result), "runner_path", *flags.runner);
    }

    if (const auto* err = std::get_if<ConfigError>(&result))
    {
        std::cerr << "error: invalid configuration: ";
        if (!err->key.empty())
        {
            std::cerr << err->key << ": ";
        }
        std::cerr << err->message << "\n";
        return std::nullopt;
    }
    return std::get<Config>(result);
}

std::optional<sandpit::source::SourceFile> load(const std::string& path)
{
    auto loaded = sandpit::source::load_source_file(path);
    if (const auto* err = std::get_if<sandpit::source::LoadError>(&loaded))
    {
        std::cerr << "error: " << err->message << "\n";
        return std::nullopt;
    }
    return std::get<sandpit::source::SourceFile>(std::move(loaded));
}

int cmd_run(const EngineFlags& flags, bool json, const std::string& path)
{
    const auto config = build_config(flags);
    if (!config.has_value())
    {
        return kExitError;
    }
    const auto file = load(path);
    if (!file.has_value())
    {
        return kExitError;
    }

    const sandpit::engine::Engine engine(*config);
    const auto envelope = engine.run(sandpit::engine::ExecutionRequest{.source_text = file->contents});

    if (json)
    {
        std::cout << sandpit::result::to_json(envelope) << "\n";
        return envelope.ok ? kExitOk : kExitError;
    }

    if (envelope.output.has_value())
    {
        std::cout << *envelope.output;
    }
    if (envelope.error.has_value())
    {
        std::cerr << "error: " << envelope.error->kind << ": " << envelope.error->message << "\n";
        return kExitError;
    }
    return kExitOk;
}

int cmd_check(const std::string& path)
{
    const auto file = load(path);
    if (!file.has_value())
    {
        return kExitError;
    }

    const auto validated = sandpit::validate::validate(file->contents);
    if (const auto* violation = std::get_if<sandpit::validate::Violation>(&validated))
    {
        std::cerr << sandpit::diag::render(sandpit::validate::to_diagnostic(*violation), *file);
        return kExitError;
    }

    const auto parsed = sandpit::parser::parse_source(file->contents);
    if (const auto* diags = std::get_if<std::vector<sandpit::diag::Diagnostic>>(&parsed))
    {
        for (const auto& d : *diags)
        {
            std::cerr << sandpit::diag::render(d, *file);
        }
        return kExitError;
    }

    std::cout << "sandpit check: ok\n";
    return kExitOk;
}

int cmd_lex(const std::string& path)
{
    const auto file = load(path);
    if (!file.has_value())
    {
        return kExitError;
    }

    const auto lexed = sandpit::lexer::lex(file->contents);
    if (const auto* d = std::get_if<sandpit::diag::Diagnostic>(&lexed))
    {
        std::cerr << sandpit::diag::render(*d, *file);
        return kExitError;
    }

    const auto& tokens = std::get<std::vector<sandpit::lexer::Token>>(lexed);
    const sandpit::source::LineMap map(file->contents);
    for (const auto& token : tokens)
    {
        const auto pos = map.offset_to_line_col(token.span.start);
        std::cout << pos.line << ":" << pos.col << " " << sandpit::lexer::to_string(token.kind);
        if (!token.lexeme.empty() && token.lexeme.find('\n') == std::string_view::npos)
        {
            std::cout << " " << token.lexeme;
        }
        std::cout << "\n";
    }
    std::cout << "sandpit lex: " << tokens.size() << " tokens\n";
    return kExitOk;
}

int cmd_parse(const std::string& path)
{
    const auto file = load(path);
    if (!file.has_value())
    {
        return kExitError;
    }

    const auto parsed = sandpit::parser::parse_source(file->contents);
    if (const auto* diags = std::get_if<std::vector<sandpit::diag::Diagnostic>>(&parsed))
    {
        for (const auto& d : *diags)
        {
            std::cerr << sandpit::diag::render(d, *file);
        }
        return kExitError;
    }

    std::cout << sandpit::parser::dump(std::get<sandpit::parser::Program>(parsed)) << "\n";
    return kExitOk;
}

int cmd_doctor(const EngineFlags& flags)
{
    const auto config = build_config(flags);
    if (!config.has_value())
    {
        return kExitError;
    }

    const sandpit::engine::Engine engine(*config);
    std::cout << "sandpit doctor:\n";
    std::cout << "runner: " << engine.runner_path() << "\n";
    std::cout << "timeout_ms: " << config->timeout_ms << "\n";
    std::cout << "max_output_bytes: " << config->max_output_bytes << "\n";
    std::cout << "max_source_bytes: " << config->max_source_bytes << "\n";

    if (const auto problem = engine.handshake())
    {
        std::cout << "handshake: failed\n";
        std::cerr << "error: runner handshake failed: " << *problem << "\n";
        return kExitError;
    }
    std::cout << "handshake: ok\n";
    return kExitOk;
}

std::unique_ptr<sandpit::scores::FileScoreStore> open_store(const std::string& path)
{
    auto opened = sandpit::scores::FileScoreStore::open(path);
    if (const auto* err = std::get_if<sandpit::scores::ScoreError>(&opened))
    {
        std::cerr << "error: " << err->message << "\n";
        return nullptr;
    }
    return std::get<std::unique_ptr<sandpit::scores::FileScoreStore>>(std::move(opened));
}

int cmd_scores(const std::vector<std::string_view>& all)
{
    if (all.empty())
    {
        return usage_error("expected sandpit scores <add|top> --db <file> ...");
    }

    const std::string_view sub = all[0];
    Args args(std::vector<std::string_view>(all.begin() + 1, all.end()));
    std::optional<std::string> db;
    std::optional<std::string> limit_text;
    std::vector<std::string_view> positional;

    while (!args.done())
    {
        std::string err;
        if (args.option("--db", db, err) || (sub == "top" && args.option("--limit", limit_text, err)))
        {
            if (!err.empty())
            {
                return usage_error(err);
            }
            continue;
        }
        const std::string_view a = args.peek();
        if (a.starts_with("--"))
        {
            return usage_error("unknown option: " + std::string(a));
        }
        positional.push_back(a);
        args.skip();
    }

    if (!db.has_value())
    {
        return usage_error("expected --db <file>");
    }

    if (sub == "add")
    {
        if (positional.size() != 2)
        {
            return usage_error("expected sandpit scores add --db <file> <name> <score>");
        }
        const auto score = parse_int(positional[1]);
        if (!score.has_value())
        {
            return usage_error("score must be an integer: " + std::string(positional[1]));
        }

        const auto store = open_store(*db);
        if (!store)
        {
            return kExitError;
        }
        const auto saved = store->save_score(positional[0], *score);
        if (const auto* err = std::get_if<sandpit::scores::ScoreError>(&saved))
        {
            std::cerr << "error: " << err->message << "\n";
            return kExitError;
        }
        std::cout << "sandpit scores: saved #" << std::get<std::int64_t>(saved) << "\n";
        return kExitOk;
    }

    if (sub == "top")
    {
        if (!positional.empty())
        {
            return usage_error("unexpected argument: " + std::string(positional[0]));
        }
        std::size_t limit = sandpit::scores::kDefaultLimit;
        if (limit_text.has_value())
        {
            const auto parsed = parse_int(*limit_text);
            if (!parsed.has_value() || *parsed < 1)
            {
                return usage_error("limit must be a positive integer: " + *limit_text);
            }
            limit = static_cast<std::size_t>(*parsed);
        }

        const auto store = open_store(*db);
        if (!store)
        {
            return kExitError;
        }
        std::size_t rank = 1;
        for (const auto& record : store->list_top_scores(limit))
        {
            std::cout << rank++ << ". " << record.name << " " << record.score << " ("
                      << record.created_at << ")\n";
        }
        return kExitOk;
    }

    return usage_error("unknown scores subcommand: " + std::string(sub));
}

} // namespace

int run(int argc, char** argv)
{
    if (argc <= 1)
    {
        print_usage(std::cerr);
        return kExitUsage;
    }

    const std::string_view cmd = argv[1];
    if (is_help_flag(cmd))
    {
        print_usage(std::cout);
        return kExitOk;
    }

    std::vector<std::string_view> rest;
    for (int i = 2; i < argc; ++i)
    {
        rest.push_back(argv[i]);
    }

    if (cmd == "scores")
    {
        return cmd_scores(rest);
    }

    if (cmd == "run" || cmd == "doctor")
    {
        EngineFlags flags;
        bool json = false;
        std::optional<std::string> path;

        Args args(rest);
        while (!args.done())
        {
            std::string err;
            if (args.option("--config", flags.config_path, err) ||
                args.option("--runner", flags.runner, err) ||
                (cmd == "run" && args.option("--timeout-ms", flags.timeout_ms, err)))
            {
                if (!err.empty())
                {
                    return usage_error(err);
                }
                continue;
            }

            const std::string_view a = args.peek();
            if (cmd == "run" && a == "--json")
            {
                json = true;
                args.skip();
                continue;
            }
            if (a.starts_with('-') && a != "-")
            {
                return usage_error("unknown option: " + std::string(a));
            }
            if (cmd == "doctor" || path.has_value())
            {
                return usage_error("unexpected argument: " + std::string(a));
            }
            path = std::string(a);
            args.skip();
        }

        if (cmd == "doctor")
        {
            return cmd_doctor(flags);
        }
        if (!path.has_value())
        {
            return usage_error("expected <file> (or - for stdin)");
        }
        sandpit::log::debug("cli: run " + *path);
        return cmd_run(flags, json, *path);
    }

    if (cmd != "check" && cmd != "lex" && cmd != "parse")
    {
        return usage_error("unknown command: " + std::string(cmd));
    }
    if (rest.size() != 1)
    {
        return usage_error("expected sandpit " + std::string(cmd) + " <file>");
    }
    const std::string path(rest[0]);

    if (cmd == "check")
    {
        return cmd_check(path);
    }
    if (cmd == "lex")
    {
        return cmd_lex(path);
    }
    return cmd_parse(path);
}

} // namespace sandpit::cli
