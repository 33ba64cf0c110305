#include "sextant/backend/connection_profile.hpp"
#include "sextant/credential/credential_resolver.hpp"
#include "sextant/credential/credential_store.hpp"
#include "sextant/navigation/navigation_state_machine.hpp"
#include "sextant/query/sql_text.hpp"
#include "sextant/tools/navigation_log_formatter.hpp"
#include "sextant/value/value_format.hpp"

#include <CLI/CLI.hpp>
#include <replxx.hxx>

#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

using sextant::navigation::Intent;
using sextant::navigation::NavigationSnapshot;
using sextant::navigation::NavigationStateMachine;
using sextant::navigation::ViewState;

volatile std::sig_atomic_t g_interrupted = 0;

void handle_interrupt(int)
{
    g_interrupted = 1;
}

std::filesystem::path history_path()
{
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return {};
    }

    std::filesystem::path path{home};
    path /= ".sextant_history";
    return path;
}

// Reads a line from the terminal without echoing it. Returns nullopt on EOF.
std::optional<std::string> read_secret(const std::string& prompt)
{
    std::cerr << prompt << std::flush;

    termios saved{};
    const bool is_terminal = ::isatty(STDIN_FILENO) != 0 && ::tcgetattr(STDIN_FILENO, &saved) == 0;
    if (is_terminal) {
        termios silent = saved;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        if (::tcsetattr(STDIN_FILENO, TCSANOW, &silent) != 0) {
            std::cerr << "warning: password will be echoed\n";
        }
    }

    std::string secret;
    const bool read = static_cast<bool>(std::getline(std::cin, secret));

    if (is_terminal) {
        if (::tcsetattr(STDIN_FILENO, TCSANOW, &saved) != 0) {
            std::cerr << "warning: could not restore terminal settings\n";
        }
        std::cerr << '\n';
    }
    if (!read) {
        return std::nullopt;
    }
    return secret;
}

// user@host[:port][/database]
bool parse_postgres_target(std::string_view text, sextant::backend::ConnectionProfile& profile, std::string& error)
{
    const auto at = text.find('@');
    if (at == std::string_view::npos || at == 0U) {
        error = "expected user@host[:port][/database]";
        return false;
    }
    profile.username = std::string{text.substr(0U, at)};
    auto rest = text.substr(at + 1U);

    if (const auto slash = rest.find('/'); slash != std::string_view::npos) {
        profile.database = std::string{rest.substr(slash + 1U)};
        rest = rest.substr(0U, slash);
    }

    if (const auto colon = rest.rfind(':'); colon != std::string_view::npos) {
        const auto port_text = rest.substr(colon + 1U);
        std::uint16_t port = 0U;
        const auto [end, ec] = std::from_chars(port_text.data(), port_text.data() + port_text.size(), port);
        if (ec != std::errc{} || end != port_text.data() + port_text.size() || port == 0U) {
            error = "invalid port '" + std::string{port_text} + "'";
            return false;
        }
        profile.port = port;
        rest = rest.substr(0U, colon);
    }

    profile.host = std::string{rest};
    if (profile.host.empty()) {
        error = "host is required";
        return false;
    }
    return true;
}

bool parse_attachment(std::string_view text, sextant::backend::AttachedDatabase& attached)
{
    const auto equals = text.find('=');
    if (equals == std::string_view::npos || equals == 0U || equals + 1U == text.size()) {
        return false;
    }
    attached.alias = std::string{text.substr(0U, equals)};
    attached.file_path = std::filesystem::path{std::string{text.substr(equals + 1U)}};
    return true;
}

std::optional<std::size_t> parse_index(std::string_view text)
{
    std::size_t index = 0U;
    const auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), index);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return index;
}

void render_snapshot(const NavigationSnapshot& snapshot, std::size_t page_rows)
{
    std::cout << '[' << sextant::navigation::to_string(snapshot.state);
    if (!snapshot.environment_label.empty()) {
        std::cout << ' ' << snapshot.environment_label;
    }
    std::cout << ']';
    for (const auto& crumb : snapshot.breadcrumb) {
        std::cout << " > " << crumb;
    }
    if (!snapshot.filter.empty()) {
        std::cout << " (filter: " << snapshot.filter << ')';
    }
    std::cout << '\n';

    if (snapshot.error) {
        std::cout << "error: " << snapshot.error->message;
        if (!snapshot.error->sqlstate.empty()) {
            std::cout << " (SQLSTATE " << snapshot.error->sqlstate << ')';
        }
        std::cout << '\n';
    }

    if (snapshot.state == ViewState::QueryEditor) {
        std::cout << "enter SQL terminated with ';'\n";
        return;
    }

    const auto& contents = snapshot.contents;
    if (!contents) {
        return;
    }
    if (contents->column_count() == 0U) {
        std::cout << (contents->command_tag().empty() ? "OK" : contents->command_tag());
        if (contents->rows_affected()) {
            std::cout << ' ' << *contents->rows_affected();
        }
        std::cout << '\n';
        return;
    }

    sextant::value::FormatOptions options{};
    options.max_text_length = 48U;

    std::cout << "     ";
    for (std::size_t column = 0; column < contents->column_count(); ++column) {
        std::cout << (column == 0U ? "" : " | ") << contents->columns()[column].name;
    }
    std::cout << '\n';

    const auto shown = std::min(page_rows, snapshot.visible_rows.size());
    for (std::size_t position = 0; position < shown; ++position) {
        const auto& row = contents->rows()[snapshot.visible_rows[position]];
        const bool selected = snapshot.selection && *snapshot.selection == position;
        std::cout << (selected ? '>' : ' ') << std::setw(3) << position << ' ';
        for (std::size_t column = 0; column < row.size(); ++column) {
            std::cout << (column == 0U ? "" : " | ") << sextant::value::format_value(row[column], options);
        }
        std::cout << '\n';
    }
    if (shown < snapshot.visible_rows.size()) {
        std::cout << "  ... " << snapshot.visible_rows.size() - shown << " more\n";
    }
    if (contents->truncated()) {
        std::cout << "  (result truncated)\n";
    }
    std::cout << '(' << snapshot.visible_rows.size() << " of " << contents->row_count() << " rows)\n";
}

// Blocks until the machine is idle. Ctrl-C while waiting cancels the request.
void settle(NavigationStateMachine& machine)
{
    g_interrupted = 0;
    while (!machine.wait_until_idle(std::chrono::milliseconds{100})) {
        if (g_interrupted != 0) {
            g_interrupted = 0;
            machine.dispatch(Intent::cancel());
        }
    }
}

void print_help()
{
    std::cout << "Commands:\n";
    std::cout << "  \\e [N|name]   Enter the selected, numbered or named entry\n";
    std::cout << "  \\b            Back (disconnects from the database list)\n";
    std::cout << "  \\r            Refresh the current view\n";
    std::cout << "  \\s N          Select entry N\n";
    std::cout << "  \\n, \\p        Move the selection down or up\n";
    std::cout << "  \\f [text]     Filter the current list; no text clears\n";
    std::cout << "  \\sql          Open the query editor\n";
    std::cout << "  \\x            Cancel the running request (or press Ctrl-C)\n";
    std::cout << "  \\k            Dismiss the error banner\n";
    std::cout << "  \\d            Disconnect\n";
    std::cout << "  \\stats        Show navigation counters\n";
    std::cout << "  \\q            Quit\n";
    std::cout << "  SQL statements end with ';'\n";
}

void print_stats(const NavigationStateMachine& machine)
{
    const auto stats = machine.telemetry();
    std::cout << "intents=" << stats.intents << " requests=" << stats.requests_issued
              << " applied=" << stats.responses_applied << " stale=" << stats.stale_responses_dropped
              << " cancelled=" << stats.cancellations << " errors=" << stats.errors
              << " cache_hits=" << stats.cache_hits << " rows=" << stats.rows_received << '\n';
}

enum class CommandResult {
    Handled,
    Unknown,
    Quit
};

CommandResult run_command(NavigationStateMachine& machine, std::string_view command)
{
    const auto space = command.find(' ');
    const auto name = command.substr(0U, space);
    const auto argument = space == std::string_view::npos ? std::string{} : sextant::query::trim(command.substr(space + 1U));

    if (name == "\\q" || name == "\\quit") {
        return CommandResult::Quit;
    }
    if (name == "\\help" || name == "\\?") {
        print_help();
    } else if (name == "\\e" || name == "\\c") {
        if (argument.empty()) {
            machine.dispatch(Intent::enter());
        } else if (const auto index = parse_index(argument)) {
            machine.dispatch(Intent::enter(*index));
        } else {
            machine.dispatch(Intent::enter_named(argument));
        }
    } else if (name == "\\b") {
        machine.dispatch(Intent::back());
    } else if (name == "\\r") {
        machine.dispatch(Intent::refresh());
    } else if (name == "\\s") {
        const auto index = parse_index(argument);
        if (!index) {
            std::cerr << "error: \\s expects an entry number\n";
            return CommandResult::Handled;
        }
        machine.dispatch(Intent::select(*index));
    } else if (name == "\\n") {
        machine.dispatch(Intent::move_selection(1));
    } else if (name == "\\p") {
        machine.dispatch(Intent::move_selection(-1));
    } else if (name == "\\f") {
        machine.dispatch(Intent::filter(argument));
    } else if (name == "\\sql") {
        machine.dispatch(Intent::open_query_editor());
    } else if (name == "\\x") {
        machine.dispatch(Intent::cancel());
    } else if (name == "\\k") {
        machine.dispatch(Intent::dismiss_error());
    } else if (name == "\\d") {
        machine.dispatch(Intent::disconnect());
    } else if (name == "\\stats") {
        print_stats(machine);
        return CommandResult::Handled;
    } else {
        return CommandResult::Unknown;
    }
    return CommandResult::Handled;
}

// Feeds one input unit (a backslash command or a complete statement).
bool handle_input(NavigationStateMachine& machine, const std::string& input, std::size_t page_rows)
{
    if (input.rfind('\\', 0U) == 0U) {
        const auto result = run_command(machine, input);
        if (result == CommandResult::Quit) {
            return false;
        }
        if (result == CommandResult::Unknown) {
            std::cerr << "error: unknown command '" << input << "' (try \\help)\n";
            return true;
        }
    } else {
        machine.dispatch(Intent::run_query(input));
    }

    settle(machine);
    render_snapshot(machine.snapshot(), page_rows);
    return true;
}

int run_repl(NavigationStateMachine& machine, bool quiet, std::size_t page_rows)
{
    replxx::Replxx repl;

    const auto history = history_path();
    if (!history.empty()) {
        (void)repl.history_load(history.string());
    }

    if (!quiet) {
        std::cout << "sextant: pick a connection with \\e N, or type \\help.\n";
    }
    render_snapshot(machine.snapshot(), page_rows);

    std::string buffer;
    while (true) {
        const char* line = repl.input(buffer.empty() ? "sextant> " : "...> ");
        if (line == nullptr) {
            std::cout << '\n';
            break;
        }

        const auto trimmed = sextant::query::trim(line);
        if (buffer.empty() && trimmed.rfind('\\', 0U) == 0U) {
            repl.history_add(trimmed);
            if (!handle_input(machine, trimmed, page_rows)) {
                break;
            }
            continue;
        }

        if (trimmed.empty()) {
            if (!buffer.empty()) {
                buffer.append(line);
                buffer.push_back('\n');
            }
            continue;
        }

        buffer.append(line);
        buffer.push_back('\n');
        if (!sextant::query::statement_complete(buffer)) {
            continue;
        }

        const auto statement = sextant::query::trim(buffer);
        repl.history_add(statement);
        buffer.clear();
        if (!handle_input(machine, statement, page_rows)) {
            break;
        }
        if (!history.empty() && !repl.history_save(history.string())) {
            std::cerr << "error: failed to save history to '" << history.string() << "'\n";
        }
    }

    return 0;
}

int run_batch(NavigationStateMachine& machine, const std::vector<std::string>& commands, std::size_t page_rows)
{
    int exit_code = 0;
    for (const auto& command : commands) {
        if (!handle_input(machine, sextant::query::trim(command), page_rows)) {
            break;
        }
        if (machine.snapshot().error) {
            exit_code = 1;
        }
    }
    return exit_code;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Terminal database browser for PostgreSQL and SQLite."};

    bool quiet = false;
    std::vector<std::string> commands;
    std::vector<std::string> sqlite_paths;
    std::vector<std::string> attachments;
    std::vector<std::string> postgres_targets;
    std::string profile_name;
    std::string default_schema;
    std::string environment_name{"dev"};
    std::string policy_name{"store"};
    std::string log_json_path;
    std::size_t batch_size = 256U;
    std::size_t max_rows = 10'000U;
    std::size_t browse_limit = sextant::backend::kDefaultBrowseLimit;
    std::size_t workers = 2U;
    std::size_t page_rows = 50U;
    int connect_timeout = 10;

    app.add_flag("-q,--quiet", quiet, "Suppress startup banner");
    app.add_option("-c,--command", commands, "Run a command or SQL statement and exit (repeatable)")
        ->type_name("CMD")
        ->expected(1);
    app.add_option("--sqlite", sqlite_paths, "Add a SQLite database file to the connection list")
        ->type_name("PATH")
        ->expected(1);
    app.add_option("--attach", attachments, "Attach a SQLite file as a schema of the SQLite connections")
        ->type_name("ALIAS=PATH")
        ->expected(1);
    app.add_option("--postgres", postgres_targets, "Add a PostgreSQL server to the connection list")
        ->type_name("USER@HOST[:PORT][/DB]")
        ->expected(1);
    app.add_option("--name", profile_name, "Display name for a single connection");
    app.add_option("--schema", default_schema, "Schema preselected after connecting");
    app.add_option("--env", environment_name, "Environment label (dev, staging, prod)");
    app.add_option("--password-policy", policy_name, "Password handling (store, prompt-always, never-save)");
    app.add_option("--log-json", log_json_path, "Write navigation events as JSON Lines (use '-' for stdout)");
    app.add_option("--batch-size", batch_size, "Rows fetched per batch")->check(CLI::PositiveNumber);
    app.add_option("--max-rows", max_rows, "Rows kept per query result")->check(CLI::PositiveNumber);
    app.add_option("--browse-limit", browse_limit, "Rows shown when browsing a table")->check(CLI::PositiveNumber);
    app.add_option("--workers", workers, "Background worker threads")->check(CLI::PositiveNumber);
    app.add_option("--page", page_rows, "Rows printed per view")->check(CLI::PositiveNumber);
    app.add_option("--connect-timeout", connect_timeout, "Connect timeout in seconds")->check(CLI::PositiveNumber);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    }

    const auto environment = sextant::backend::parse_environment_tag(environment_name);
    if (!environment) {
        std::cerr << "error: unknown environment '" << environment_name << "'\n";
        return 1;
    }
    const auto policy = sextant::backend::parse_credential_policy(policy_name);
    if (!policy) {
        std::cerr << "error: unknown password policy '" << policy_name << "'\n";
        return 1;
    }

    std::vector<sextant::backend::AttachedDatabase> attached;
    for (const auto& attachment : attachments) {
        sextant::backend::AttachedDatabase entry{};
        if (!parse_attachment(attachment, entry)) {
            std::cerr << "error: --attach expects ALIAS=PATH, got '" << attachment << "'\n";
            return 1;
        }
        attached.push_back(std::move(entry));
    }

    std::vector<sextant::backend::ConnectionProfile> profiles;
    const bool single = sqlite_paths.size() + postgres_targets.size() == 1U;
    for (const auto& path : sqlite_paths) {
        sextant::backend::ConnectionProfile profile{};
        profile.id = "sqlite:" + path;
        profile.backend_kind = sextant::backend::BackendKind::Sqlite;
        profile.file_path = std::filesystem::path{path};
        profile.name = single && !profile_name.empty() ? profile_name : profile.file_path.filename().string();
        profile.attached_databases = attached;
        profile.default_schema = default_schema;
        profile.environment = *environment;
        profile.credential_policy = *policy;
        profiles.push_back(std::move(profile));
    }
    for (const auto& target : postgres_targets) {
        sextant::backend::ConnectionProfile profile{};
        profile.backend_kind = sextant::backend::BackendKind::Postgres;
        std::string error;
        if (!parse_postgres_target(target, profile, error)) {
            std::cerr << "error: --postgres '" << target << "': " << error << '\n';
            return 1;
        }
        profile.id = "postgres:" + target;
        profile.name = single && !profile_name.empty() ? profile_name : target;
        profile.default_schema = default_schema;
        profile.environment = *environment;
        profile.credential_policy = *policy;
        profiles.push_back(std::move(profile));
    }

    sextant::credential::InMemoryCredentialStore store;
    sextant::credential::CredentialResolver resolver{
        &store, [](const sextant::backend::ConnectionProfile& profile, sextant::credential::PromptReason reason) {
            return read_secret("Password for " + sextant::backend::describe_target(profile) + " ("
                               + std::string{sextant::credential::to_string(reason)} + "): ");
        }};

    NavigationStateMachine::Config config{};
    config.batch_size = batch_size;
    config.max_result_rows = max_rows;
    config.browse_row_limit = browse_limit;
    config.connect_options.timeout = std::chrono::seconds{connect_timeout};
    config.task_runner_config.worker_threads = workers;

    std::unique_ptr<std::ofstream> log_file;
    std::ostream* log_stream = nullptr;
    std::mutex log_mutex;
    if (!log_json_path.empty()) {
        if (log_json_path == "-") {
            log_stream = &std::cout;
        } else {
            auto file = std::make_unique<std::ofstream>(log_json_path, std::ios::out | std::ios::app);
            if (!file->is_open()) {
                std::cerr << "error: failed to open log file '" << log_json_path << "'\n";
                return 1;
            }
            log_stream = file.get();
            log_file = std::move(file);
        }

        config.event_logger = [log_stream, &log_mutex](const sextant::navigation::NavigationEvent& event) {
            const auto line = sextant::tools::format_navigation_event_json(event);
            std::lock_guard<std::mutex> guard{log_mutex};
            (*log_stream) << line << '\n';
            log_stream->flush();
        };
    }

    std::signal(SIGINT, handle_interrupt);

    try {
        NavigationStateMachine machine{std::move(profiles), &resolver, std::move(config)};
        if (!commands.empty()) {
            return run_batch(machine, commands, page_rows);
        }
        return run_repl(machine, quiet, page_rows);
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return 1;
    }
}
