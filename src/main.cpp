#include "config.hpp"
#include "console.hpp"
#include "cost.hpp"
#include "errors.hpp"
#include "settings.hpp"
#include "session_engine.hpp"
#include "transcript_store.hpp"
#include "markdown_renderer.hpp"
#include "http_server.hpp"
#include "websocket_server.hpp"
#include "verbose.hpp"
#include "providers/factory.hpp"

#include <CLI/CLI.hpp>
#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>

using namespace talk;

// ========== Signal Handling ==========

static Console* g_console = nullptr;               // Global console for signal handler.
static std::atomic<bool> g_streaming{false};       // A turn is in flight.
static std::atomic<bool> g_cancel_requested{false};

// Ctrl+C cancels a streaming turn; anywhere else it exits.
void signal_handler(int) {
    if (g_streaming.load()) {
        g_cancel_requested.store(true);
        return;
    }

    if (g_console) {
        g_console->print_raw("\r\033[K");  // Clear line.
        g_console->print_raw("\033[?25h"); // Show cursor (in case hidden).
        g_console->println();
        g_console->print_warning("Interrupted.");
    }
    std::exit(0);
}

// Marks a turn in flight for the signal handler.
class StreamingScope {
public:
    StreamingScope() {
        g_cancel_requested.store(false);
        g_streaming.store(true);
    }
    ~StreamingScope() {
        g_streaming.store(false);
    }
};

// ========== Shared State ==========

struct ChatContext {
    Console& console;
    SessionEngine& engine;
    bool render_markdown;
};

static void print_banner(const Console& console) {
    std::string rule(60, '=');
    console.println();
    console.print_info(rule);
    console.print_header("                 ctalk - Claude chat");
    console.print_info(rule);
}

// ========== Interactive Selection ==========

// Prompts the user to pick a model. The default entry is preselected_key.
static std::string select_model(const PricingTable& pricing, const Console& console,
                                const std::string& preselected_key) {
    const auto& models = pricing.models();

    size_t default_index = 0;
    for (size_t i = 0; i < models.size(); ++i) {
        if (models[i].key == preselected_key) {
            default_index = i;
        }
    }

    console.println();
    console.print_header("Available models:");
    for (size_t i = 0; i < models.size(); ++i) {
        const auto& spec = models[i];
        console.println("  " + std::to_string(i + 1) + ". " + spec.display_name + "  " +
                        format_cost(spec.rate.input_per_mtok, 2) + " / " +
                        format_cost(spec.rate.output_per_mtok, 2) + " per MTok");
    }

    console.println();
    while (true) {
        std::string choice = console.prompt("Select model number", std::to_string(default_index + 1));
        try {
            size_t idx = std::stoul(choice) - 1;
            if (idx < models.size()) {
                console.print_success("Selected: " + models[idx].display_name);
                return models[idx].key;
            }
        } catch (const std::logic_error&) {
            // Not a number, prompt again.
        }
        console.print_error("Invalid choice, try again");
    }
}

// Lists recent conversations and prompts for one. Returns its id.
static std::optional<std::string> pick_session(const SessionEngine& engine, const Console& console) {
    std::vector<SessionSummary> sessions = engine.list();
    if (sessions.empty()) {
        console.print_warning("No saved conversations found.");
        return std::nullopt;
    }
    if (sessions.size() > LIST_LIMIT) {
        sessions.resize(LIST_LIMIT);
    }

    console.println();
    console.print_header("Saved conversations:");
    console.print_session_list(sessions);
    console.println();

    std::string choice = console.prompt("Select conversation (1-" + std::to_string(sessions.size()) + ")");
    try {
        size_t idx = std::stoul(choice) - 1;
        if (idx < sessions.size()) {
            return sessions[idx].id;
        }
    } catch (const std::logic_error&) {
        // Fall through to the error below.
    }
    console.print_error("Invalid selection.");
    return std::nullopt;
}

static void show_all_sessions(const std::vector<SessionSummary>& sessions, const Console& console) {
    if (sessions.empty()) {
        console.print_warning("No saved conversations found.");
        return;
    }

    double total = 0.0;
    for (const auto& s : sessions) {
        total += s.total_cost;
    }

    console.println();
    console.print_info("Total conversations: " + std::to_string(sessions.size()));
    console.print_info("Total cost: " + format_cost(total));
    console.println();

    size_t shown = std::min(sessions.size(), LIST_LIMIT);
    for (size_t i = 0; i < shown; ++i) {
        const auto& s = sessions[i];
        console.println("  " + std::to_string(i + 1) + ". [" + format_local_minutes(s.created_at) + "] " +
                        s.model + "  " + s.id);
        console.println("     " + s.preview);
        console.println("     Cost: " + format_cost(s.total_cost) + "  Messages: " +
                        std::to_string(s.message_count));
        console.println();
    }
}

// ========== Chat ==========

// Prints the committed transcript of a resumed session.
static void replay_history(const ChatContext& ctx, const Session& session) {
    if (session.messages.empty()) {
        return;
    }

    MarkdownRenderer renderer([&](const std::string& formatted) {
        ctx.console.print_raw(formatted);
    }, ctx.console.colors_enabled());

    for (const auto& msg : session.messages) {
        ctx.console.println();
        ctx.console.print_role_label(msg.role);
        ctx.console.println();
        if (ctx.render_markdown && msg.role == Role::Assistant) {
            renderer.feed(msg.content);
            renderer.finish();
        } else {
            ctx.console.println(msg.content);
        }
    }
    ctx.console.println();
    ctx.console.print_info("Total so far: " + format_cost(session.total_cost));
}

/**
 * Reads one user message.
 *
 * A first line ending in "###" is a complete message. Otherwise lines are
 * collected until a line containing only "###". Returns nullopt on EOF.
 */
static std::optional<std::string> read_user_input(const Console& console) {
    console.println();
    console.print_role_label(Role::User);
    console.println();
    console.flush();

    std::string first_line;
    if (!std::getline(std::cin, first_line)) {
        return std::nullopt;
    }

    std::string trimmed = trim(first_line);
    const std::string end_marker = MULTILINE_END;
    if (trimmed.size() >= end_marker.size() &&
        trimmed.compare(trimmed.size() - end_marker.size(), end_marker.size(), end_marker) == 0) {
        return trim(trimmed.substr(0, trimmed.size() - end_marker.size()));
    }

    // Commands are single words on the first line
    std::string lowered = trimmed;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "exit" || lowered == "save" || lowered == "clear" ||
        lowered == "/cost" || lowered == "/delete") {
        return lowered;
    }

    std::string text = first_line;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (trim(line) == end_marker) {
            return text;
        }
        text += "\n" + line;
    }
    return text;
}

// Runs one turn with live output. Returns the updated session on commit.
static std::optional<Session> run_chat_turn(const ChatContext& ctx, const Session& session,
                                            const std::string& text) {
    Console& console = ctx.console;

    console.println();
    console.print_role_label(Role::Assistant);
    console.println();

    TurnResult result;
    {
        StreamingScope streaming;
        Spinner spinner(console, console.colors_enabled());
        bool first_chunk = true;

        result = ctx.engine.submit_turn(
            session,
            text,
            [&](const std::string& delta) {
                if (first_chunk) {
                    spinner.stop();
                    first_chunk = false;
                }
                console.print_raw(delta);
                console.flush();
            },
            []() { return g_cancel_requested.load(); }
        );
        spinner.stop();
    }
    console.println();

    if (!result.committed()) {
        const TurnFailure& failure = *result.failure;
        if (failure.kind == providers::FailureKind::Cancelled) {
            console.print_warning("[interrupted, not saved]");
        } else {
            console.print_error("Error: " + failure.message);
            console.print_warning("The message was not added to the conversation.");
        }
        return std::nullopt;
    }

    console.println();
    console.print_turn_stats(result.usage, result.incremental_cost, result.session->total_cost);
    if (!result.persisted()) {
        console.print_warning("Warning: conversation not saved: " + result.persist_error);
    }
    return result.session;
}

static void chat_loop(const ChatContext& ctx, Session session) {
    Console& console = ctx.console;
    const ModelSpec& spec = ctx.engine.pricing().find(session.model);

    console.println();
    console.print_success("Chat started with " + spec.display_name + " (" + session.id + ")");
    console.print_warning("Commands: 'exit' to quit, 'save' to save and quit, 'clear' to clear screen, "
                          "'/cost' for totals, '/delete' to delete this conversation");
    console.print_warning(std::string("End a message with '") + MULTILINE_END +
                          "', on the same line or on a line of its own");

    while (true) {
        std::optional<std::string> input = read_user_input(console);
        if (!input) {
            break;
        }

        const std::string& text = *input;
        if (text == "exit") {
            break;
        }
        if (text == "save") {
            if (!session.messages.empty()) {
                console.print_success("Conversation saved as " + session.id);
            }
            break;
        }
        if (text == "clear") {
            console.clear_screen();
            continue;
        }
        if (text == "/cost") {
            console.print_info("Messages: " + std::to_string(session.messages.size()) +
                               " | Total: " + format_cost(session.total_cost));
            continue;
        }
        if (text == "/delete") {
            if (session.messages.empty()) {
                console.print_warning("Nothing saved yet.");
                break;
            }
            try {
                ctx.engine.remove(session.id);
                console.print_success("Deleted " + session.id);
            } catch (const SessionNotFoundError& e) {
                console.print_warning(e.what());
            } catch (const PersistenceError& e) {
                console.print_error(std::string("Error: ") + e.what());
                continue;
            }
            break;
        }
        if (trim(text).empty()) {
            continue;
        }

        try {
            std::optional<Session> updated = run_chat_turn(ctx, session, text);
            if (updated) {
                session = std::move(*updated);
            }
        } catch (const OutOfOrderTurnError& e) {
            console.print_error(std::string("Error: ") + e.what());
            break;
        }
    }
}

// Top-level menu loop.
static void run_menu(const ChatContext& ctx, const std::string& configured_model) {
    Console& console = ctx.console;

    while (true) {
        console.println();
        console.print_header("Menu:");
        console.println("  1. New conversation");
        console.println("  2. Load conversation");
        console.println("  3. List conversations");
        console.println("  4. Exit");
        console.println();

        if (!std::cin) {
            return;
        }
        std::string choice = console.prompt("Choose option");

        if (choice == "1") {
            std::string model = configured_model.empty()
                ? select_model(ctx.engine.pricing(), console, ctx.engine.pricing().default_model().key)
                : configured_model;
            chat_loop(ctx, ctx.engine.create(model));
        } else if (choice == "2") {
            std::optional<std::string> id = pick_session(ctx.engine, console);
            if (!id) {
                continue;
            }
            try {
                Session session = ctx.engine.resume(*id);
                replay_history(ctx, session);
                chat_loop(ctx, std::move(session));
            } catch (const SessionNotFoundError& e) {
                console.print_error(e.what());
            } catch (const PersistenceError& e) {
                console.print_error(e.what());
            } catch (const UnknownModelError& e) {
                console.print_error(e.what());
            }
        } else if (choice == "3") {
            show_all_sessions(ctx.engine.list(), console);
        } else if (choice == "4" || !std::cin) {
            console.println();
            console.print_success("Goodbye!");
            return;
        } else {
            console.print_error("Invalid choice. Please select 1-4.");
        }
    }
}

// ========== Non-interactive Mode ==========

// Reads a query from stdin, streams the reply to stdout and commits it.
static int run_non_interactive(SessionEngine& engine, const std::string& model, const std::string& resume_id) {
    std::string user_input;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (!user_input.empty()) {
            user_input += "\n";
        }
        user_input += line;
    }

    user_input = trim(user_input);
    if (user_input.empty()) {
        return 0;
    }

    Session session = resume_id.empty() ? engine.create(model) : engine.resume(resume_id);

    TurnResult result;
    {
        StreamingScope streaming;
        result = engine.submit_turn(
            session,
            user_input,
            [](const std::string& delta) { std::cout << delta << std::flush; },
            []() { return g_cancel_requested.load(); }
        );
    }
    std::cout << std::endl;

    if (!result.committed()) {
        std::cerr << "Error: " << result.failure->message << std::endl;
        return 1;
    }
    if (!result.persisted()) {
        std::cerr << "Warning: conversation not saved: " << result.persist_error << std::endl;
    }
    verbose_log("ENGINE", "Session " + result.session->id + " total " + format_cost(result.session->total_cost));
    return 0;
}

// ========== Server Mode ==========

static int run_server(SessionEngine& engine, Console& console, const std::string& address, int port,
                      const std::string& www_dir) {
    console.println();
    console.print_header("=== ctalk Web Server ===");

    HttpServer http_server(engine, www_dir);
    WebSocketServer ws_server(engine);

    ws_server.on_start([&console](const std::string& addr, int ws_port) {
        console.print_success("WebSocket server listening on ws://" +
            (addr == "0.0.0.0" ? "localhost" : addr) + ":" + std::to_string(ws_port) + "/");
    });

    http_server.on_start([&console, &www_dir](const std::string& addr, int http_port) {
        console.println();
        std::string display_addr = (addr == "0.0.0.0") ? "localhost" : addr;
        console.println("Serving web UI from directory: " + www_dir);
        console.print_success("HTTP server running at http://" + display_addr + ":" + std::to_string(http_port));
        console.println("Press Ctrl+C to stop.");
        console.println();
    });

    // IXWebSocket runs its own listener, so WebSocket uses port+1.
    int ws_port = port + 1;
    if (!ws_server.start(address, ws_port)) {
        console.print_error("Failed to start WebSocket server on " + address + ":" + std::to_string(ws_port));
        return 1;
    }

    // Blocks until stopped.
    if (!http_server.start(address, port)) {
        console.print_error("Failed to start HTTP server on " + address + ":" + std::to_string(port));
        return 1;
    }
    return 0;
}

// ========== Main Entry Point ==========

int main(int argc, char* argv[]) {
    CLI::App app{"Terminal chat with Claude models, with resumable conversations and cost tracking"};
    app.footer("\nExamples:\n"
               "  ctalk                          Interactive menu\n"
               "  ctalk -m opus-4                New conversation with Claude Opus 4\n"
               "  ctalk -r 20250131_091502_a1b2  Resume a conversation\n"
               "  echo 'Hi' | ctalk -n           One question, answer on stdout\n"
               "  ctalk -s -p 8192               Web interface on http://localhost:8192\n");

    std::string model;
    app.add_option("-m,--model", model, "Model key, id or name (e.g. sonnet-4.5)");

    std::string resume_id;
    app.add_option("-r,--resume", resume_id, "Resume the conversation with this id");

    bool list_only = false;
    app.add_flag("-l,--list", list_only, "List saved conversations and exit");

    bool non_interactive = false;
    app.add_flag("-n,--non-interactive", non_interactive,
                 "Non-interactive mode: read query from stdin, write response to stdout, exit");

    bool plain_output = false;
    app.add_flag("--plain", plain_output,
                 "Disable markdown rendering of resumed history");

    bool server_mode = false;
    app.add_flag("-s,--server", server_mode,
                 "Run in server mode with web interface");

    int server_port = 8192;
    app.add_option("-p,--port", server_port,
                   "Port for web server (default: 8192, WebSocket on port+1)")
        ->check(CLI::Range(1, 65534));

    std::string server_address = "0.0.0.0";
    app.add_option("--address", server_address,
                   "Bind address for web server (default: 0.0.0.0)");

    std::string www_dir = WWW_DIR;
    app.add_option("--www-dir", www_dir,
                   "Directory of web files to serve (default: www)");

    std::string sessions_dir;
    app.add_option("--sessions-dir", sessions_dir,
                   "Directory for saved conversations (default: conversations)");

    bool verbose = false;
    app.add_flag("-v,--verbose", verbose, "Log requests, stream events and storage to stderr");

    CLI11_PARSE(app, argc, argv);

    set_verbose(verbose);

    Console console;
    g_console = &console;

    // Set up signal handler for Ctrl+C.
    std::signal(SIGINT, signal_handler);

    try {
        load_dotenv(DOTENV_FILE);

        Settings settings = load_settings().value_or(Settings{});

        PricingTable pricing;
        apply_model_overrides(settings, pricing);

        ResolvedConfig config = resolve_config({model, sessions_dir, ""}, settings);
        if (!config.model.empty()) {
            // Fail before any menu if the configured model is unknown.
            config.model = pricing.find(config.model).key;
        }

        TranscriptStore store(config.sessions_dir);

        // Listing needs no API key
        if (list_only) {
            show_all_sessions(store.list(), console);
            return 0;
        }

        auto transport = providers::TransportFactory::create_from_environment(config.api_base_url);
        SessionEngine engine(*transport, store, pricing, {config.system_prompt, config.max_tokens});

        if (server_mode) {
            return run_server(engine, console, server_address, server_port, www_dir);
        }

        if (non_interactive) {
            std::string chosen = config.model.empty() ? pricing.default_model().key : config.model;
            return run_non_interactive(engine, chosen, resume_id);
        }

        ChatContext ctx{console, engine, !plain_output};
        print_banner(console);

        if (!resume_id.empty()) {
            Session session = engine.resume(resume_id);
            replay_history(ctx, session);
            chat_loop(ctx, std::move(session));
            return 0;
        }

        run_menu(ctx, config.model);
        return 0;

    } catch (const providers::ProviderNotAvailableError& e) {
        console.print_error(std::string("Error: ") + e.what());
        console.print_warning(std::string("Create a ") + DOTENV_FILE + " file with: " + ENV_API_KEY + "=your_key_here");
    } catch (const std::exception& e) {
        console.print_error(std::string("Error: ") + e.what());
    }
    return 1;
}
