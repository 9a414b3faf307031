#include <cerrno> // for errno, EINTR
#include <filesystem>
#include <functional> // for std::function
#include <iomanip> // for std::quoted, std::setw
#include <iostream>
#include <map>
#include <memory> // for std::unique_ptr
#include <optional>
#include <span>
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>
#include <vector>

#include <histedit.h>

#include "berth/bring_up.hpp"
#include "berth/configuration_error.hpp"
#include "berth/dependency_order.hpp"
#include "berth/descriptor_loader.hpp"
#include "berth/environment_map.hpp"
#include "berth/os_error_code.hpp"
#include "berth/validate.hpp"

namespace {

using arguments = std::vector<std::string>;
using string_span = std::span<const std::string>;

using cmd_handler = std::function<void(const string_span& args)>;
using cmd_table = std::map<std::string, cmd_handler>;

constexpr auto shell_name = "berth";

constexpr auto exit_success = 0;
constexpr auto exit_failure = 1;
constexpr auto exit_usage = 2;

const auto help_argument = std::string{"--help"};
const auto usage_argument = std::string{"--usage"};

constexpr auto emacs_editor_str = "emacs";
constexpr auto vi_editor_str = "vi";

constexpr auto engine_env_name = "BERTH_ENGINE";
constexpr auto project_name_env_name = "BERTH_PROJECT_NAME";
constexpr auto file_env_name = "BERTH_FILE";

/// @brief Settings from the environment and command line options.
struct settings
{
    std::filesystem::path file;
    std::string project_name;
    std::filesystem::path engine{berth::engine_options::default_program};
    bool dry_run{};
    bool wait_started{};
    bool verbose{};
    bool help{};
    std::string command;
};

struct usage_error: std::invalid_argument
{
    using std::invalid_argument::invalid_argument;
};

auto print_usage(std::ostream& os) -> void
{
    os << "usage: " << shell_name << " [options] <command>\n";
    os << "\n";
    os << "options:\n";
    os << "  -f, --file PATH          descriptor file";
    os << " (default: compose.yaml and alternatives)\n";
    os << "  -p, --project-name NAME  project name\n";
    os << "      --engine PATH        container engine program";
    os << " (default: docker)\n";
    os << "      --dry-run            print engine commands instead of";
    os << " running them\n";
    os << "      --wait-started       wait for each run command to exit";
    os << " successfully\n";
    os << "  -v, --verbose            write diagnostics to stderr\n";
    os << "      --help               show this help\n";
    os << "\n";
    os << "commands:\n";
    os << "  config  validate and print the normalized project\n";
    os << "  order   print the start order and waves\n";
    os << "  up      bring the services up\n";
    os << "  down    remove the services' containers and network\n";
    os << "  shell   interactive prompt\n";
}

auto from_environment(const berth::environment_map& env) -> settings
{
    auto result = settings{};
    if (const auto p = berth::find(env, berth::env_name{engine_env_name})) {
        result.engine = p->get();
    }
    if (const auto p = berth::find(env, berth::env_name{project_name_env_name})) {
        result.project_name = p->get();
    }
    if (const auto p = berth::find(env, berth::env_name{file_env_name})) {
        result.file = p->get();
    }
    return result;
}

/// @brief Gets the value of an option given either as <code>--opt=V</code>
///   or as <code>--opt V</code>.
auto option_value(const arguments& args, std::size_t& i,
                  std::string_view short_name, std::string_view long_name)
    -> std::optional<std::string>
{
    const auto arg = std::string_view{args[i]};
    if ((!short_name.empty() && (arg == short_name)) || (arg == long_name)) {
        if (i + 1u >= size(args)) {
            throw usage_error{std::string{arg} + ": missing value"};
        }
        return args[++i];
    }
    if (arg.starts_with(long_name) &&
        (size(arg) > size(long_name)) && (arg[size(long_name)] == '=')) {
        return std::string{arg.substr(size(long_name) + 1u)};
    }
    return {};
}

auto parse_arguments(const arguments& args, settings result) -> settings
{
    for (auto i = std::size_t{1}; i < size(args); ++i) {
        const auto& arg = args[i];
        if (const auto v = option_value(args, i, "-f", "--file")) {
            result.file = *v;
            continue;
        }
        if (const auto v = option_value(args, i, "-p", "--project-name")) {
            result.project_name = *v;
            continue;
        }
        if (const auto v = option_value(args, i, "", "--engine")) {
            result.engine = *v;
            continue;
        }
        if (arg == "--dry-run") {
            result.dry_run = true;
            continue;
        }
        if (arg == "--wait-started") {
            result.wait_started = true;
            continue;
        }
        if ((arg == "-v") || (arg == "--verbose")) {
            result.verbose = true;
            continue;
        }
        if ((arg == help_argument) || (arg == "-h")) {
            result.help = true;
            continue;
        }
        if (arg.starts_with("-")) {
            throw usage_error{arg + ": unrecognized option"};
        }
        if (!result.command.empty()) {
            throw usage_error{arg + ": unexpected argument"};
        }
        result.command = arg;
    }
    return result;
}

auto make_bring_up_options(const settings& s,
                           const berth::environment_map& env)
    -> berth::bring_up_options
{
    auto result = berth::bring_up_options{};
    result.engine.program = s.engine;
    result.ready = s.wait_started
        ? berth::readiness::completed
        : berth::readiness::started;
    result.environment = env;
    if (s.dry_run) {
        result.dry_run = &std::cout;
    }
    return result;
}

auto load(const settings& s, const berth::environment_map& env,
          std::ostream& diags) -> berth::project
{
    auto file = s.file;
    if (file.empty()) {
        const auto found = berth::find_descriptor(
            std::filesystem::current_path());
        if (!found) {
            throw berth::configuration_error{
                "no descriptor found in current directory"
            };
        }
        file = *found;
    }
    auto opts = berth::load_options{};
    opts.project_name = s.project_name;
    opts.environment = env;
    return berth::load_project(file, diags, opts);
}

auto do_config(const berth::project& project, std::ostream& diags) -> void
{
    berth::validate(project, diags);
    berth::pretty_print(std::cout, project);
}

auto do_order(const berth::project& project) -> void
{
    // numbered in the order "up" issues run commands
    auto n = 0;
    for (auto&& name: berth::start_sequence(project)) {
        std::cout << ++n << ". " << name << "\n";
    }
    n = 0;
    for (auto&& wave: berth::start_waves(project)) {
        std::cout << "wave " << ++n << ": ";
        berth::write(std::cout, wave);
        std::cout << "\n";
    }
}

struct EditLineDeleter
{
    void operator()(EditLine *p)
    {
        el_end(p);
    }
};

using edit_line_ptr = std::unique_ptr<EditLine, EditLineDeleter>;

struct HistoryDeleter
{
    void operator()(History *p)
    {
        history_end(p);
    }
};

using history_ptr = std::unique_ptr<History, HistoryDeleter>;

struct TokenizerDeleter
{
    void operator()(Tokenizer *p)
    {
        tok_end(p);
    }
};

using tokenizer_ptr = std::unique_ptr<Tokenizer, TokenizerDeleter>;

char *prompt([[maybe_unused]] EditLine *el)
{
    static auto nl_prefix = std::string{"\1\033[7m\1"};
    static auto nl_suffix = std::string{"$\1\033[0m\1 "};
    static auto nl_buf = nl_prefix + shell_name + nl_suffix;
    return nl_buf.data();
}

auto make_arguments(int ac, const char* av[]) -> arguments
{
    auto args = arguments{};
    for (auto i = 0; i < ac; ++i) {
        args.emplace_back(av[i]);
    }
    return args;
}

auto do_history(history_ptr& hist, int hist_size, const string_span& args)
    -> void
{
    HistEvent ev{};
    for (auto&& arg: args.subspan(1u)) {
        if (arg == help_argument) {
            std::cout << "shows the history of commands entered.\n";
            return;
        }
        if (arg == usage_argument) {
            std::cout << "usage: " << args[0] << " [clear]\n";
            return;
        }
        if (arg == "clear") {
            history(hist.get(), &ev, H_CLEAR);
            return;
        }
    }
    const auto width = static_cast<int>(std::to_string(hist_size).size());
    for (auto rv = history(hist.get(), &ev, H_LAST);
         rv != -1;
         rv = history(hist.get(), &ev, H_PREV)) {
         std::cout << std::setw(width) << ev.num << " " << ev.str;
    }
}

auto do_editor(edit_line_ptr& el, const string_span& args) -> void
{
    for (auto&& arg: args.subspan(1u)) {
        if (arg == help_argument) {
            std::cout << "shows or sets the shell editor.\n";
            return;
        }
        if (arg == usage_argument) {
            std::cout << "usage: " << args[0];
            std::cout << " [" << vi_editor_str << '|' << emacs_editor_str;
            std::cout << "]\n";
            return;
        }
        if ((arg == vi_editor_str) || (arg == emacs_editor_str)) {
            el_set(el.get(), EL_EDITOR, arg.c_str());
            continue;
        }
        std::cerr << std::quoted(arg) << ": unrecognized argument\n";
    }
    if (args.size() == 1u) {
        auto ptr = static_cast<const char *>(nullptr);
        el_get(el.get(), EL_EDITOR, &ptr);
        if (!ptr) {
            std::cerr << "unable to get current shell editor\n";
            return;
        }
        std::cout << "shell editor is currently " << std::quoted(ptr) << '\n';
    }
}

auto do_help(const cmd_table& cmds, const string_span& args) -> void
{
    using strings = std::vector<std::string>;
    if (size(args) > 1u) {
        for (auto&& arg: args.subspan(1u)) {
            if (arg == help_argument) {
                std::cout << "provides help on builtin commands.\n";
                return;
            }
            const auto found = cmds.find(arg);
            if (found == cmds.end()) {
                std::cerr << std::quoted(arg);
                std::cerr << ": unknown command, skipping\n";
                continue;
            }
            std::cout << found->first << ": ";
            found->second(strings{found->first, help_argument});
        }
        return;
    }
    for (auto&& entry: cmds) {
        std::cout << "  " << entry.first << ": ";
        entry.second(strings{entry.first, help_argument});
    }
}

/// @brief Whether the command was asked for its help, which is then
///   written.
auto wants_help(const string_span& args, const char* help) -> bool
{
    for (auto&& arg: args.subspan(1u)) {
        if (arg == help_argument) {
            std::cout << help << "\n";
            return true;
        }
    }
    return false;
}

auto run(const cmd_handler& cmd, const string_span& args) -> void
{
    try {
        cmd(args);
    }
    catch (const berth::configuration_error& ex) {
        std::cerr << args[0] << ": configuration error: " << ex.what() << "\n";
    }
    catch (const berth::start_error& ex) {
        std::cerr << args[0] << ": start error: " << ex.what() << "\n";
    }
    catch (const std::exception& ex) {
        std::cerr << "exception caught from running ";
        std::cerr << args[0] << " command: " << ex.what() << "\n";
    }
}

auto do_shell(const char* argv0, const settings& s,
              const berth::environment_map& env, std::ostream& diags) -> int
{
    auto deployment = berth::deployment{};
    const auto opts = make_bring_up_options(s, env);
    auto do_loop = true;
    const auto hist_size = 100;

    // For example of using libedit, see: https://tinyurl.com/3ez9utzc
    HistEvent ev{};
    auto hist = history_ptr{history_init()};
    history(hist.get(), &ev, H_SETSIZE, hist_size);

    auto tok = tokenizer_ptr{tok_init(NULL)};

    auto el = edit_line_ptr{el_init(argv0, stdin, stdout, stderr)};
    el_set(el.get(), EL_SIGNAL, 1); // installs sig handlers for resizing, etc.
    el_set(el.get(), EL_HIST, history, hist.get());
    el_set(el.get(), EL_PROMPT_ESC, prompt, '\1');
    el_set(el.get(), EL_EDITOR, emacs_editor_str);
    el_source(el.get(), NULL);

    const cmd_table cmds{
        {"config", [&](const string_span& args){
            if (!wants_help(args, "validates and prints the project.")) {
                do_config(load(s, env, diags), diags);
            }
        }},
        {"down", [&](const string_span& args){
            if (wants_help(args, "removes the containers and network.")) {
                return;
            }
            if (deployment.started.empty()) {
                berth::tear_down(load(s, env, diags), diags, opts);
                return;
            }
            berth::tear_down(deployment, diags, opts);
        }},
        {"editor", [&](const string_span& args){
            do_editor(el, args);
        }},
        {"exit", [&](const string_span& args){
            if (!wants_help(args, "exits this shell.")) {
                do_loop = false;
            }
        }},
        {"help", [&](const string_span& args){
            if (size(args) == 1u) {
                std::cout << "Builtin commands:\n";
            }
            do_help(cmds, args);
        }},
        {"history", [&](const string_span& args){
            do_history(hist, hist_size, args);
        }},
        {"kill", [&](const string_span& args){
            if (wants_help(args, "signals run commands still running.")) {
                return;
            }
            auto sig = berth::signals::terminate();
            if (size(args) > 1u) {
                if (args[1] == "kill") {
                    sig = berth::signals::kill();
                }
                else if (args[1] != "term") {
                    std::cerr << args[0] << ": unknown signal " << args[1];
                    std::cerr << ", expected \"term\" or \"kill\"\n";
                    return;
                }
            }
            berth::send_signal(sig, deployment, std::cerr);
        }},
        {"order", [&](const string_span& args){
            if (!wants_help(args, "prints the start order and waves.")) {
                do_order(load(s, env, diags));
            }
        }},
        {"ps", [&](const string_span& args){
            if (!wants_help(args, "shows the services brought up.")) {
                berth::update(deployment);
                berth::pretty_print(std::cout, deployment);
            }
        }},
        {"up", [&](const string_span& args){
            if (wants_help(args, "brings the services up.")) {
                return;
            }
            if (!deployment.started.empty()) {
                std::cerr << "already up, enter \"down\" first\n";
                return;
            }
            berth::bring_up(load(s, env, diags), deployment, diags, opts);
        }},
    };

    while (do_loop) {
        auto count = 0;
        const auto buf = el_gets(el.get(), &count);
        if (!buf || count == 0) {
            const auto err = errno;
            if (err == EINTR) {
                std::cerr << "el_gets was interrupted\n";
                continue;
            }
            if (count == 0) {
                std::cout << "\n";
                break; // end of input
            }
            std::cerr << "aborting: el_gets returned null, errno=";
            std::cerr << berth::os_error_code(err) << "\n";
            break;
        }
        if (count == 1) {
            continue;
        }
        const auto li = el_line(el.get());
        auto ac = 0; // arg count
        auto av = static_cast<const char**>(nullptr);
        auto cc = 0;
        auto co = 0;
        const auto tok_line_rv = tok_line(tok.get(), li, &ac, &av, &cc, &co);
        if ((tok_line_rv != 0) || (ac < 1) || !av) {
            std::cerr << "unable to tokenize line\n";
            tok_reset(tok.get());
            continue;
        }
        if (history(hist.get(), &ev, H_ENTER, buf) == -1) {
            std::cerr << "history error (" << ev.num << ")" << ev.str << "\n";
        }
        const auto args = make_arguments(ac, av);
        if (const auto it = cmds.find(args[0]); it != cmds.end()) {
            run(it->second, args);
        }
        else if (el_parse(el.get(), ac, av) == -1) {
            std::cerr << "unrecognized command " << av[0] << "\n";
            std::cerr << "enter " << std::quoted("help") << " for help.\n";
        }
        tok_reset(tok.get());
    }
    if (!deployment.started.empty()) {
        std::cerr << "note: services are still up\n";
    }
    return exit_success;
}

auto do_command(const char* argv0, const settings& s,
                const berth::environment_map& env, std::ostream& diags)
    -> int
{
    if (s.command == "config") {
        do_config(load(s, env, diags), diags);
        return exit_success;
    }
    if (s.command == "order") {
        do_order(load(s, env, diags));
        return exit_success;
    }
    if (s.command == "up") {
        auto deployment = berth::deployment{};
        const auto opts = make_bring_up_options(s, env);
        try {
            berth::bring_up(load(s, env, diags), deployment, diags, opts);
        }
        catch (const berth::start_error&) {
            if (!deployment.started.empty()) {
                std::cerr << "started services are left up, ";
                std::cerr << "use \"down\" to remove them\n";
            }
            throw;
        }
        berth::wait(deployment);
        if (!s.dry_run) {
            berth::pretty_print(std::cout, deployment);
        }
        return exit_success;
    }
    if (s.command == "down") {
        berth::tear_down(load(s, env, diags), diags,
                         make_bring_up_options(s, env));
        return exit_success;
    }
    if (s.command == "shell") {
        return do_shell(argv0, s, env, diags);
    }
    throw usage_error{s.command + ": unknown command"};
}

}

auto main(int argc, const char * argv[]) -> int
{
    const auto environment = berth::get_environ();
    auto s = settings{};
    try {
        s = parse_arguments(make_arguments(argc, argv),
                            from_environment(environment));
        if (s.help) {
            print_usage(std::cout);
            return exit_success;
        }
        if (s.command.empty()) {
            throw usage_error{"no command given"};
        }
    }
    catch (const usage_error& ex) {
        std::cerr << shell_name << ": " << ex.what() << "\n";
        print_usage(std::cerr);
        return exit_usage;
    }
    auto null_stream = std::ostream{nullptr};
    auto& diags = s.verbose? std::cerr: null_stream;
    try {
        return do_command(argv[0], s, environment, diags);
    }
    catch (const usage_error& ex) {
        std::cerr << shell_name << ": " << ex.what() << "\n";
        print_usage(std::cerr);
        return exit_usage;
    }
    catch (const berth::configuration_error& ex) {
        std::cerr << shell_name << ": configuration error: ";
        std::cerr << ex.what() << "\n";
    }
    catch (const berth::start_error& ex) {
        std::cerr << shell_name << ": start error: " << ex.what() << "\n";
    }
    catch (const std::exception& ex) {
        std::cerr << shell_name << ": " << ex.what() << "\n";
    }
    return exit_failure;
}
