#include "Commands.hpp"
#include "DataJarCli.hpp"
#include "log/TaggedLogger.hpp"
#include "path/DotPath.hpp"
#include "persistence/FileUtils.hpp"

#include <array>
#include <ostream>
#include <string_view>
#include <utility>

namespace DJ::Tools::CLI {

namespace {

using Handler = auto (*)(CommandOptions const&, DataJar&, std::ostream&) -> Expected<void>;

struct Command {
    std::string_view name;
    std::size_t      minArguments;
    std::size_t      maxArguments;
    Handler          handler;
};

auto quoted(std::string_view text) -> std::string {
    return "\"" + std::string(text) + "\"";
}

auto resolveOrFail(DataJar const& jar, std::string_view path) -> Expected<Node const*> {
    if (auto error = validateDotPath(path))
        return std::unexpected(*error);
    auto const* node = jar.resolve(path);
    if (node == nullptr)
        return std::unexpected(Error{Error::Code::NotFound, "Nothing at '" + std::string(path) + "'"});
    return node;
}

// "." and "" both name the root.
auto scopePath(std::string_view argument) -> std::string_view {
    return argument == "." ? std::string_view{} : argument;
}

auto parentPath(std::string_view path) -> std::string_view {
    auto const dot = path.rfind('.');
    return dot == std::string_view::npos ? std::string_view{} : path.substr(0, dot);
}

auto runList(CommandOptions const& options, DataJar& jar, std::ostream& out) -> Expected<void> {
    auto const path  = options.arguments.empty() ? std::string_view{} : scopePath(options.arguments[0]);
    auto       scope = jar.scopeForPath(path);
    if (!scope)
        return std::unexpected(scope.error());
    auto const* children = jar.children(*scope);
    if (children == nullptr)
        return std::unexpected(Error{Error::Code::NoSuchPath, "Scope does not name a container"});
    for (auto const& node : *children)
        out << node.name << " (" << kindName(node.kind()) << "): " << jar.display(node) << '\n';
    return {};
}

auto runGet(CommandOptions const& options, DataJar& jar, std::ostream& out) -> Expected<void> {
    auto node = resolveOrFail(jar, options.arguments[0]);
    if (!node)
        return std::unexpected(node.error());
    out << jar.display(**node) << '\n';
    return {};
}

auto runSet(CommandOptions const& options, DataJar& jar, std::ostream& out) -> Expected<void> {
    TriggerInbox inbox;
    inbox.post(TriggerRequest{.key   = options.key.value_or(""),
                              .value = options.value.value_or(""),
                              .type  = options.type.value_or("text")});
    auto acknowledgement = jar.consume(inbox);
    if (!acknowledgement)
        return std::unexpected(acknowledgement.error());
    if (*acknowledgement)
        out << **acknowledgement << '\n';
    return {};
}

auto runTrigger(CommandOptions const& options, DataJar& jar, std::ostream& out) -> Expected<void> {
    TriggerInbox inbox;
    inbox.post(std::string_view{options.arguments[0]});
    if (!inbox.pending())
        dj_log("trigger query without a key ignored", "CLI", "INFO");
    auto acknowledgement = jar.consume(inbox);
    if (!acknowledgement)
        return std::unexpected(acknowledgement.error());
    if (*acknowledgement)
        out << **acknowledgement << '\n';
    return {};
}

auto runAdd(CommandOptions const& options, DataJar& jar, std::ostream& out) -> Expected<void> {
    if (!options.type)
        return std::unexpected(Error{Error::Code::InvalidType, "add requires --type"});
    auto const kind = parseKind(*options.type);
    if (!kind)
        return std::unexpected(Error{Error::Code::InvalidType, "Unknown type '" + *options.type + "'"});

    auto scope = jar.scopeForPath(scopePath(options.arguments[0]));
    if (!scope)
        return std::unexpected(scope.error());

    auto const name = options.arguments.size() > 1 ? std::string_view{options.arguments[1]} : std::string_view{};
    auto       id   = jar.add(*scope, name, coerceValue(*kind, options.value.value_or("")));
    if (!id)
        return std::unexpected(id.error());

    auto const* children = jar.children(*scope);
    if (children != nullptr) {
        for (auto const& node : *children) {
            if (node.id == *id) {
                out << "Added " << quoted(node.name) << '\n';
                break;
            }
        }
    }
    return {};
}

auto runEdit(CommandOptions const& options, DataJar& jar, std::ostream& out) -> Expected<void> {
    auto const& path = options.arguments[0];
    if (!options.value)
        return std::unexpected(Error{Error::Code::MalformedInput, "edit requires --value"});

    auto node = resolveOrFail(jar, path);
    if (!node)
        return std::unexpected(node.error());
    auto scope = jar.scopeForPath(parentPath(path));
    if (!scope)
        return std::unexpected(scope.error());

    auto const id      = (*node)->id;
    auto       payload = coerceValue((*node)->kind(), *options.value);
    if (auto updated = jar.updateValue(*scope, id, std::move(payload)); !updated)
        return std::unexpected(updated.error());
    out << "Updated " << quoted(path) << '\n';
    return {};
}

auto runDelete(CommandOptions const& options, DataJar& jar, std::ostream& out) -> Expected<void> {
    auto const& path = options.arguments[0];
    auto        node = resolveOrFail(jar, path);
    if (!node)
        return std::unexpected(node.error());
    jar.remove((*node)->id);
    out << "Deleted " << quoted(path) << '\n';
    return {};
}

auto runEval(CommandOptions const& options, DataJar& jar, std::ostream& out) -> Expected<void> {
    auto const evaluation = jar.evaluate(options.arguments[0]);
    out << evaluation.toString() << '\n';
    if (evaluation.failed())
        return std::unexpected(*evaluation.error);
    return {};
}

auto runExport(CommandOptions const& options, DataJar& jar, std::ostream& out) -> Expected<void> {
    auto const text = jar.exportJsonText(options.indent);
    auto const file = options.out.value_or(std::string(DefaultExportFile));
    if (file == "-") {
        out << text << '\n';
        return {};
    }
    if (auto written = FileUtils::writeTextFileAtomic(file, text + "\n", false); !written)
        return std::unexpected(written.error());
    out << "Exported to " << file << '\n';
    return {};
}

auto runImport(CommandOptions const& options, DataJar& jar, std::ostream& out) -> Expected<void> {
    auto text = FileUtils::readTextFile(options.arguments[0]);
    if (!text)
        return std::unexpected(text.error());
    if (auto imported = jar.importJson(*text); !imported)
        return std::unexpected(imported.error());
    out << "Imported " << jar.nodes().size() << " top-level keys" << '\n';
    return {};
}

auto runUrl(CommandOptions const& options, DataJar&, std::ostream& out) -> Expected<void> {
    TriggerRequest request{.key   = options.key.value_or(""),
                           .value = options.value.value_or(""),
                           .type  = options.type.value_or("text")};
    if (request.key.empty())
        return std::unexpected(Error{Error::Code::MalformedInput, "url requires --key"});
    out << buildTriggerUrl(options.base.value_or(std::string(DefaultTriggerBase)), request) << '\n';
    return {};
}

constexpr std::array<Command, 11> Commands{{
        {"list", 0, 1, &runList},
        {"get", 1, 1, &runGet},
        {"set", 0, 0, &runSet},
        {"trigger", 1, 1, &runTrigger},
        {"add", 1, 2, &runAdd},
        {"edit", 1, 1, &runEdit},
        {"delete", 1, 1, &runDelete},
        {"eval", 1, 1, &runEval},
        {"export", 0, 0, &runExport},
        {"import", 1, 1, &runImport},
        {"url", 0, 0, &runUrl},
}};

auto findCommand(std::string_view name) -> Command const* {
    for (auto const& command : Commands) {
        if (command.name == name)
            return &command;
    }
    return nullptr;
}

} // namespace

void printUsage(std::ostream& stream) {
    stream << "Usage: datajar [--store <dir>] <command> [args]\n"
              "Commands:\n"
              "  list [path]                                   List the children of a dictionary or list\n"
              "  get <path>                                    Print a node's value\n"
              "  set --key <path> [--value <v>] [--type <t>]   Set a value by dotted path, creating parents\n"
              "  trigger <query>                               Apply a query string (key=..&value=..&type=..)\n"
              "  add <scope|.> <name> --type <t> [--value <v>] Add a node under a dictionary or list\n"
              "  edit <path> --value <v>                       Change a leaf's value, keeping its type\n"
              "  delete <path>                                 Delete a node and its children\n"
              "  eval <formula>                                Evaluate a formula with {{path}} references\n"
              "  export [--out <file>] [--indent <n>]          Write the jar as JSON (default data_jar_backup.json, - for stdout)\n"
              "  import <file>                                 Replace the jar with a JSON document\n"
              "  url --key <k> [--value <v>] [--type <t>] [--base <url>]\n"
              "                                                Print a trigger URL\n"
              "Types: text, number, boolean, dictionary, list, expression\n"
              "Environment: DATAJAR_STORE_DIR (default .datajar), DATAJAR_LOG=1 enables logging\n";
}

auto parseCommandLine(int argc, char const* const* argv, std::ostream& err) -> std::optional<CommandOptions> {
    CommandOptions options;

    DataJarCli cli;
    cli.set_program_name("datajar");
    cli.set_error_logger([&err](std::string const& message) { err << message << '\n'; });
    cli.set_positional_handler([&](std::string_view token) -> DataJarCli::ParseError {
        if (options.command.empty())
            options.command.assign(token.begin(), token.end());
        else
            options.arguments.emplace_back(token);
        return std::nullopt;
    });

    auto stringOption = [](std::optional<std::string>& target, std::string_view name) {
        DataJarCli::ValueOption option{};
        option.on_value = [&target, stored = std::string(name)](std::optional<std::string_view> value) -> DataJarCli::ParseError {
            if (!value)
                return stored + " requires a value";
            target = std::string(*value);
            return std::nullopt;
        };
        return option;
    };

    DataJarCli::ValueOption storeOption{};
    storeOption.on_value = [&](std::optional<std::string_view> value) -> DataJarCli::ParseError {
        if (!value || value->empty())
            return std::string{"--store requires a directory"};
        options.storeDirectory = std::filesystem::path(std::string(*value));
        return std::nullopt;
    };
    cli.add_value("--store", std::move(storeOption));
    cli.add_value("--key", stringOption(options.key, "--key"));
    cli.add_value("--value", stringOption(options.value, "--value"));
    cli.add_value("--type", stringOption(options.type, "--type"));
    cli.add_value("--out", stringOption(options.out, "--out"));
    cli.add_value("--base", stringOption(options.base, "--base"));
    cli.add_int("--indent", {.on_value = [&](int value) { options.indent = value; }});
    cli.add_flag("--help", {.on_set = [&] { options.help = true; }});
    cli.add_alias("-h", "--help");
    cli.add_alias("-o", "--out");

    if (!cli.parse(argc, argv))
        return std::nullopt;
    return options;
}

auto runCommand(CommandOptions const& options, DataJar& jar, std::ostream& out, std::ostream& err) -> int {
    if (options.help) {
        printUsage(out);
        return ExitSuccess;
    }
    if (options.command.empty()) {
        printUsage(err);
        return ExitUsage;
    }

    auto const* command = findCommand(options.command);
    if (command == nullptr) {
        err << "datajar: unknown command '" << options.command << "'\n";
        printUsage(err);
        return ExitUsage;
    }
    if (options.arguments.size() < command->minArguments || options.arguments.size() > command->maxArguments) {
        err << "datajar: wrong number of arguments for '" << options.command << "'\n";
        printUsage(err);
        return ExitUsage;
    }
    if ((command->name == "set" || command->name == "url") && !options.key) {
        err << "datajar: " << command->name << " requires --key\n";
        return ExitUsage;
    }

    dj_log("running command " + options.command, "CLI");
    auto result = command->handler(options, jar, out);
    if (!result) {
        err << "datajar: " << describeError(result.error()) << '\n';
        return ExitFailure;
    }
    return ExitSuccess;
}

} // namespace DJ::Tools::CLI
