#include <sidecar/cli/commands.h>
#include <sidecar/version.hpp>

#include <spdlog/sinks/stderr_color_sinks.h>
#include <spdlog/spdlog.h>
#include <CLI/CLI.hpp>

#include <memory>

namespace {

void setup_logging(const sidecar::cli::GlobalOptions& options) {
    // Results go to stdout; logs stay on stderr
    auto logger = spdlog::stderr_color_mt("sidecar");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    if (options.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (options.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"sidecarctl - talk to the local distributed-application sidecar over HTTP"};
    app.set_version_flag("--version", std::string(sidecar::version::long_string_v));
    app.require_subcommand(1);

    auto options = std::make_shared<sidecar::cli::GlobalOptions>();
    sidecar::cli::registerGlobalOptions(app, *options);

    auto provider = std::make_shared<sidecar::cli::ClientProvider>(options);
    int exitCode = 0;

    sidecar::cli::registerStateCommands(app, provider, exitCode);
    sidecar::cli::registerInvokeCommand(app, provider, exitCode);
    sidecar::cli::registerPublishCommand(app, provider, exitCode);
    sidecar::cli::registerBindingCommand(app, provider, exitCode);
    sidecar::cli::registerSecretCommand(app, provider, exitCode);

    app.parse_complete_callback([options]() { setup_logging(*options); });

    sidecar::cli::InterruptWatcher watcher([provider] { provider->requestStop(); });
    sidecar::cli::InterruptWatcher::install();

    CLI11_PARSE(app, argc, argv);

    return exitCode;
}
