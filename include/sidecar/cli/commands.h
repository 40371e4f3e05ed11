#pragma once

#include <sidecar/client/sidecar_client.hpp>

#include <CLI/CLI.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace sidecar::cli {

// Options shared by every subcommand
struct GlobalOptions {
    std::optional<std::string> address;
    std::string configPath;
    bool emitJson{false};
    bool verbose{false};
    bool quiet{false};
};

// Lazily builds the client once the command line (and thus --config) is known.
// A transport given here replaces the default libcurl one.
class ClientProvider {
public:
    explicit ClientProvider(std::shared_ptr<GlobalOptions> options,
                            std::shared_ptr<transport::ITransport> transport = nullptr)
        : options_(std::move(options)), transport_(std::move(transport)) {}

    Result<client::SidecarClient*> get();
    const GlobalOptions& options() const { return *options_; }

    // Stopped on SIGINT/SIGTERM; passed to every call
    std::stop_token stopToken() const { return stop_.get_token(); }
    void requestStop() { stop_.request_stop(); }

private:
    std::shared_ptr<GlobalOptions> options_;
    std::shared_ptr<transport::ITransport> transport_;
    std::unique_ptr<client::SidecarClient> client_;
    std::stop_source stop_;
};

/**
 * Forwards SIGINT/SIGTERM to a callback. The signal handler only sets a flag; a watcher
 * thread polls it and runs the callback outside signal context.
 */
class InterruptWatcher {
public:
    explicit InterruptWatcher(std::function<void()> onInterrupt);
    ~InterruptWatcher();

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

    // Install as the SIGINT/SIGTERM handler
    static void install();
    // Signal handler body; async-signal-safe
    static void notify(int signo) noexcept;

private:
    std::function<void()> onInterrupt_;
    std::jthread thread_;
};

// --address, --config, --json, -v/--verbose, -q/--quiet
void registerGlobalOptions(CLI::App& app, GlobalOptions& options);

// Compact JSON for stdout; invalid UTF-8 is replaced instead of throwing
std::string dumpForDisplay(const nlohmann::json& value);

// Print the outcome of a command; returns the process exit code
int reportError(const Error& error, const GlobalOptions& options);

void registerStateCommands(CLI::App& app, std::shared_ptr<ClientProvider> provider, int& exitCode);
void registerInvokeCommand(CLI::App& app, std::shared_ptr<ClientProvider> provider, int& exitCode);
void registerPublishCommand(CLI::App& app, std::shared_ptr<ClientProvider> provider, int& exitCode);
void registerBindingCommand(CLI::App& app, std::shared_ptr<ClientProvider> provider, int& exitCode);
void registerSecretCommand(CLI::App& app, std::shared_ptr<ClientProvider> provider, int& exitCode);

} // namespace sidecar::cli
