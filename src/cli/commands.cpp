#include <sidecar/cli/commands.h>
#include <sidecar/config/config_helpers.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <chrono>
#include <csignal>
#include <fstream>
#include <iterator>
#include <map>
#include <vector>

namespace sidecar::cli {

using json = nlohmann::json;

namespace {
volatile std::sig_atomic_t g_interrupted = 0;
} // namespace

InterruptWatcher::InterruptWatcher(std::function<void()> onInterrupt)
    : onInterrupt_(std::move(onInterrupt)) {
    thread_ = std::jthread([this](std::stop_token stop) {
        while (!stop.stop_requested()) {
            if (g_interrupted != 0) {
                g_interrupted = 0;
                spdlog::debug("Interrupt received; cancelling outstanding request");
                onInterrupt_();
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    });
}

InterruptWatcher::~InterruptWatcher() {
    thread_.request_stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void InterruptWatcher::install() {
    std::signal(SIGINT, &InterruptWatcher::notify);
    std::signal(SIGTERM, &InterruptWatcher::notify);
}

void InterruptWatcher::notify(int) noexcept {
    g_interrupted = 1;
}

void registerGlobalOptions(CLI::App& app, GlobalOptions& options) {
    app.add_option("-a,--address", options.address,
                   "Sidecar base address (default http://localhost:$DAPR_HTTP_PORT or :3500).");
    app.add_option("--config", options.configPath, "Configuration file path");
    app.add_flag("--json", options.emitJson, "Emit machine-readable JSON on stdout.");
    app.add_flag("-v,--verbose", options.verbose, "Log requests and responses.");
    app.add_flag("-q,--quiet", options.quiet, "Only log errors.");
}

std::string dumpForDisplay(const json& value) {
    // State values are opaque bytes; invalid UTF-8 is shown as U+FFFD rather than failing
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<client::SidecarClient*> ClientProvider::get() {
    if (client_) {
        return client_.get();
    }

    config::EnvironmentNameResolver resolver;
    auto cfg = config::loadSidecarConfig(config::get_config_path(options_->configPath), resolver);
    if (!cfg) {
        return cfg.error();
    }
    if (transport_) {
        client_ = std::make_unique<client::SidecarClient>(transport_, std::move(cfg).value());
    } else {
        client_ = std::make_unique<client::SidecarClient>(std::move(cfg).value());
    }
    return client_.get();
}

int reportError(const Error& error, const GlobalOptions& options) {
    if (options.emitJson) {
        json out = {{"success", false},
                    {"kind", errorToString(error.code)},
                    {"status", error.httpStatus},
                    {"errorCode", error.errorCode},
                    {"message", error.message}};
        if (error.cause) {
            out["cause"] = *error.cause;
        }
        fmt::print("{}\n", dumpForDisplay(out));
    } else {
        fmt::print(stderr, "Error: {}\n", error.describe());
    }

    switch (error.code) {
        case ErrorCode::InvalidArgument:
            return 2;
        case ErrorCode::SidecarNotPresent:
            return 3;
        case ErrorCode::OperationCancelled:
            return 130;
        default:
            return 1;
    }
}

namespace {

void reportOk(const GlobalOptions& options, const std::string& what) {
    if (options.emitJson) {
        fmt::print("{}\n", json{{"success", true}}.dump());
    } else if (!options.quiet) {
        fmt::print("{}\n", what);
    }
}

// Inline text, or "@path" to read the text from a file
Result<std::string> readPayload(const std::string& arg) {
    if (arg.empty() || arg.front() != '@') {
        return arg;
    }
    std::ifstream in(config::expand_tilde(arg.substr(1)), std::ios::binary);
    if (!in) {
        return Error{ErrorCode::InvalidArgument, "cannot read payload file: " + arg.substr(1)};
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

Result<json> parseJsonArg(const std::string& arg, const char* what) {
    auto text = readPayload(arg);
    if (!text) {
        return text.error();
    }
    auto parsed = json::parse(text.value(), nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return Error{ErrorCode::InvalidArgument, std::string(what) + " is not valid JSON"};
    }
    return parsed;
}

// "k=v" pairs into a map
std::map<std::string, std::string> parsePairs(const std::vector<std::string>& pairs) {
    std::map<std::string, std::string> out;
    for (const auto& p : pairs) {
        auto eq = p.find('=');
        if (eq == std::string::npos) {
            out[p] = "";
        } else {
            out[p.substr(0, eq)] = p.substr(eq + 1);
        }
    }
    return out;
}

} // namespace

void registerStateCommands(CLI::App& app, std::shared_ptr<ClientProvider> provider,
                           int& exitCode) {
    auto* state = app.add_subcommand("state", "Read and write state store entries.");
    state->require_subcommand(1);

    // state get
    {
        struct Opts {
            std::string store;
            std::string key;
        };
        auto opts = std::make_shared<Opts>();
        auto* sub = state->add_subcommand("get", "Read a single key.");
        sub->add_option("store", opts->store, "State store name")->required();
        sub->add_option("key", opts->key, "Key to read")->required();
        sub->callback([provider, opts, &exitCode]() {
            auto client = provider->get();
            if (!client) {
                exitCode = reportError(client.error(), provider->options());
                return;
            }
            auto res = client.value()->getState(provider->options().address, opts->store,
                                                opts->key, provider->stopToken());
            if (!res) {
                exitCode = reportError(res.error(), provider->options());
                return;
            }
            const auto& record = res.value();
            if (provider->options().emitJson) {
                json out = {{"success", true}, {"key", record.key}, {"value", record.value}};
                out["etag"] = record.etag ? json(*record.etag) : json(nullptr);
                fmt::print("{}\n", dumpForDisplay(out));
            } else {
                if (record.etag) {
                    fmt::print(stderr, "etag: {}\n", *record.etag);
                }
                fmt::print("{}\n", record.value);
            }
        });
    }

    // state save
    {
        struct Opts {
            std::string store;
            std::string key;
            std::string value;
            std::optional<std::string> etag;
            std::optional<std::string> concurrency;
            std::optional<std::string> consistency;
            std::vector<std::string> metadata;
        };
        auto opts = std::make_shared<Opts>();
        auto* sub = state->add_subcommand("save", "Write a single key.");
        sub->add_option("store", opts->store, "State store name")->required();
        sub->add_option("key", opts->key, "Key to write")->required();
        sub->add_option("value", opts->value, "Value (JSON or text; @file to read a file)")
            ->required();
        sub->add_option("--etag", opts->etag, "Expected ETag for optimistic concurrency.");
        sub->add_option("--concurrency", opts->concurrency, "first-write | last-write")
            ->check(CLI::IsMember({"first-write", "last-write"}));
        sub->add_option("--consistency", opts->consistency, "eventual | strong")
            ->check(CLI::IsMember({"eventual", "strong"}));
        sub->add_option("-m,--metadata", opts->metadata, "Metadata entry key=value (repeatable).");
        sub->callback([provider, opts, &exitCode]() {
            auto value = readPayload(opts->value);
            if (!value) {
                exitCode = reportError(value.error(), provider->options());
                return;
            }
            auto client = provider->get();
            if (!client) {
                exitCode = reportError(client.error(), provider->options());
                return;
            }

            client::StateRecord record(opts->key, value.value(), opts->etag);
            if (opts->concurrency || opts->consistency) {
                record.options = client::StateOptions{opts->concurrency, opts->consistency};
            }
            record.metadata = parsePairs(opts->metadata);

            auto res = client.value()->saveState(provider->options().address, opts->store,
                                                 {record}, provider->stopToken());
            if (!res) {
                exitCode = reportError(res.error(), provider->options());
                return;
            }
            reportOk(provider->options(), "saved " + opts->key);
        });
    }

    // state delete
    {
        struct Opts {
            std::string store;
            std::string key;
            std::optional<std::string> etag;
        };
        auto opts = std::make_shared<Opts>();
        auto* sub = state->add_subcommand("delete", "Delete a single key.");
        sub->add_option("store", opts->store, "State store name")->required();
        sub->add_option("key", opts->key, "Key to delete")->required();
        sub->add_option("--etag", opts->etag, "Expected ETag (sent as If-Match).");
        sub->callback([provider, opts, &exitCode]() {
            auto client = provider->get();
            if (!client) {
                exitCode = reportError(client.error(), provider->options());
                return;
            }
            auto res = client.value()->deleteState(provider->options().address, opts->store,
                                                   opts->key, opts->etag, provider->stopToken());
            if (!res) {
                exitCode = reportError(res.error(), provider->options());
                return;
            }
            reportOk(provider->options(), "deleted " + opts->key);
        });
    }
}

void registerInvokeCommand(CLI::App& app, std::shared_ptr<ClientProvider> provider,
                           int& exitCode) {
    struct Opts {
        std::string appId;
        std::string method;
        std::string verb{"POST"};
        std::optional<std::string> data;
    };
    auto opts = std::make_shared<Opts>();
    auto* sub = app.add_subcommand("invoke", "Invoke a method on another application.");
    sub->add_option("app-id", opts->appId, "Target application id")->required();
    sub->add_option("method", opts->method, "Method name (may contain '/')")->required();
    sub->add_option("-X,--verb", opts->verb, "HTTP verb (default POST).");
    sub->add_option("-d,--data", opts->data, "JSON body (@file to read a file).");
    sub->callback([provider, opts, &exitCode]() {
        std::optional<json> body;
        if (opts->data) {
            auto parsed = parseJsonArg(*opts->data, "--data");
            if (!parsed) {
                exitCode = reportError(parsed.error(), provider->options());
                return;
            }
            body = std::move(parsed).value();
        }
        auto client = provider->get();
        if (!client) {
            exitCode = reportError(client.error(), provider->options());
            return;
        }
        auto res = client.value()->invokeMethod(provider->options().address, opts->appId,
                                                opts->method, opts->verb, body,
                                                provider->stopToken());
        if (!res) {
            exitCode = reportError(res.error(), provider->options());
            return;
        }
        reportOk(provider->options(), "invoked " + opts->appId + "/" + opts->method);
    });
}

void registerPublishCommand(CLI::App& app, std::shared_ptr<ClientProvider> provider,
                            int& exitCode) {
    struct Opts {
        std::string pubsub;
        std::string topic;
        std::optional<std::string> data;
    };
    auto opts = std::make_shared<Opts>();
    auto* sub = app.add_subcommand("publish", "Publish an event to a topic.");
    sub->add_option("pubsub", opts->pubsub, "Pub/sub component name")->required();
    sub->add_option("topic", opts->topic, "Topic name")->required();
    sub->add_option("-d,--data", opts->data, "Raw JSON payload (@file to read a file).");
    sub->callback([provider, opts, &exitCode]() {
        std::optional<std::string> payload;
        if (opts->data) {
            auto text = readPayload(*opts->data);
            if (!text) {
                exitCode = reportError(text.error(), provider->options());
                return;
            }
            payload = std::move(text).value();
        }
        auto client = provider->get();
        if (!client) {
            exitCode = reportError(client.error(), provider->options());
            return;
        }
        auto res = client.value()->publishEvent(provider->options().address, opts->pubsub,
                                                opts->topic, payload, provider->stopToken());
        if (!res) {
            exitCode = reportError(res.error(), provider->options());
            return;
        }
        reportOk(provider->options(), "published to " + opts->pubsub + "/" + opts->topic);
    });
}

void registerBindingCommand(CLI::App& app, std::shared_ptr<ClientProvider> provider,
                            int& exitCode) {
    struct Opts {
        std::string name;
        std::string operation{"create"};
        std::optional<std::string> data;
        std::vector<std::string> metadata;
    };
    auto opts = std::make_shared<Opts>();
    auto* sub = app.add_subcommand("binding", "Send a message to an output binding.");
    sub->add_option("name", opts->name, "Binding name")->required();
    sub->add_option("-o,--operation", opts->operation, "Binding operation (default create).");
    sub->add_option("-d,--data", opts->data, "JSON data (@file to read a file).");
    sub->add_option("-m,--metadata", opts->metadata, "Metadata entry key=value (repeatable).");
    sub->callback([provider, opts, &exitCode]() {
        client::BindingMessage message;
        message.bindingName = opts->name;
        message.operation = opts->operation;
        message.metadata = parsePairs(opts->metadata);
        if (opts->data) {
            auto parsed = parseJsonArg(*opts->data, "--data");
            if (!parsed) {
                exitCode = reportError(parsed.error(), provider->options());
                return;
            }
            message.data = std::move(parsed).value();
        }
        auto client = provider->get();
        if (!client) {
            exitCode = reportError(client.error(), provider->options());
            return;
        }
        auto res = client.value()->sendToBinding(provider->options().address, message,
                                                 provider->stopToken());
        if (!res) {
            exitCode = reportError(res.error(), provider->options());
            return;
        }
        reportOk(provider->options(), "sent to binding " + opts->name);
    });
}

void registerSecretCommand(CLI::App& app, std::shared_ptr<ClientProvider> provider,
                           int& exitCode) {
    struct Opts {
        std::string store;
        std::string key;
        std::optional<std::string> metadata;
    };
    auto opts = std::make_shared<Opts>();
    auto* sub = app.add_subcommand("secret", "Read a secret.");
    sub->add_option("store", opts->store, "Secret store name")->required();
    sub->add_option("key", opts->key, "Secret key")->required();
    sub->add_option("--metadata", opts->metadata,
                    "Metadata query string, e.g. 'metadata.namespace=prod'.");
    sub->callback([provider, opts, &exitCode]() {
        auto client = provider->get();
        if (!client) {
            exitCode = reportError(client.error(), provider->options());
            return;
        }
        auto res = client.value()->getSecret(provider->options().address, opts->store, opts->key,
                                             opts->metadata, provider->stopToken());
        if (!res) {
            exitCode = reportError(res.error(), provider->options());
            return;
        }
        fmt::print("{}\n", provider->options().emitJson ? res.value().dump() : res.value().dump(2));
    });
}

} // namespace sidecar::cli
