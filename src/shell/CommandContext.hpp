#pragma once
#include <optional>
#include <string>

class IVfs;
class Environment;
class IEnvProvider;
class IHttpClient;
class ShellConfig;

class CommandContext {
public:
    CommandContext(IVfs& vfs,
                   Environment& env,
                   const ShellConfig& config,
                   IHttpClient& http)
        : vfs(vfs), env(env), config(config), http(http) {}

    IVfs& vfs;                 // validated workspace; relative paths only
    Environment& env;
    const ShellConfig& config;
    IHttpClient& http;
    std::optional<std::string> input;       // stdin: previous stage, heredoc or < file
    const IEnvProvider* env_provider = nullptr;
    bool piped = false;        // stdout feeds another stage
};
