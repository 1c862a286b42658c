#pragma once
#include <memory>
#include <string>
#include <vector>

#include "CommandRegistry.hpp"
#include "ParsedCommand.hpp"
#include "ShellResult.hpp"
#include "../core/Environment.hpp"
#include "../core/ShellConfig.hpp"
#include "../vfs/ValidatedVfs.hpp"

class IEnvProvider;
class IHttpClient;

// Executes shell-syntax scripts against a workspace. One instance per agent
// run; commands never see the host filesystem or process environment.
class Shell {
public:
    // storage must outlive the shell. With no http client a libcurl client is
    // created. extra_commands are registered after the built-ins and may
    // replace one of the same name.
    explicit Shell(IVfs& storage,
                   ShellConfig config = ShellConfig(),
                   IHttpClient* http = nullptr,
                   std::vector<std::unique_ptr<ICommand>> extra_commands = {});
    ~Shell();

    Shell(const Shell&) = delete;
    Shell& operator=(const Shell&) = delete;

    ShellResult execute(const std::string& script);

    void set_read_only(bool enabled, std::vector<std::string> writable_paths = {});
    bool is_read_only() const { return read_only_; }

    void set_env(const std::string& key, const std::string& value) { env_.set(key, value); }
    const Environment& env() const { return env_; }

    // Non-owning; pass nullptr to detach.
    void set_env_provider(const IEnvProvider* provider) { env_provider_ = provider; }
    const IEnvProvider* env_provider() const { return env_provider_; }

    IVfs& fs() { return fs_; }
    const ShellConfig& config() const { return config_; }
    const CommandRegistry& registry() const { return registry_; }

private:
    ShellResult run_pipeline(Pipeline& pipeline);
    std::string expand_vars(const std::string& input) const;
    bool is_path_writable(const std::string& path) const;
    bool is_key_writable(const std::string& fs_path) const;

    ValidatedVfs fs_;
    ShellConfig config_;
    std::unique_ptr<IHttpClient> owned_http_;
    IHttpClient* http_;
    Environment env_;
    const IEnvProvider* env_provider_ = nullptr;
    bool read_only_ = false;
    std::vector<std::string> writable_paths_;
    CommandRegistry registry_;
};
