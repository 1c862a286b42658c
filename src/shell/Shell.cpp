#include "Shell.hpp"

#include <regex>

#include "CommandContext.hpp"
#include "Parser.hpp"
#include "../commands/Builtins.hpp"
#include "../core/Log.hpp"
#include "../net/CurlHttpClient.hpp"
#include "../vfs/PathValidation.hpp"

namespace {

std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i) out += ", ";
        out += names[i];
    }
    return out;
}

}

Shell::Shell(IVfs& storage, ShellConfig config, IHttpClient* http,
             std::vector<std::unique_ptr<ICommand>> extra_commands)
    : fs_(storage), config_(std::move(config)), http_(http) {
    if (!http_) {
        owned_http_ = std::make_unique<CurlHttpClient>();
        http_ = owned_http_.get();
    }
    Builtins::register_all(registry_);
    for (auto& cmd : extra_commands) registry_.add(std::move(cmd));

    for (auto& kv : config_.initial_files) fs_.write(kv.first, kv.second);
}

Shell::~Shell() = default;

void Shell::set_read_only(bool enabled, std::vector<std::string> writable_paths) {
    read_only_ = enabled;
    writable_paths_ = std::move(writable_paths);
    if (read_only_) {
        fs_.set_write_guard([this](const std::string& key) { return is_key_writable(key); });
    } else {
        fs_.set_write_guard(nullptr);
    }
    Log::debug(std::string("read-only ") + (enabled ? "on" : "off"));
}

bool Shell::is_key_writable(const std::string& key) const {
    for (auto& wp : writable_paths_) {
        auto allowed = PathValidation::validate(wp);
        if (!allowed.ok()) continue;
        if (key == allowed.fs_path) return true;
        if (allowed.fs_path == "/" || key.compare(0, allowed.fs_path.size() + 1, allowed.fs_path + "/") == 0) return true;
    }
    return false;
}

bool Shell::is_path_writable(const std::string& path) const {
    return is_key_writable(PathValidation::resolve(path));
}

std::string Shell::expand_vars(const std::string& input) const {
    return env_.expand(input, env_provider_);
}

ShellResult Shell::execute(const std::string& script) {
    try {
        auto pipelines = Parser::parse(script);
        ShellResult last;
        std::string combined;
        for (auto& pipeline : pipelines) {
            last = run_pipeline(pipeline);
            combined += last.out;
            if (last.exit_code != 0) break;
        }
        last.out = std::move(combined);
        return last;
    } catch (const std::exception& e) {
        Log::warn(e.what());
        return ShellResult::fail(e.what());
    }
}

ShellResult Shell::run_pipeline(Pipeline& pipeline) {
    static const std::regex assign_re(R"(^(\w+)=([\s\S]*)$)");

    ShellResult result;
    std::optional<std::string> carry;
    const size_t n = pipeline.stages.size();

    for (size_t i = 0; i < n; ++i) {
        auto& cmd = pipeline.stages[i];
        const bool last = (i + 1 == n);

        std::smatch m;
        if (cmd.args.empty() && last && std::regex_match(cmd.command, m, assign_re)) {
            env_.set(m[1].str(), expand_vars(m[2].str()));
            result = ShellResult::ok();
            carry = result.out;
            continue;
        }

        cmd.command = expand_vars(cmd.command);
        for (auto& a : cmd.args) a = expand_vars(a);
        if (cmd.input_file) cmd.input_file = expand_vars(*cmd.input_file);
        if (cmd.output_file) cmd.output_file = expand_vars(*cmd.output_file);
        if (cmd.append_file) cmd.append_file = expand_vars(*cmd.append_file);
        if (cmd.stdin_content && !cmd.heredoc_quoted) cmd.stdin_content = expand_vars(*cmd.stdin_content);

        if (read_only_) {
            if (cmd.command == "rm" || cmd.command == "mkdir") {
                Log::warn("rejected '" + cmd.command + "' in read-only mode");
                return ShellResult::fail("read-only mode: '" + cmd.command + "' is not allowed");
            }
            for (auto* target : {&cmd.output_file, &cmd.append_file}) {
                if (*target && **target != "/dev/null" && !is_path_writable(**target)) {
                    Log::warn("rejected write to '" + **target + "' in read-only mode");
                    return ShellResult::fail("read-only mode: cannot write to '" + **target + "'");
                }
            }
        }

        ICommand* handler = registry_.find(cmd.command);
        if (!handler) {
            return ShellResult::fail("command not found: " + cmd.command + "\nAvailable commands: " + join_names(registry_.names()), 127);
        }

        CommandContext ctx(fs_, env_, config_, *http_);
        ctx.env_provider = env_provider_;
        ctx.piped = !last;
        ctx.input = cmd.stdin_content ? cmd.stdin_content : (i > 0 ? carry : std::nullopt);
        if (cmd.input_file) {
            auto data = fs_.read(*cmd.input_file);
            if (!data) return ShellResult::fail(*cmd.input_file + ": No such file");
            ctx.input = std::move(data);
        }

        Log::debug("exec: " + cmd.command);
        result = handler->execute(cmd.args, ctx);

        if (cmd.output_file) {
            if (*cmd.output_file != "/dev/null") fs_.write(*cmd.output_file, result.out);
            result.out.clear();
        } else if (cmd.append_file) {
            if (*cmd.append_file != "/dev/null") {
                auto existing = fs_.read(*cmd.append_file);
                fs_.write(*cmd.append_file, existing.value_or(std::string()) + result.out);
            }
            result.out.clear();
        }

        if (result.exit_code != 0) return result;
        carry = result.out;
    }
    return result;
}
