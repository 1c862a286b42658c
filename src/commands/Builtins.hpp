#pragma once
#include <memory>
#include <vector>

class ICommand;
class CommandRegistry;

namespace Builtins {
    enum class Verb {
        Browse, Cat, Curl, Date, Echo, Env, File, Find, Grep, Head,
        Help, Jq, Ls, Mkdir, Rm, Sed, Sort, Tail, Wc
    };

    const std::vector<Verb>& all_verbs();

    // registry is only used by `help`, which lists its siblings.
    std::unique_ptr<ICommand> make(Verb verb, const CommandRegistry& registry);

    void register_all(CommandRegistry& reg);

    std::unique_ptr<ICommand> make_browse();
    std::unique_ptr<ICommand> make_cat();
    std::unique_ptr<ICommand> make_curl();
    std::unique_ptr<ICommand> make_date();
    std::unique_ptr<ICommand> make_echo();
    std::unique_ptr<ICommand> make_env();
    std::unique_ptr<ICommand> make_file();
    std::unique_ptr<ICommand> make_find();
    std::unique_ptr<ICommand> make_grep();
    std::unique_ptr<ICommand> make_head();
    std::unique_ptr<ICommand> make_help(const CommandRegistry& registry);
    std::unique_ptr<ICommand> make_jq();
    std::unique_ptr<ICommand> make_ls();
    std::unique_ptr<ICommand> make_mkdir();
    std::unique_ptr<ICommand> make_rm();
    std::unique_ptr<ICommand> make_sed();
    std::unique_ptr<ICommand> make_sort();
    std::unique_ptr<ICommand> make_tail();
    std::unique_ptr<ICommand> make_wc();
}
