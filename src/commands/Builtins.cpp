#include "Builtins.hpp"

#include "../shell/CommandRegistry.hpp"

namespace Builtins {

const std::vector<Verb>& all_verbs() {
    static const std::vector<Verb> verbs = {
        Verb::Browse, Verb::Cat, Verb::Curl, Verb::Date, Verb::Echo, Verb::Env,
        Verb::File, Verb::Find, Verb::Grep, Verb::Head, Verb::Help, Verb::Jq,
        Verb::Ls, Verb::Mkdir, Verb::Rm, Verb::Sed, Verb::Sort, Verb::Tail, Verb::Wc
    };
    return verbs;
}

std::unique_ptr<ICommand> make(Verb verb, const CommandRegistry& registry) {
    switch (verb) {
        case Verb::Browse: return make_browse();
        case Verb::Cat: return make_cat();
        case Verb::Curl: return make_curl();
        case Verb::Date: return make_date();
        case Verb::Echo: return make_echo();
        case Verb::Env: return make_env();
        case Verb::File: return make_file();
        case Verb::Find: return make_find();
        case Verb::Grep: return make_grep();
        case Verb::Head: return make_head();
        case Verb::Help: return make_help(registry);
        case Verb::Jq: return make_jq();
        case Verb::Ls: return make_ls();
        case Verb::Mkdir: return make_mkdir();
        case Verb::Rm: return make_rm();
        case Verb::Sed: return make_sed();
        case Verb::Sort: return make_sort();
        case Verb::Tail: return make_tail();
        case Verb::Wc: return make_wc();
    }
    return nullptr;
}

void register_all(CommandRegistry& reg) {
    for (auto verb : all_verbs()) reg.add(make(verb, reg));
}

}
