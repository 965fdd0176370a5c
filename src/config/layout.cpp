#include "zshrcman/layout.hpp"
#include "zshrcman/environment.hpp"
#include "zshrcman/platform.hpp"

namespace zshrcman {

std::string Layout::active_script(ShellKind shell) const {
    return join_path(env_dir, std::string("active.") + script_extension(shell));
}

Layout make_layout(const std::string& root, const std::string& shell_config) {
    Layout layout;
    layout.root = root;
    layout.state_file = join_path(root, "state.json");
    layout.profiles_dir = join_path(root, "profiles");
    layout.env_dir = join_path(root, "env");
    layout.shell_config = shell_config;
    return layout;
}

} // namespace zshrcman
