// ============================================================
// post_action.cpp -- Post-transfer remote commands
// ============================================================

#include "post_action.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

// Wrap s in single quotes for a POSIX shell
static std::string shell_quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else           out += c;
    }
    return out + "'";
}

PostAction select_post_action(const PostAction& global, const PostAction& per_target) {
    return has_post_action(per_target) ? per_target : global;
}

std::string render_command(const RemoteCommand& cmd, const std::string& tar_path) {
    std::string text = cmd.command;
    static const std::string placeholder = "{tar_path}";
    size_t pos = 0;
    while ((pos = text.find(placeholder, pos)) != std::string::npos) {
        text.replace(pos, placeholder.size(), tar_path);
        pos += tar_path.size();
    }
    if (!cmd.use_sudo) return text;
    if (cmd.sudo_password && !cmd.sudo_password->empty()) {
        return "printf '%s\\n' " + shell_quote(*cmd.sudo_password) + " | sudo -S -p '' " + text;
    }
    return "sudo " + text;
}

namespace {

struct PostActionRunner {
    RemoteSession&     session;
    const std::string& tar_path;

    void operator()(const std::monostate&) const {}

    void operator()(const RemoteCommand& cmd) const {
        if (utils::trim(cmd.command).empty()) {
            throw PostActionFailed("[" + session.host() + "] post-transfer command is empty", -1);
        }
        // The rendered text may carry the sudo password; log the template only
        LOG_INFO("[" + session.host() + "] running: " + (cmd.use_sudo ? "sudo " : "") + cmd.command);
        ExecResult r = session.execute_remote(render_command(cmd, tar_path));
        if (r.exit_code != 0) {
            std::string err = utils::trim(r.stderr_text);
            if (!r.stdout_text.empty()) {
                LOG_DEBUG("[" + session.host() + "] stdout: " + utils::trim(r.stdout_text));
            }
            throw PostActionFailed("[" + session.host() + "] post-transfer command exited with " +
                                   std::to_string(r.exit_code) + (err.empty() ? "" : ": " + err),
                                   r.exit_code);
        }
        if (!r.stdout_text.empty()) {
            LOG_DEBUG("[" + session.host() + "] output: " + utils::trim(r.stdout_text));
        }
        LOG_INFO("[" + session.host() + "] post-transfer command succeeded");
    }
};

} // namespace

void run_post_action(const PostAction& action, RemoteSession& session,
                     const std::string& tar_path) {
    std::visit(PostActionRunner{session, tar_path}, action);
}
