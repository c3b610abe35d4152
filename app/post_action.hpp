#pragma once

// ============================================================
// post_action.hpp -- What runs on a target after its transfer
// ============================================================

#include "../transport/remote_session.hpp"
#include <optional>
#include <string>
#include <variant>

// Shell command run on the target. "{tar_path}" is replaced with
// the remote artifact path.
struct RemoteCommand {
    std::string command;
    bool        use_sudo{false};
    std::optional<std::string> sudo_password;
};

using PostAction = std::variant<std::monostate, RemoteCommand>;

inline bool has_post_action(const PostAction& a) {
    return !std::holds_alternative<std::monostate>(a);
}

// Per-target action when set, else the global one
PostAction select_post_action(const PostAction& global, const PostAction& per_target);

// Final shell text for 'cmd' with the placeholder substituted and
// the sudo wrapper applied
std::string render_command(const RemoteCommand& cmd, const std::string& tar_path);

// Run 'action' on the session. Throws PostActionFailed on a non-zero
// exit and lets ExecutionError through.
void run_post_action(const PostAction& action, RemoteSession& session,
                     const std::string& tar_path);
