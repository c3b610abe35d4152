#pragma once

// ============================================================
// ssh_agent.hpp -- publickey authentication through ssh-agent
// ============================================================

#include <string>
#include <vector>

typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;

// Offer each identity held by the agent for 'user'. "agent" is appended
// to 'attempted' only once an agent accepted the connection; with no
// SSH_AUTH_SOCK or an unreachable socket nothing is recorded.
bool agent_userauth(LIBSSH2_SESSION* session,
                    const std::string& user,
                    const std::string& label,
                    std::vector<std::string>& attempted);
