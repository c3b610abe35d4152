// ============================================================
// ssh_agent.cpp -- publickey authentication through ssh-agent
// ============================================================

#include "ssh_agent.hpp"
#include "../common/logger.hpp"
#include "../common/platform.hpp"

#include <libssh2.h>

static bool connection_lost(LIBSSH2_SESSION* session) {
    int err = libssh2_session_last_errno(session);
    return err == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
           err == LIBSSH2_ERROR_SOCKET_SEND ||
           err == LIBSSH2_ERROR_SOCKET_RECV ||
           err == LIBSSH2_ERROR_TIMEOUT;
}

bool agent_userauth(LIBSSH2_SESSION* session,
                    const std::string& user,
                    const std::string& label,
                    std::vector<std::string>& attempted) {
    if (!platform::agent_available()) {
        LOG_DEBUG("[" + label + "] SSH_AUTH_SOCK not set, skipping agent");
        return false;
    }
    LIBSSH2_AGENT* agent = libssh2_agent_init(session);
    if (!agent) {
        LOG_DEBUG("[" + label + "] cannot initialise agent client");
        return false;
    }
    bool ok = false;
    if (libssh2_agent_connect(agent) != 0) {
        LOG_DEBUG("[" + label + "] no ssh-agent reachable");
    } else {
        attempted.push_back("agent");
        if (libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey* identity = nullptr;
            struct libssh2_agent_publickey* prev = nullptr;
            while (libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                if (libssh2_agent_userauth(agent, user.c_str(), identity) == 0) {
                    ok = true;
                    break;
                }
                if (connection_lost(session)) break;
                prev = identity;
            }
        } else {
            LOG_DEBUG("[" + label + "] ssh-agent returned no identities");
        }
        libssh2_agent_disconnect(agent);
    }
    libssh2_agent_free(agent);
    return ok;
}
