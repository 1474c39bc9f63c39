#include "platform/linux/pipewire_access.hpp"

#include <cerrno>
#include <cstring>
#include <pipewire/pipewire.h>
#include <print>
#include <spa/utils/result.h>

namespace {

struct ProbeState {
    pw_main_loop* loop = nullptr;
    int pending = 0;
    bool done = false;
    int error = 0;
};

void on_core_done(void* data, uint32_t id, int seq) {
    auto* state = static_cast<ProbeState*>(data);
    if (id == PW_ID_CORE && seq == state->pending) {
        state->done = true;
        pw_main_loop_quit(state->loop);
    }
}

void on_core_error(void* data, uint32_t id, int /*seq*/, int res, const char* message) {
    auto* state = static_cast<ProbeState*>(data);
    if (id == PW_ID_CORE) {
        std::println(stderr, "audio: pipewire core error: {} ({})",
                     message ? message : "", spa_strerror(res));
        state->error = -res;
        pw_main_loop_quit(state->loop);
    }
}

const pw_core_events core_events = {
    .version = PW_VERSION_CORE_EVENTS,
    .done = on_core_done,
    .error = on_core_error,
};

bool is_permission_error(int err) {
    return err == EACCES || err == EPERM;
}

} // namespace

PipeWireAccess::PipeWireAccess() {
    pw_init(nullptr, nullptr);
}

PipeWireAccess::~PipeWireAccess() {
    pw_deinit();
}

void PipeWireAccess::request(Callback done) {
    auto decision = probe();
    if (decision != MicAuthorization::NotDetermined) {
        status_.store(decision, std::memory_order_release);
    }
    // An unreachable server is not a refusal; let the stream report the failure.
    done(decision != MicAuthorization::Denied);
}

MicAuthorization PipeWireAccess::probe() {
    pw_main_loop* loop = pw_main_loop_new(nullptr);
    if (!loop) {
        std::println(stderr, "audio: failed to create main loop for access check");
        return MicAuthorization::NotDetermined;
    }

    pw_context* context = pw_context_new(pw_main_loop_get_loop(loop), nullptr, 0);
    if (!context) {
        pw_main_loop_destroy(loop);
        return MicAuthorization::NotDetermined;
    }

    pw_core* core = pw_context_connect(context, nullptr, 0);
    if (!core) {
        int err = errno;
        pw_context_destroy(context);
        pw_main_loop_destroy(loop);
        if (is_permission_error(err)) return MicAuthorization::Denied;
        std::println(stderr, "audio: cannot reach pipewire: {}", std::strerror(err));
        return MicAuthorization::NotDetermined;
    }

    ProbeState state{.loop = loop};
    spa_hook listener{};
    pw_core_add_listener(core, &listener, &core_events, &state);
    state.pending = pw_core_sync(core, PW_ID_CORE, 0);

    // Blocks until the server answers the sync or reports an error.
    pw_main_loop_run(loop);

    spa_hook_remove(&listener);
    pw_core_disconnect(core);
    pw_context_destroy(context);
    pw_main_loop_destroy(loop);

    if (state.done) return MicAuthorization::Authorized;
    if (is_permission_error(state.error)) return MicAuthorization::Denied;
    return MicAuthorization::NotDetermined;
}
