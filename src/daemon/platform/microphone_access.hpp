#pragma once

#include <functional>

enum class MicAuthorization { NotDetermined, Authorized, Denied, Restricted };

class MicrophoneAccess {
public:
    using Callback = std::function<void(bool granted)>;

    virtual ~MicrophoneAccess() = default;
    virtual MicAuthorization status() const = 0;

    // Requests access. `done` is called exactly once, possibly from another thread.
    virtual void request(Callback done) = 0;
};
