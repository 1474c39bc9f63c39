#pragma once

#include "platform/microphone_access.hpp"

#include <atomic>

// Microphone authorization backed by the PipeWire core handshake. A sandboxed
// client without an audio grant has its connection refused with EACCES/EPERM;
// that is reported as Denied. The decision is cached for the process lifetime.
class PipeWireAccess : public MicrophoneAccess {
public:
    PipeWireAccess();
    ~PipeWireAccess() override;

    PipeWireAccess(const PipeWireAccess&) = delete;
    PipeWireAccess& operator=(const PipeWireAccess&) = delete;

    MicAuthorization status() const override { return status_.load(std::memory_order_acquire); }
    void request(Callback done) override;

private:
    MicAuthorization probe();

    std::atomic<MicAuthorization> status_{MicAuthorization::NotDetermined};
};
