#pragma once

#include "platform/notifier.hpp"

// Desktop notifications through notify-send (libnotify).
class DesktopNotifier : public Notifier {
public:
    void notify(const std::string& summary, const std::string& body) override;
};
