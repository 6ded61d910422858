#pragma once

#include "StatusTypes.hpp"

namespace watcher
{

// Presents local notifications. deliver() returns false (or throws) when the
// platform refused the notification; the watcher only logs that.
class NotificationSink
{
public:
    virtual ~NotificationSink() = default;

    virtual bool deliver(const Notification& notification) = 0;
};

// Writes notifications to the log; the default for headless runs
class LogNotificationSink : public NotificationSink
{
public:
    bool deliver(const Notification& notification) override;
};

} // namespace watcher
