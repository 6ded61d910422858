#include "NotificationSink.hpp"

#include <plog/Log.h>

namespace watcher
{

bool LogNotificationSink::deliver(const Notification& notification)
{
    PLOG_INFO << "[Notification] " << notification.title << ": " << notification.body;
    return true;
}

} // namespace watcher
