#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(oasisDeviceLog)
Q_DECLARE_LOGGING_CATEGORY(oasisHttpLog)
Q_DECLARE_LOGGING_CATEGORY(oasisMqttLog)
Q_DECLARE_LOGGING_CATEGORY(oasisCloudLog)
