#include "oasis_log.h"

Q_LOGGING_CATEGORY(oasisDeviceLog, "oasis.control.device");
Q_LOGGING_CATEGORY(oasisHttpLog, "oasis.control.http");
Q_LOGGING_CATEGORY(oasisMqttLog, "oasis.control.mqtt");
Q_LOGGING_CATEGORY(oasisCloudLog, "oasis.control.cloud");
