#include "logging.hpp"

Q_LOGGING_CATEGORY(lcQueue, "bvc.queue")
Q_LOGGING_CATEGORY(lcRunner, "bvc.runner")
Q_LOGGING_CATEGORY(lcProbe, "bvc.probe")
Q_LOGGING_CATEGORY(lcConfig, "bvc.config")
