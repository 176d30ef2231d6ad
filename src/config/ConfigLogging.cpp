#include "ConfigLogging.h"

namespace config {

LoggingConfig obtenerLoggingConfigDefault() {
    LoggingConfig c;
#if defined(REHAB_LOG_LEVEL_DEFAULT)
    // 0=TRACE 1=DEBUG 2=INFO 3=WARN 4=ERROR
    c.nivel_minimo = static_cast<LogLevel>(REHAB_LOG_LEVEL_DEFAULT);
#endif
    return c;
}

} // namespace config
