/**
 * @file logging.h
 * @brief Runtime verbose flag for per-chunk and per-file trace output.
 */

#ifndef LOGGING_H
#define LOGGING_H

#include <QDebug>

namespace throttlesync {

/// Global verbose logging flag, set via --verbose or [logging] verbose=true
inline bool verboseLogging = false;

} // namespace throttlesync

/// Log only when verbose mode is enabled
#define LOG_VERBOSE() if (throttlesync::verboseLogging) qDebug()

#endif // LOGGING_H
