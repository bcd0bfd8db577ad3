#ifndef INCLUDE_CODEBOX_LOGGER_H_
#define INCLUDE_CODEBOX_LOGGER_H_

// 0 = warn, 1 = info, >= 2 = debug
// Also makes the console sinks safe to use across fork()
void InitLogger(int verbosity = 0);

#endif  // INCLUDE_CODEBOX_LOGGER_H_
