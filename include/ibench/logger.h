#ifndef INCLUDE_IBENCH_LOGGER_H_
#define INCLUDE_IBENCH_LOGGER_H_

// keep console sink mutexes consistent across fork()
void InitLogger();

#endif  // INCLUDE_IBENCH_LOGGER_H_
