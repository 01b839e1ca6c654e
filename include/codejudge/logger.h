#ifndef INCLUDE_CODEJUDGE_LOGGER_H_
#define INCLUDE_CODEJUDGE_LOGGER_H_

// Backends fork from worker threads; this keeps the console sink lock consistent across fork()
void InitLogger();

#endif  // INCLUDE_CODEJUDGE_LOGGER_H_
