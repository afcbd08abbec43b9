#ifndef INCLUDE_CODIE_UTILS_H_
#define INCLUDE_CODIE_UTILS_H_

#include <string>
#include <cstdint>

#include "store.h"
#include "runtime.h"
#include "execution.h"

long GetUniqueRequestSequence();
int64_t UnixMillis();

const char* ErrorKindDesc(ErrorKind);
// logging
const char* ErrorKindName(ErrorKind);
const char* SessionStatusName(SessionStatus);
const char* CasResultName(CasResult);
const char* LogStreamName(LogStream);

std::string ToLower(std::string);

#endif  // INCLUDE_CODIE_UTILS_H_
