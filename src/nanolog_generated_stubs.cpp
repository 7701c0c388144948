#include "GeneratedCode.h"

// The NanoLog runtime library references these tables, which only the preprocessor
// build fills in. crontick logs through the C++17 API, so they stay empty.
namespace GeneratedFunctions {
size_t numLogIds = 0;
LogMetadata logId2Metadata[1];
ssize_t (*compressFnArray[])(NanoLogInternal::Log::UncompressedEntry *re, char *out) = {nullptr};
void (*decompressAndPrintFnArray[])(const char **in, FILE *outputFd, void (*aggFn)(const char *, ...)) = {nullptr};
long int writeDictionary(char * /*buffer*/, char * /*endOfBuffer*/) { return 0; }
} // namespace GeneratedFunctions
