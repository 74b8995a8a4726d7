#include "util/Result.hpp"

namespace tankobon::util {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Decode: return "DecodeError";
        case ErrorKind::InvalidDimensions: return "InvalidDimensions";
        case ErrorKind::Fetch: return "FetchError";
        case ErrorKind::ExtractionEmpty: return "ExtractionEmpty";
        case ErrorKind::NavigationTimeout: return "NavigationTimeout";
        case ErrorKind::Assembly: return "AssemblyError";
        case ErrorKind::ArtifactIO: return "ArtifactIOError";
        case ErrorKind::FatalRun: return "FatalRunError";
    }
    return "UnknownError";
}

}  // namespace tankobon::util
