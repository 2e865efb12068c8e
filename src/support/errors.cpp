#include <support/errors.hpp>

namespace atelier {

const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound: return "NotFound";
        case ErrorKind::InvalidInput: return "InvalidInput";
        case ErrorKind::Unauthorized: return "Unauthorized";
        case ErrorKind::UpstreamUnavailable: return "UpstreamUnavailable";
        case ErrorKind::Internal: return "Internal";
    }
    return "Internal";
}

}
