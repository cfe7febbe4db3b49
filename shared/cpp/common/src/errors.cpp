#include "../include/errors.hpp"

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "Validation";
        case ErrorKind::Unavailable: return "Unavailable";
        case ErrorKind::Unauthorized: return "Unauthorized";
        case ErrorKind::Unexpected: return "Unexpected";
        case ErrorKind::Conflict: return "Conflict";
        case ErrorKind::Transient: return "Transient";
        case ErrorKind::Cancelled: return "Cancelled";
    }
    return "Unexpected";
}
