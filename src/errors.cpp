#include "errors.hpp"

const char *errorKindName(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::None:
        return "none";
    case ErrorKind::Network:
        return "network";
    case ErrorKind::HttpStatus:
        return "http-status";
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Verification:
        return "verification";
    case ErrorKind::Cancelled:
        return "cancelled";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::AllMirrorsExhausted:
        return "all-mirrors-exhausted";
    }
    return "unknown";
}
