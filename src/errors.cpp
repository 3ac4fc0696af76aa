#include "objxfer/errors.hpp"

namespace objxfer {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transient: return "transient";
        case ErrorKind::SessionExpired: return "session-expired";
        case ErrorKind::FatalCaller: return "fatal";
        case ErrorKind::BudgetExhausted: return "budget-exhausted";
        case ErrorKind::PartialBatch: return "partial-batch";
        case ErrorKind::Integrity: return "integrity";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}

}  // namespace objxfer
