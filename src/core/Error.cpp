#include "pyhazard/core/Error.h"

namespace pyhazard {

char AnalysisError::ID = 0;

void AnalysisError::log(llvm::raw_ostream &os) const {
    os << errorKindName(kind_) << " error";
    if (line_ != 0)
        os << " at " << line_ << ":" << column_;
    os << ": " << message_;
}

std::error_code AnalysisError::convertToErrorCode() const {
    switch (kind_) {
        case ErrorKind::Input:
            return std::make_error_code(std::errc::invalid_argument);
        case ErrorKind::Access:
            return std::make_error_code(std::errc::permission_denied);
        case ErrorKind::Syntax:
            return std::make_error_code(std::errc::illegal_byte_sequence);
    }
    return std::make_error_code(std::errc::invalid_argument);
}

} // namespace pyhazard
