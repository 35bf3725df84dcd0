#pragma once

#include <llvm/Support/Error.h>
#include <llvm/Support/raw_ostream.h>

#include <string>
#include <string_view>
#include <system_error>

namespace pyhazard {

// Why a stage declined to produce a result. Every kind resolves to a
// silent skip at the top-level driver.
enum class ErrorKind {
    Input,  // malformed invocation message
    Access, // path outside root, bad extension, missing or oversized file
    Syntax, // source does not parse
};

constexpr std::string_view errorKindName(ErrorKind k) {
    switch (k) {
        case ErrorKind::Input:  return "input";
        case ErrorKind::Access: return "access";
        case ErrorKind::Syntax: return "syntax";
    }
    return "unknown";
}

class AnalysisError : public llvm::ErrorInfo<AnalysisError> {
public:
    static char ID;

    AnalysisError(ErrorKind kind, std::string message,
                  unsigned line = 0, unsigned column = 0)
        : kind_(kind), message_(std::move(message)),
          line_(line), column_(column) {}

    ErrorKind kind() const { return kind_; }
    std::string message() const override { return message_; }
    unsigned line() const { return line_; }
    unsigned column() const { return column_; }

    void log(llvm::raw_ostream &os) const override;
    std::error_code convertToErrorCode() const override;

private:
    ErrorKind kind_;
    std::string message_;
    unsigned line_;
    unsigned column_;
};

inline llvm::Error makeError(ErrorKind kind, std::string message,
                             unsigned line = 0, unsigned column = 0) {
    return llvm::make_error<AnalysisError>(kind, std::move(message),
                                           line, column);
}

} // namespace pyhazard
