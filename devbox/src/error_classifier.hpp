#pragma once
#include "types.hpp"
#include <set>
#include <string>

// Maps provisioning API errors onto a closed set of kinds. Codes that are not
// in the table classify as Unknown and are never retried.
class ErrorClassifier {
public:
    explicit ErrorClassifier(std::set<ErrorKind> retryable_kinds = {ErrorKind::Capacity});

    ClassifiedError classify(const ApiError& error) const;

    bool is_retryable(ErrorKind kind) const;

    // Kind for a code, ignoring message and status.
    static ErrorKind kind_for_code(const std::string& code);

private:
    std::set<ErrorKind> retryable_kinds_;
};
