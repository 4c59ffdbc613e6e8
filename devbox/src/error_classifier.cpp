#include "error_classifier.hpp"
#include <unordered_map>
#include <utility>

namespace {

const std::unordered_map<std::string, ErrorKind>& known_codes() {
    static const std::unordered_map<std::string, ErrorKind> codes = {
        {"instance-operations/launch/insufficient-capacity", ErrorKind::Capacity},

        {"global/invalid-api-key", ErrorKind::Auth},
        {"global/account-inactive", ErrorKind::Auth},

        {"global/quota-exceeded", ErrorKind::Quota},

        {"global/invalid-parameters", ErrorKind::Validation},
        {"instance-operations/launch/file-system-in-wrong-region", ErrorKind::Validation},
        {"instance-operations/launch/file-systems-not-supported", ErrorKind::Validation},
        {"ssh-keys/key-in-use", ErrorKind::Validation},

        {"global/object-does-not-exist", ErrorKind::NotFound},

        {"global/unknown", ErrorKind::Unknown},
    };
    return codes;
}

} // namespace

ErrorClassifier::ErrorClassifier(std::set<ErrorKind> retryable_kinds)
    : retryable_kinds_(std::move(retryable_kinds)) {
}

ErrorKind ErrorClassifier::kind_for_code(const std::string& code) {
    const auto& codes = known_codes();
    auto it = codes.find(code);
    if (it == codes.end()) {
        return ErrorKind::Unknown;
    }
    return it->second;
}

bool ErrorClassifier::is_retryable(ErrorKind kind) const {
    return retryable_kinds_.count(kind) > 0;
}

ClassifiedError ErrorClassifier::classify(const ApiError& error) const {
    ClassifiedError classified;
    classified.kind = kind_for_code(error.code);
    classified.code = error.code;
    classified.message = error.message.empty() ? error.code : error.message;
    classified.suggestion = error.suggestion;
    classified.retryable = is_retryable(classified.kind);
    return classified;
}
