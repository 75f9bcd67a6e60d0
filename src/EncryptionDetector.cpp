#include "EncryptionDetector.hpp"

#include <algorithm>

DecodeFailureShape classifyReadFailure(std::exception_ptr failure) noexcept {
    if (!failure) return DecodeFailureShape::Other;
    try {
        std::rethrow_exception(failure);
    } catch (const UndecodedEntryAccess&) {
        return DecodeFailureShape::UndefinedValueAccess;
    } catch (...) {
        return DecodeFailureShape::Other;
    }
}

EncryptionVerdict verdictForFailure(DecodeFailureShape shape) noexcept {
    switch (shape) {
    case DecodeFailureShape::UndefinedValueAccess:
        return EncryptionVerdict::Encrypted;   // replication-level encryption
    case DecodeFailureShape::Other:
        break;
    }
    return EncryptionVerdict::Undetermined;
}

EncryptionVerdict verdictForEntries(const std::vector<LogEntry>& entries) noexcept {
    // An empty log looks the same whether or not it was encrypted.
    if (entries.empty()) return EncryptionVerdict::Undetermined;

    const bool allHidden = std::all_of(entries.begin(), entries.end(), [](const LogEntry& e) {
        return e.hash.has_value() && !e.value.has_value();
    });
    return allHidden ? EncryptionVerdict::Encrypted : EncryptionVerdict::NotEncrypted;
}

bool isEncrypted(EncryptionVerdict verdict) noexcept {
    return verdict == EncryptionVerdict::Encrypted;
}

bool isDatabaseEncrypted(LogReader& log) noexcept {
    std::vector<LogEntry> entries;
    try {
        entries = log.all();
    } catch (...) {
        return isEncrypted(verdictForFailure(classifyReadFailure(std::current_exception())));
    }
    return isEncrypted(verdictForEntries(entries));
}
