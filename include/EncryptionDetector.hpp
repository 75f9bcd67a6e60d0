#pragma once
#include "LogReader.hpp"

#include <exception>
#include <vector>

// How a failed read of the log looked from the outside.
enum class DecodeFailureShape {
    UndefinedValueAccess,   // the log touched the value of an entry it could not decode
    Other,
};

enum class EncryptionVerdict {
    Encrypted,
    NotEncrypted,
    Undetermined,
};

DecodeFailureShape classifyReadFailure(std::exception_ptr failure) noexcept;

EncryptionVerdict verdictForFailure(DecodeFailureShape shape) noexcept;

// Empty -> Undetermined. Encrypted only if every entry has a hash and no value.
EncryptionVerdict verdictForEntries(const std::vector<LogEntry>& entries) noexcept;

// Undetermined counts as not encrypted.
bool isEncrypted(EncryptionVerdict verdict) noexcept;

// Decide, without any key, whether a log appears to hold encrypted content.
// `log` must have been opened without encryption objects. Never throws;
// a read failure that is not recognised yields false.
bool isDatabaseEncrypted(LogReader& log) noexcept;
