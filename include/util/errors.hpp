// Copyright (c) 2024 Coinbase Chain
// Distributed under the MIT software license

#ifndef BRIDGERELAY_UTIL_ERRORS_HPP
#define BRIDGERELAY_UTIL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace bridgerelay {

/*
  Relay error taxonomy.

  The orchestrator decides retry/skip/abort from the concrete type:
  - TransientFetchError: tip or log query failed, retried next cycle
  - SubmissionError:     destination call failed, window aborted at that event
  - MalformedEventError: event fails validation, skipped permanently
  - StorageError:        checkpoint read/write failed
  - StartupError:        a chain is unreachable at startup (fatal)
*/

class RelayError : public std::runtime_error {
public:
  explicit RelayError(const std::string &msg) : std::runtime_error(msg) {}
};

class TransientFetchError : public RelayError {
public:
  explicit TransientFetchError(const std::string &msg) : RelayError(msg) {}
};

class SubmissionError : public RelayError {
public:
  explicit SubmissionError(const std::string &msg) : RelayError(msg) {}
};

class MalformedEventError : public RelayError {
public:
  explicit MalformedEventError(const std::string &msg) : RelayError(msg) {}
};

class StorageError : public RelayError {
public:
  explicit StorageError(const std::string &msg) : RelayError(msg) {}
};

class StartupError : public RelayError {
public:
  explicit StartupError(const std::string &msg) : RelayError(msg) {}
};

} // namespace bridgerelay

#endif // BRIDGERELAY_UTIL_ERRORS_HPP
