/*
 * openshaz - Audio Similarity Job Broker
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <stdexcept>
#include <string>

namespace openshaz {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Connect, publish, consume or ack failed.
class BrokerError : public Error {
public:
    using Error::Error;
};

// The broker could not be reached at all (connect failed or connection lost).
class BrokerUnavailable : public BrokerError {
public:
    using BrokerError::BrokerError;
};

// Malformed payload or wrong vector dimensionality. Never fixed by retrying.
class ValidationError : public Error {
public:
    using Error::Error;
};

class StorageError : public Error {
public:
    using Error::Error;
};

class PersistenceError : public Error {
public:
    using Error::Error;
};

class ExtractionError : public Error {
public:
    using Error::Error;
};

class NotFittedError : public Error {
public:
    NotFittedError() : Error("Similarity engine not fitted") {}
};

}
