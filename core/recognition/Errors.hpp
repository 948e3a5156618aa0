#pragma once
#include <stdexcept>
#include <string>

namespace kc {

class RecognitionError : public std::runtime_error {
public:
    explicit RecognitionError(const std::string &what) : std::runtime_error(what) {}
};

// Label or model asset missing or malformed. The recognizer stays unusable
// until initialize() succeeds.
class InitializationError : public RecognitionError {
public:
    explicit InitializationError(const std::string &what) : RecognitionError(what) {}
};

class NotInitializedError : public RecognitionError {
public:
    explicit NotInitializedError(const std::string &what = "Recognizer not initialized")
        : RecognitionError(what) {}
};

// Score vector length mismatch, zero-size raster or an empty session.
class InvalidInputError : public RecognitionError {
public:
    explicit InvalidInputError(const std::string &what) : RecognitionError(what) {}
};

// Engine failure, message carried through unchanged.
class InferenceError : public RecognitionError {
public:
    explicit InferenceError(const std::string &what) : RecognitionError(what) {}
};

} // namespace kc
