#pragma once

#include <exception>
#include <string>

namespace grounded_core {

// Root of every error raised by the pipeline.
class GroundedError : public std::exception {
 public:
  explicit GroundedError(const std::string &message) : message_(message) {}

  const char *what() const noexcept override {
    return message_.c_str();
  }

 private:
  std::string message_;
};

// Invalid parameters, dimension/metric disagreements. Fatal at startup.
class ConfigurationError : public GroundedError {
 public:
  using GroundedError::GroundedError;
};

class DimensionMismatch : public ConfigurationError {
 public:
  DimensionMismatch(size_t expected, size_t actual)
      : ConfigurationError("Vector dimension mismatch. Expected " + std::to_string(expected) +
                           ", got " + std::to_string(actual)),
        expected_(expected),
        actual_(actual) {}

  size_t expected() const {
    return expected_;
  }
  size_t actual() const {
    return actual_;
  }

 private:
  size_t expected_;
  size_t actual_;
};

// A persisted index was written with a different dimension, metric or corpus version.
class IncompatibleIndex : public ConfigurationError {
 public:
  using ConfigurationError::ConfigurationError;
};

// Malformed input units. Rejects the unit, not the batch.
class DataError : public GroundedError {
 public:
  using GroundedError::GroundedError;
};

class EmptyInput : public DataError {
 public:
  using DataError::DataError;
};

// The embedding or generation capability failed or timed out.
class CapabilityError : public GroundedError {
 public:
  using GroundedError::GroundedError;
};

class EmbeddingUnavailable : public CapabilityError {
 public:
  using CapabilityError::CapabilityError;
};

class GenerationUnavailable : public CapabilityError {
 public:
  using CapabilityError::CapabilityError;
};

// faiss or filesystem failure while building or writing an index.
class VectorIndexError : public GroundedError {
 public:
  using GroundedError::GroundedError;
};

// Persisted index failed integrity or schema checks. Requires a rebuild.
class IndexCorruption : public GroundedError {
 public:
  using GroundedError::GroundedError;
};

// No index snapshot has been published yet.
class IndexUnavailable : public GroundedError {
 public:
  using GroundedError::GroundedError;
};

}  // namespace grounded_core
