#pragma once

#include <stdexcept>
#include <string>

namespace bathycat {

/// Base of every error the acquisition pipeline raises.
class PipelineError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// NMEA line whose *hh checksum does not match its payload.
class ChecksumError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

/// NMEA line that cannot be decoded (framing, field count, bad numbers).
class MalformedSentenceError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

/// Transient camera fault; the capture loop retries.
class DeviceError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

/// Camera gone for good after all reinitialization attempts.
class DeviceLostError : public DeviceError {
public:
  using DeviceError::DeviceError;
};

/// Storage target unreachable, full, or a write failed.
class StorageError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

/// Image metadata could not be embedded. The image is written untagged.
class MetadataError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

/// System clock could not be corrected. Never fatal.
class TimeSyncError : public PipelineError {
public:
  using PipelineError::PipelineError;
};

}  // namespace bathycat
