#pragma once

#include <stdexcept>
#include <string>

namespace I3dm::Core::Format {

/**
 * Base class of every error raised while decoding or loading i3dm content.
 * All of them are fatal to the single tile content being processed.
 */
class I3dmError : public std::runtime_error {
public:
    explicit I3dmError(const std::string& message) : std::runtime_error(message) {}
};

// Magic tag is not "i3dm"
class FormatError : public I3dmError {
public:
    using I3dmError::I3dmError;
};

class UnsupportedVersionError : public I3dmError {
public:
    using I3dmError::I3dmError;
};

// Mandatory section missing, truncated buffer or unparsable table JSON
class MalformedTileError : public I3dmError {
public:
    using I3dmError::I3dmError;
};

class UnsupportedPayloadFormatError : public I3dmError {
public:
    using I3dmError::I3dmError;
};

class MissingRequiredPropertyError : public I3dmError {
public:
    using I3dmError::I3dmError;
};

// Only one member of an up/right normal pair is present
class InconsistentOrientationError : public I3dmError {
public:
    using I3dmError::I3dmError;
};

class IndexOutOfRangeError : public I3dmError {
public:
    using I3dmError::I3dmError;
};

class NetworkFetchError : public I3dmError {
public:
    using I3dmError::I3dmError;
};

// Rejection reason of the ready signal when the content is destroyed mid-fetch
class ContentDestroyedError : public I3dmError {
public:
    using I3dmError::I3dmError;
};

}
