#pragma once
#include <stdexcept>
#include <string>

namespace web_archiver {

// Root of everything the engine throws on purpose.
class ArchiverError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// robots.txt refused the page itself. Fatal for that URL.
class PolicyDenied : public ArchiverError {
public:
    using ArchiverError::ArchiverError;
};

// Network, HTTP status, timeout or browser failure on the main page.
class BackendError : public ArchiverError {
public:
    using ArchiverError::ArchiverError;
};

// One asset failed. Collected by the downloader, never escapes a run.
class ResourceFetchError : public ArchiverError {
public:
    using ArchiverError::ArchiverError;
};

// Disk failure while materializing a snapshot.
class WriteError : public ArchiverError {
public:
    using ArchiverError::ArchiverError;
};

// Imported tree has no usable metadata.json.
class InvalidArchive : public ArchiverError {
public:
    using ArchiverError::ArchiverError;
};

} // namespace web_archiver
