#pragma once
#include <stdexcept>
#include <string>

// Worker-fatal: the detector model could not be loaded
class ModelLoadError : public std::runtime_error
{
public:
    explicit ModelLoadError(const std::string &what) : std::runtime_error(what) {}
};

// Per-image: the file could not be decoded as an image
class DecodeError : public std::runtime_error
{
public:
    explicit DecodeError(const std::string &what) : std::runtime_error(what) {}
};

// Per-image: the detector failed while analysing a decoded image
class DetectionError : public std::runtime_error
{
public:
    explicit DetectionError(const std::string &what) : std::runtime_error(what) {}
};

// Per-image: the image needs more memory than is available
class ResourceExhaustedError : public std::runtime_error
{
public:
    explicit ResourceExhaustedError(const std::string &what) : std::runtime_error(what) {}
};

// Per-file: a move/copy into the destination directory failed
class FilesystemError : public std::runtime_error
{
public:
    explicit FilesystemError(const std::string &what) : std::runtime_error(what) {}
};

// Per-file: no free "name_N.ext" candidate within the attempt limit
class ConflictResolutionExhausted : public FilesystemError
{
public:
    explicit ConflictResolutionExhausted(const std::string &what) : FilesystemError(what) {}
};
