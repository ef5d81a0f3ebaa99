#pragma once
#include <stdexcept>
#include <string>

// Base of every error raised while serving a request.
class FakeRestError : public std::runtime_error {
public:
    explicit FakeRestError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed request bytes: bad UTF-8, missing delimiter, line/header limits.
class ParsingError : public FakeRestError {
public:
    explicit ParsingError(const std::string& what)
        : FakeRestError("parsing error: " + what) {}
};

class ConfigRequiredHeadersError : public FakeRestError {
public:
    ConfigRequiredHeadersError()
        : FakeRestError("required headers missing") {}
    explicit ConfigRequiredHeadersError(const std::string& name)
        : FakeRestError("required headers missing: " + name) {}
};

class ConfigRequiredQueriesError : public FakeRestError {
public:
    ConfigRequiredQueriesError()
        : FakeRestError("required queries missing") {}
    explicit ConfigRequiredQueriesError(const std::string& name)
        : FakeRestError("required queries missing: " + name) {}
};

// A `file` / `dl` route points at something that is not a regular file.
class ConfigFileOpenError : public FakeRestError {
public:
    explicit ConfigFileOpenError(const std::string& path)
        : FakeRestError("config file open error: " + path) {}
};

// Route table shape problems (loader) and malformed `result_headers` items.
class ConfigParsingError : public FakeRestError {
public:
    explicit ConfigParsingError(const std::string& what)
        : FakeRestError("config parsing error: " + what) {}
};

// Transport and filesystem failures.
class IoError : public FakeRestError {
public:
    explicit IoError(const std::string& what)
        : FakeRestError("io error: " + what) {}
};
