#pragma once
#include <stdexcept>
#include <string>

// Upstream answered 429. Fatal to the whole run.
class RateLimitedError : public std::runtime_error
{
public:
    RateLimitedError() : std::runtime_error("Rate limited") {}
};

// Non-2xx answer other than 429.
class FetchError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class DecodeError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
