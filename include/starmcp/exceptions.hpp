#pragma once
#include <stdexcept>
#include <string>

namespace starmcp
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct NotFoundError : public Error
{
    using Error::Error;
};

struct ValidationError : public Error
{
    using Error::Error;
};

struct TransportError : public Error
{
    using Error::Error;
};

struct ConfigError : public Error
{
    using Error::Error;
};

/// Non-success HTTP status returned by the GitHub REST API.
class GitHubError : public Error
{
  public:
    GitHubError(long status, const std::string& msg) : Error(msg), status_(status) {}

    long status() const
    {
        return status_;
    }

  private:
    long status_;
};

} // namespace starmcp
