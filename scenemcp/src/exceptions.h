#pragma once

#include <stdexcept>
#include <string>

namespace scenemcp
{
    class ScenemcpException : public std::runtime_error
    {
      public:
        explicit ScenemcpException(std::string msg);
    };

    class DuplicateToolError : public ScenemcpException
    {
      public:
        explicit DuplicateToolError(std::string const & toolName);
    };

    class ToolNotFoundError : public ScenemcpException
    {
      public:
        explicit ToolNotFoundError(std::string const & toolName);
    };

    class PromptNotFoundError : public ScenemcpException
    {
      public:
        explicit PromptNotFoundError(std::string const & promptName);
    };

    class ResourceNotFoundError : public ScenemcpException
    {
      public:
        explicit ResourceNotFoundError(std::string const & uri);
    };

    /// @brief Thrown when tool arguments do not match the declared parameter schema
    class ValidationError : public ScenemcpException
    {
      public:
        explicit ValidationError(std::string const & details)
            : ScenemcpException("Invalid arguments: " + details)
        {
        }
    };

    class WorkerStartError : public ScenemcpException
    {
      public:
        explicit WorkerStartError(std::string const & details)
            : ScenemcpException("Failed to start worker: " + details)
        {
        }
    };

    /// @brief Thrown when the worker process exits or its channel breaks mid-call
    class WorkerCrashedError : public ScenemcpException
    {
      public:
        explicit WorkerCrashedError(std::string const & details)
            : ScenemcpException("Worker crashed: " + details)
        {
        }
    };

    class WorkerTimeoutError : public ScenemcpException
    {
      public:
        explicit WorkerTimeoutError(std::string const & details)
            : ScenemcpException("Worker timed out: " + details)
        {
        }
    };

    class TransportDecodeError : public ScenemcpException
    {
      public:
        explicit TransportDecodeError(std::string const & details)
            : ScenemcpException("Malformed message: " + details)
        {
        }
    };

    class ConfigError : public ScenemcpException
    {
      public:
        explicit ConfigError(std::string const & details)
            : ScenemcpException("Configuration error: " + details)
        {
        }
    };

    class FileIOError : public ScenemcpException
    {
      public:
        explicit FileIOError(std::string const & message)
            : ScenemcpException("File I/O error: " + message)
        {
        }
    };
}
