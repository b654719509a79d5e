#pragma once

#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace grader {

/// Destination of a rendered report
class Sink
{
public:
    virtual void write(std::string_view str) = 0;
    virtual void flush() = 0;

    virtual ~Sink() = default;
};

/// Writes to a C stream such as stdout. Each write is atomic with respect to other threads.
class FileSink : public Sink
{
public:
    explicit FileSink(std::FILE* file)
        : file_{file} {}

    void write(std::string_view str) override;
    void flush() override;

private:
    std::FILE* file_;
    std::mutex mutex_;
};

/// Buffers everything written, so that a report produced on a worker thread can be printed
/// in one piece afterwards
class StringSink : public Sink
{
public:
    void write(std::string_view str) override { buffer_ += str; }

    void flush() override {}

    const std::string& get_str() const { return buffer_; }

    std::string take() { return std::exchange(buffer_, {}); }

private:
    std::string buffer_;
};

} // namespace grader
