#pragma once
///@file

#include "fedfs/util/logging.hh"
#include "fedfs/util/sync.hh"

namespace fedfs {

/**
 * A logger that remembers what it was told instead of printing it.
 */
class CaptureLogger : public Logger
{
public:

    struct Message
    {
        Verbosity level;
        std::string text;
    };

    void log(Verbosity lvl, std::string_view s) override;

    void logEI(const ErrorInfo & ei) override;

    /**
     * The messages logged at `level`, without ANSI escapes.
     */
    std::vector<std::string> messages(Verbosity level);

private:

    Sync<std::vector<Message>> messages_;
};

/**
 * Replaces the global logger with a `CaptureLogger` for the lifetime
 * of this object.
 */
class LogCapture
{
    std::unique_ptr<Logger> saved;
    CaptureLogger * capture;

public:

    LogCapture();

    ~LogCapture();

    CaptureLogger & operator*()
    {
        return *capture;
    }

    CaptureLogger * operator->()
    {
        return capture;
    }
};

} // namespace fedfs
