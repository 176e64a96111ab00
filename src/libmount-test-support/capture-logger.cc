#include "fedfs/mount/tests/capture-logger.hh"
#include "fedfs/util/strings.hh"

#include <sstream>

namespace fedfs {

void CaptureLogger::log(Verbosity lvl, std::string_view s)
{
    messages_.lock()->push_back({lvl, filterANSIEscapes(s, true)});
}

void CaptureLogger::logEI(const ErrorInfo & ei)
{
    std::ostringstream oss;
    showErrorInfo(oss, ei, loggerSettings.showTrace.get());
    log(ei.level, oss.str());
}

std::vector<std::string> CaptureLogger::messages(Verbosity level)
{
    std::vector<std::string> res;
    for (auto & msg : *messages_.lock())
        if (msg.level == level)
            res.push_back(msg.text);
    return res;
}

LogCapture::LogCapture()
{
    auto logger_ = std::make_unique<CaptureLogger>();
    capture = logger_.get();
    saved = std::exchange(logger, std::move(logger_));
}

LogCapture::~LogCapture()
{
    logger = std::move(saved);
}

} // namespace fedfs
