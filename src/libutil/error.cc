#include "fedfs/util/error.hh"
#include "fedfs/util/logging.hh"

#include <cassert>
#include <iostream>
#include <sstream>

namespace fedfs {

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(Trace{.hint = std::move(hint)});
    what_.reset();
}

// c++ std::exception descendants must have a 'const char* what()' function.
// This stringifies the error and caches it for use by what(), or similarly by msg().
const std::string & BaseError::calcWhat() const
{
    if (what_.has_value())
        return *what_;
    else {
        std::ostringstream oss;
        showErrorInfo(oss, err, loggerSettings.showTrace);
        what_ = oss.str();
        return *what_;
    }
}

std::optional<std::string> ErrorInfo::programName = std::nullopt;

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo, bool showTrace)
{
    std::string prefix;
    switch (einfo.level) {
    case lvlError:
        prefix = ANSI_RED "error";
        break;
    case lvlNotice:
        prefix = ANSI_RED "note";
        break;
    case lvlWarn:
        prefix = ANSI_WARNING "warning";
        break;
    case lvlInfo:
        prefix = ANSI_GREEN "info";
        break;
    case lvlTalkative:
        prefix = ANSI_GREEN "talk";
        break;
    case lvlChatty:
        prefix = ANSI_GREEN "chat";
        break;
    case lvlVomit:
        prefix = ANSI_GREEN "vomit";
        break;
    case lvlDebug:
        prefix = ANSI_WARNING "debug";
        break;
    default:
        assert(false);
    }

    if (ErrorInfo::programName)
        prefix += fmt(" [%s]:" ANSI_NORMAL " ", *ErrorInfo::programName);
    else
        prefix += ":" ANSI_NORMAL " ";

    out << prefix << einfo.msg.str();

    /* Without show-trace only the most recently added context is shown. */
    if (showTrace) {
        for (const auto & trace : einfo.traces)
            out << "\n" << "… " << trace.hint.str();
    } else if (!einfo.traces.empty())
        out << "\n" << ANSI_FAINT << "… " << einfo.traces.front().hint.str() << ANSI_NORMAL;

    return out;
}

void panic(std::string_view msg)
{
    writeToStderr(ANSI_RED "HALT: " ANSI_NORMAL);
    writeToStderr(msg);
    writeToStderr("\n");
    std::terminate();
}

void unreachable(std::source_location loc)
{
    panic(fmt("unexpected condition at %s:%d in %s", loc.file_name(), loc.line(), loc.function_name()));
}

} // namespace fedfs
