#ifndef REDLINE_ERRORS_H
#define REDLINE_ERRORS_H
#include <string>
#include <map>
#include <exception>

namespace redline {

enum class ErrorKind {
    Input,
    Config,
    Comparison,
    Reconstruction
};

extern const std::map<ErrorKind, std::string> errorKindString;

enum class ErrorType {
    // Input errors
    BodyNotFound,
    BadXML,
    // Configuration errors
    BadConfig,
    // Comparison errors
    UnsupportedCombination,
    IllegalTransition,
    // Reconstruction errors
    SafetyCheckFailed,

    // Other
    Other
};

extern const std::map<ErrorType, std::string> errorTypeString;

enum class Severity {
    Error,
    Warning
};

extern const std::map<Severity, std::string> severityString;

class ErrorMsg
{
public:
    ErrorMsg(ErrorKind kind_, ErrorType type_, Severity severity_, const std::string& msg, const std::string& extra_ = {});

    std::string msg() const {
        return errorKindString.at(kind)+" "+severityString.at(severity)+": "+errorTypeString.at(type)+". "+message;
    }

    ErrorKind kind;
    ErrorType type;
    Severity severity;
    std::string message;
    std::string extra;
};

class RedlineException: public ErrorMsg, public std::exception
{
public:
    RedlineException(ErrorKind kind_, ErrorType type_, const std::string& msg, const std::string& extra_ = {}):
        ErrorMsg(kind_, type_, Severity::Error, msg, extra_), _what(ErrorMsg::msg()) {}

    virtual const char* what() const noexcept {
        return _what.c_str();
    }
private:
    std::string _what;
};

} // namespace redline

#endif //REDLINE_ERRORS_H
