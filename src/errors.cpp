#include "redline/errors.h"

using namespace std;

namespace redline {

const map<ErrorKind, string> errorKindString = {
    {ErrorKind::Input, "Input"},
    {ErrorKind::Config, "Config"},
    {ErrorKind::Comparison, "Comparison"},
    {ErrorKind::Reconstruction, "Reconstruction"}
};

const map<ErrorType, string> errorTypeString = {
    {ErrorType::BodyNotFound, "Body not found"},
    {ErrorType::BadXML, "Bad XML"},
    {ErrorType::BadConfig, "Bad configuration"},
    {ErrorType::UnsupportedCombination, "Unsupported engine/mode combination"},
    {ErrorType::IllegalTransition, "Illegal status transition"},
    {ErrorType::SafetyCheckFailed, "Round-trip safety check failed"},
    {ErrorType::Other, "Other"}
};

const map<Severity, string> severityString = {
    {Severity::Error, "error"},
    {Severity::Warning, "warning"}
};

ErrorMsg::ErrorMsg(ErrorKind kind_, ErrorType type_, Severity severity_, const string& msg, const string& extra_)
    : kind(kind_), type(type_), severity(severity_), message(msg), extra(extra_)
{
}

} // namespace redline
