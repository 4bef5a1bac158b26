#include <termpanel/error.hpp>

namespace termpanel
{

std::string_view error_kind_tag(ErrorKind kind)
{
    switch (kind)
    {
        case ErrorKind::NotFound:
            return "not_found";
        case ErrorKind::ResourceBusy:
            return "resource_busy";
        case ErrorKind::DependencyMissing:
            return "dependency_missing";
        case ErrorKind::ProcessStartFailure:
            return "process_start_failure";
        case ErrorKind::StreamFault:
            return "stream_fault";
        case ErrorKind::InvalidArgument:
            return "invalid_argument";
        case ErrorKind::Internal:
            return "internal";
    }
    return "internal";
}

std::optional<ErrorKind> error_kind_from_tag(std::string_view tag)
{
    for (auto kind : {ErrorKind::NotFound,
                      ErrorKind::ResourceBusy,
                      ErrorKind::DependencyMissing,
                      ErrorKind::ProcessStartFailure,
                      ErrorKind::StreamFault,
                      ErrorKind::InvalidArgument,
                      ErrorKind::Internal})
    {
        if (error_kind_tag(kind) == tag)
            return kind;
    }
    return std::nullopt;
}

std::string Error::to_string() const
{
    std::string out(error_kind_tag(kind));
    if (!detail.empty())
    {
        out += ": ";
        out += detail;
    }
    return out;
}

}   // namespace termpanel
