#include "core/types/ProbeResult.hpp"

namespace vikabh::core {

std::string outcomeToString(ProbeOutcome outcome) {
    switch (outcome) {
    case ProbeOutcome::Online:
        return "Online";
    case ProbeOutcome::Offline:
        return "Offline";
    case ProbeOutcome::Error:
        return "Error";
    }
    return "Error";
}

std::optional<ProbeOutcome> outcomeFromString(const std::string& str) {
    if (str == "Online")
        return ProbeOutcome::Online;
    if (str == "Offline")
        return ProbeOutcome::Offline;
    if (str == "Error")
        return ProbeOutcome::Error;
    return std::nullopt;
}

std::string failureToString(ProbeFailure failure) {
    switch (failure) {
    case ProbeFailure::None:
        return "none";
    case ProbeFailure::Timeout:
        return "timeout";
    case ProbeFailure::Refused:
        return "refused";
    case ProbeFailure::Unreachable:
        return "unreachable";
    case ProbeFailure::ResolutionFailed:
        return "resolution_failed";
    case ProbeFailure::PermissionDenied:
        return "permission_denied";
    case ProbeFailure::Internal:
        return "internal";
    }
    return "internal";
}

ProbeOutcome outcomeForFailure(ProbeFailure failure) {
    switch (failure) {
    case ProbeFailure::None:
        return ProbeOutcome::Online;
    case ProbeFailure::Timeout:
    case ProbeFailure::Refused:
    case ProbeFailure::Unreachable:
        return ProbeOutcome::Offline;
    case ProbeFailure::ResolutionFailed:
    case ProbeFailure::PermissionDenied:
    case ProbeFailure::Internal:
        return ProbeOutcome::Error;
    }
    return ProbeOutcome::Error;
}

} // namespace vikabh::core
