#include "bubblefit/core/types.h"

namespace bubblefit {

const char* toString(EngineError err) {
    switch (err) {
        case EngineError::Ok: return "Ok";
        case EngineError::NotFound: return "NotFound";
        case EngineError::InvalidOperation: return "InvalidOperation";
        case EngineError::InvalidValue: return "InvalidValue";
        case EngineError::FileNotFound: return "FileNotFound";
        case EngineError::ParseError: return "ParseError";
    }
    return "Unknown";
}

const char* toString(RegionIssue issue) {
    switch (issue) {
        case RegionIssue::None: return "None";
        case RegionIssue::InfeasibleFit: return "InfeasibleFit";
        case RegionIssue::DegenerateBox: return "DegenerateBox";
        case RegionIssue::UnknownFont: return "UnknownFont";
        case RegionIssue::MaskClampedToZero: return "MaskClampedToZero";
    }
    return "Unknown";
}

} // namespace bubblefit
