#include "RunConfig.hpp"

#include <unordered_map>

std::optional<ProcessingMode> ToProcessingMode(const std::string& ModeStr)
{
    static const std::unordered_map<std::string, ProcessingMode> ModeMap = {
        { "normal",         ProcessingMode::Normal },
        { "validate-only",  ProcessingMode::ValidateOnly },
        { "validate-after", ProcessingMode::ValidateAfter }
    };

    auto it = ModeMap.find(ModeStr);
    if (it == ModeMap.end())
    {
        return std::nullopt;
    }
    return it->second;
}

std::string ProcessingModeToString(ProcessingMode Mode)
{
    switch (Mode)
    {
    case ProcessingMode::Normal:        return "normal";
    case ProcessingMode::ValidateOnly:  return "validate-only";
    case ProcessingMode::ValidateAfter: return "validate-after";
    default:                            return "unknown";
    }
}
