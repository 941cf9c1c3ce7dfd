#include "HealthRecord.hpp"

namespace fleetsense {

std::string healthTrendToString(HealthTrend trend) {
    switch (trend) {
        case HealthTrend::Improving: return "improving";
        case HealthTrend::Stable: return "stable";
        case HealthTrend::Declining: return "declining";
        case HealthTrend::Critical: return "critical";
    }
    return "stable";
}

} // namespace fleetsense
