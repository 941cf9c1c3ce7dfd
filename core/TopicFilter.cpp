#include "TopicFilter.hpp"
#include <vector>

namespace fleetsense::topic {

namespace {

std::vector<std::string> levelsOf(const std::string& topic) {
    std::vector<std::string> levels;
    std::string::size_type start = 0;
    while (true) {
        auto slash = topic.find('/', start);
        if (slash == std::string::npos) {
            levels.push_back(topic.substr(start));
            break;
        }
        levels.push_back(topic.substr(start, slash - start));
        start = slash + 1;
    }
    return levels;
}

} // namespace

bool matches(const std::string& filter, const std::string& topic) {
    return captureVehicle(filter, topic).has_value();
}

std::optional<std::string> captureVehicle(const std::string& filter, const std::string& topic) {
    auto filterLevels = levelsOf(filter);
    auto topicLevels = levelsOf(topic);

    std::optional<std::string> captured;
    for (std::size_t i = 0; i < filterLevels.size(); ++i) {
        const auto& level = filterLevels[i];
        if (level == "#") {
            return captured.value_or("");
        }
        if (i >= topicLevels.size()) {
            return std::nullopt;
        }
        if (level == "+") {
            if (topicLevels[i].empty()) {
                return std::nullopt;
            }
            if (!captured) {
                captured = topicLevels[i];
            }
        } else if (level != topicLevels[i]) {
            return std::nullopt;
        }
    }
    if (topicLevels.size() != filterLevels.size()) {
        return std::nullopt;
    }
    return captured.value_or("");
}

std::string eventTopic(const std::string& prefix, const std::string& vehicleId) {
    return prefix + "/" + vehicleId + "/events";
}

} // namespace fleetsense::topic
