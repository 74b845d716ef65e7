#include "core/types/Alert.hpp"

namespace connmon::core {

std::string Alert::typeToString() const {
    switch (type) {
    case AlertType::Problem:
        return "Problem";
    case AlertType::Recovered:
        return "Recovered";
    }
    return "Unknown";
}

std::string formatProblemMessage(const std::string& deviceName, const std::string& status,
                                 int minutes) {
    return deviceName + " has been " + status + " for " + std::to_string(minutes) + " minutes";
}

std::string formatRecoveryMessage(const std::string& deviceName) {
    return deviceName + " has recovered";
}

} // namespace connmon::core
