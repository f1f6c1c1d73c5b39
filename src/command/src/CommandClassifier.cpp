#include "CommandClassifier.hpp"
#include "CommandErrors.hpp"

CommandKind CommandClassifier::kind_of(const std::string& key) {
    if (key == LOCAL_KEY) {
        return CommandKind::Local;
    }
    if (key == MANUAL_KEY) {
        return CommandKind::Manual;
    }
    if (key == INTERPRETED_KEY) {
        return CommandKind::Interpreted;
    }
    if (key.find(REMOTE_MARKER) != std::string::npos) {
        return CommandKind::Remote;
    }
    throw UnknownCommandKind(key);
}

CommandTarget CommandClassifier::classify(const std::string& key, const VariableMap& systems) {
    CommandTarget target;
    target.kind = kind_of(key);
    if (target.kind != CommandKind::Remote) {
        return target;
    }

    const std::string marker = REMOTE_MARKER;
    target.system = key.substr(key.find(marker) + marker.size());

    auto it = systems.find(target.system);
    if (it == systems.end()) {
        throw UnknownHost(target.system);
    }
    target.host = it->second;
    return target;
}
