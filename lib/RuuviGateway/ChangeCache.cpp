#include "ChangeCache.h"

namespace ChangeCache {

bool isChanged(const TagState& state, const TagData& tag) {
    TagState::const_iterator it = state.find(tag.mac);
    return it == state.end() || it->second != tag.data;
}

ChangeSet diff(const TagState& previous, const HistoryResponse& response) {
    ChangeSet result;
    result.updated = previous;

    for (const auto& tag : response.tags) {
        if (isChanged(previous, tag)) {
            result.changed.push_back(tag);
            result.updated[tag.mac] = tag.data;
        }
    }
    return result;
}

}  // namespace ChangeCache
