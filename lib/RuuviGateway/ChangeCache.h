#ifndef RUUVI_CHANGE_CACHE_H
#define RUUVI_CHANGE_CACHE_H

#include <vector>
#include "GatewayTypes.h"

struct ChangeSet {
    std::vector<TagData> changed;
    TagState updated;
};

namespace ChangeCache {

// A tag counts as changed when its identifier is new or its payload bytes
// differ from the cached ones. RSSI and timestamp are not compared.
// `previous` is not modified; the caller decides when to commit `updated`.
ChangeSet diff(const TagState& previous, const HistoryResponse& response);

bool isChanged(const TagState& state, const TagData& tag);

}  // namespace ChangeCache

#endif
