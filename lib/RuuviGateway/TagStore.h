#ifndef RUUVI_TAG_STORE_H
#define RUUVI_TAG_STORE_H

#include <string>
#include <vector>
#include "AdvertisementDecoder.h"
#include "GatewayTypes.h"

struct TagEntry {
    TagData tag;
    bool advertisementValid = false;
    Advertisement advertisement;
    std::string decodeError;
    unsigned long updatedMs = 0;
    uint32_t changeCount = 0;
};

// Latest sighting per tag, built from the change lists the poller emits.
// Entries stay ordered by identifier so list positions are stable.
class TagStore {
public:
    TagStore(const AdvertisementDecoder& decoder);

    // Returns the number of tags seen for the first time.
    size_t apply(const std::vector<TagData>& changed, unsigned long nowMs);

    const std::vector<TagEntry>& entries() const { return _entries; }
    const TagEntry* find(const std::string& mac) const;
    int indexOf(const std::string& mac) const;
    size_t size() const { return _entries.size(); }
    void clear() { _entries.clear(); }

private:
    const AdvertisementDecoder& _decoder;
    std::vector<TagEntry> _entries;
};

#endif
