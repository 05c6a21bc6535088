#include "TagStore.h"
#include <algorithm>

namespace {

bool entryBefore(const TagEntry& entry, const std::string& mac) {
    return entry.tag.mac < mac;
}

}  // namespace

TagStore::TagStore(const AdvertisementDecoder& decoder) : _decoder(decoder) {}

size_t TagStore::apply(const std::vector<TagData>& changed, unsigned long nowMs) {
    size_t added = 0;

    for (const auto& tag : changed) {
        std::vector<TagEntry>::iterator it =
            std::lower_bound(_entries.begin(), _entries.end(), tag.mac, entryBefore);
        if (it == _entries.end() || it->tag.mac != tag.mac) {
            it = _entries.insert(it, TagEntry());
            added++;
        }

        it->tag = tag;
        it->updatedMs = nowMs;
        it->changeCount++;
        it->decodeError.clear();
        it->advertisement = Advertisement();
        it->advertisementValid = _decoder.decode(tag.data, it->advertisement, it->decodeError);
    }
    return added;
}

const TagEntry* TagStore::find(const std::string& mac) const {
    int index = indexOf(mac);
    return index >= 0 ? &_entries[index] : nullptr;
}

int TagStore::indexOf(const std::string& mac) const {
    std::vector<TagEntry>::const_iterator it =
        std::lower_bound(_entries.begin(), _entries.end(), mac, entryBefore);
    if (it == _entries.end() || it->tag.mac != mac) return -1;
    return static_cast<int>(it - _entries.begin());
}
