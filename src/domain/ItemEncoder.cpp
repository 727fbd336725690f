#include "domain/ItemEncoder.hpp"

#include <stdexcept>
#include <utility>

namespace dobdecoder::domain {

namespace {

constexpr std::uint32_t kHeaderFieldSize = 4;

void WriteU32(std::vector<std::uint8_t>& buf, std::uint32_t v) {
    buf.push_back(static_cast<std::uint8_t>(v & 0xFF));
    buf.push_back(static_cast<std::uint8_t>((v >> 8) & 0xFF));
    buf.push_back(static_cast<std::uint8_t>((v >> 16) & 0xFF));
    buf.push_back(static_cast<std::uint8_t>((v >> 24) & 0xFF));
}

std::uint32_t ReadU32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0])
         | (static_cast<std::uint32_t>(p[1]) << 8)
         | (static_cast<std::uint32_t>(p[2]) << 16)
         | (static_cast<std::uint32_t>(p[3]) << 24);
}

// tag + length prefix + payload
std::uint64_t ItemSize(const EncodedItem& item) {
    return std::uint64_t{kHeaderFieldSize} * 2 + item.payload.size();
}

std::optional<EncodedItem> ParseItem(const std::uint8_t* p, std::uint32_t size) {
    if (size < kHeaderFieldSize * 2) return std::nullopt;
    std::uint32_t tag = ReadU32(p);
    if (tag > static_cast<std::uint32_t>(ItemTag::RawImage)) return std::nullopt;
    std::uint32_t length = ReadU32(p + kHeaderFieldSize);
    if (length != size - kHeaderFieldSize * 2) return std::nullopt;

    EncodedItem item;
    item.tag = static_cast<ItemTag>(tag);
    const std::uint8_t* payload = p + kHeaderFieldSize * 2;
    item.payload.assign(payload, payload + length);
    return item;
}

} // namespace

EncodedItem ItemEncoder::Wrap(ImageKind kind, const std::string& content) {
    return EncodedItem{TagForKind(kind), content};
}

std::uint64_t ItemEncoder::EncodedSize(const ItemList& items) {
    std::uint64_t total = std::uint64_t{kHeaderFieldSize} * (items.size() + 1);
    for (const auto& item : items) {
        total += ItemSize(item);
    }
    return total;
}

std::vector<std::uint8_t> ItemEncoder::EncodeItemList(const ItemList& items) {
    const std::uint64_t totalSize = EncodedSize(items);
    if (totalSize > MaxListSize) {
        throw std::length_error("item list exceeds the u32 size header");
    }
    // Every size and offset below is bounded by totalSize, so the u32 casts are exact.
    const std::uint32_t headerSize = kHeaderFieldSize * static_cast<std::uint32_t>(items.size() + 1);

    std::vector<std::uint8_t> out;
    out.reserve(static_cast<std::size_t>(totalSize));
    WriteU32(out, static_cast<std::uint32_t>(totalSize));

    std::uint32_t offset = headerSize;
    for (const auto& item : items) {
        WriteU32(out, offset);
        offset += static_cast<std::uint32_t>(ItemSize(item));
    }

    for (const auto& item : items) {
        WriteU32(out, static_cast<std::uint32_t>(item.tag));
        WriteU32(out, static_cast<std::uint32_t>(item.payload.size()));
        out.insert(out.end(), item.payload.begin(), item.payload.end());
    }
    return out;
}

std::optional<ItemList> ItemEncoder::DecodeItemList(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < kHeaderFieldSize) return std::nullopt;
    const std::uint8_t* base = bytes.data();
    const std::uint32_t totalSize = ReadU32(base);
    if (totalSize != bytes.size()) return std::nullopt;
    if (totalSize == kHeaderFieldSize) return ItemList{};

    if (totalSize < kHeaderFieldSize * 2) return std::nullopt;
    const std::uint32_t firstOffset = ReadU32(base + kHeaderFieldSize);
    if (firstOffset % kHeaderFieldSize != 0 || firstOffset < kHeaderFieldSize * 2 || firstOffset > totalSize) {
        return std::nullopt;
    }

    const std::uint32_t count = firstOffset / kHeaderFieldSize - 1;
    std::vector<std::uint32_t> offsets;
    offsets.reserve(count + 1);
    for (std::uint32_t i = 0; i < count; ++i) {
        offsets.push_back(ReadU32(base + kHeaderFieldSize * (i + 1)));
    }
    offsets.push_back(totalSize);

    ItemList items;
    items.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        if (offsets[i] > offsets[i + 1]) return std::nullopt;
        auto item = ParseItem(base + offsets[i], offsets[i + 1] - offsets[i]);
        if (!item) return std::nullopt;
        items.push_back(std::move(*item));
    }
    return items;
}

} // namespace dobdecoder::domain
