#include "domain/ValueMatcher.hpp"

#include <type_traits>

namespace dobdecoder::domain {

namespace {

using MatchOutcome = Result<std::optional<std::string>>;

// Outcome of testing a single key: matched, not matched, or a kind mismatch.
enum class KeyVerdict { Hit, Miss, KindMismatch };

KeyVerdict TestKey(const MatchKey& key, const ScalarTraitValue& resolved) {
    return std::visit([&](const auto& k) -> KeyVerdict {
        using K = std::decay_t<decltype(k)>;
        if constexpr (std::is_same_v<K, ExactString>) {
            const auto* text = std::get_if<std::string>(&resolved);
            if (!text) return KeyVerdict::KindMismatch;
            return *text == k.text ? KeyVerdict::Hit : KeyVerdict::Miss;
        } else if constexpr (std::is_same_v<K, ExactNumber>) {
            const auto* number = std::get_if<std::uint64_t>(&resolved);
            if (!number) return KeyVerdict::KindMismatch;
            return *number == k.value ? KeyVerdict::Hit : KeyVerdict::Miss;
        } else if constexpr (std::is_same_v<K, NumericRange>) {
            const auto* number = std::get_if<std::uint64_t>(&resolved);
            if (!number) return KeyVerdict::KindMismatch;
            return (k.start <= *number && *number <= k.end) ? KeyVerdict::Hit : KeyVerdict::Miss;
        } else {
            return KeyVerdict::Hit;
        }
    }, key);
}

} // namespace

MatchOutcome ValueMatcher::Match(MatchPattern pattern,
                                 const std::optional<MatchTable>& table,
                                 const ScalarTraitValue& resolved) {
    switch (pattern) {
        case MatchPattern::Raw: {
            const auto* text = std::get_if<std::string>(&resolved);
            if (!text) {
                return DecodeError::DecodeInvalidRawValue;
            }
            return MatchOutcome(std::optional<std::string>(*text));
        }
        case MatchPattern::Options:
        case MatchPattern::Range:
            if (!table) {
                return DecodeError::DecodeInvalidOptionArgs;
            }
            return MatchTableValue(*table, resolved);
    }
    return DecodeError::DecodeInvalidOptionArgs;
}

MatchOutcome ValueMatcher::MatchTableValue(const MatchTable& table, const ScalarTraitValue& resolved) {
    for (const auto& [key, content] : table) {
        switch (TestKey(key, resolved)) {
            case KeyVerdict::Hit:
                return MatchOutcome(std::optional<std::string>(content));
            case KeyVerdict::KindMismatch:
                return DecodeError::SchemaInvalidParsedTraitType;
            case KeyVerdict::Miss:
                break;
        }
    }
    return MatchOutcome(std::optional<std::string>());
}

} // namespace dobdecoder::domain
