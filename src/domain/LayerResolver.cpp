#include "domain/LayerResolver.hpp"

#include <algorithm>

namespace dobdecoder::domain {

std::optional<ScalarTraitValue> LayerResolver::Resolve(const std::string& sourceTrait, const TraitTable& table) {
    auto it = std::find_if(table.begin(), table.end(), [&](const TraitOutput& output) {
        return output.name == sourceTrait;
    });
    if (it == table.end() || it->traits.empty()) {
        return std::nullopt;
    }
    return it->traits.front();
}

} // namespace dobdecoder::domain
