/**
 * @file ValueMatcher.hpp
 * @brief Applies a schema entry's matching rule to a resolved trait value.
 */

#pragma once

#include <optional>
#include <string>

#include "domain/ImageSchema.hpp"
#include "domain/Result.hpp"
#include "domain/TraitOutput.hpp"

namespace dobdecoder::domain {

/**
 * @class ValueMatcher
 * @brief Stateless selection of the content string for one layer.
 *
 * A successful result holding nullopt means "no key matched"; the pipeline
 * truncates the image group on it. Errors are fatal for the whole run.
 */
class ValueMatcher {
public:
    /**
     * @brief Selects the content for @p resolved.
     * @param pattern Matching strategy of the entry.
     * @param table Match table of the entry (required for Options/Range).
     * @param resolved Trait value produced by LayerResolver.
     * @return Content string, nullopt when nothing matched, or an error.
     */
    static Result<std::optional<std::string>> Match(MatchPattern pattern,
                                                    const std::optional<MatchTable>& table,
                                                    const ScalarTraitValue& resolved);

    /**
     * @brief Walks @p table in declaration order; the first matching key wins.
     */
    static Result<std::optional<std::string>> MatchTableValue(const MatchTable& table,
                                                              const ScalarTraitValue& resolved);
};

} // namespace dobdecoder::domain
