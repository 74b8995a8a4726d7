#pragma once

#include "discovery/SourceAdapter.hpp"
#include "model/Book.hpp"
#include <string>
#include <vector>

namespace tankobon::util { class Logger; }
namespace tankobon::backend { class ArtifactStore; }

namespace tankobon::discovery {

/**
 * Turns chapter-list markup into the ordered chapters still to process.
 *
 * Indices are positions (1-based, reading order) among all entries the
 * schema enumerates, including entries without a handle, and are assigned
 * before filtering so they stay stable from run to run. A handle listed
 * twice keeps its first position only. A chapter whose URL list already
 * exists is dropped unless overwrite is set.
 */
class ChapterResolver {
public:
    ChapterResolver(ChapterListSchema schema, util::Logger& logger);

    // Every distinct chapter in the markup, indexed in reading order
    std::vector<model::Chapter> parse(const std::string& markup) const;

    std::vector<model::Chapter> resolve(const std::string& markup, const backend::ArtifactStore& store,
                                        const model::Book& book, bool overwrite) const;

private:
    ChapterListSchema schema_;
    util::Logger& logger_;
};

}  // namespace tankobon::discovery
