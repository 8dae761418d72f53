/**
 * Spotiflow - Genre Tagger
 */

#ifndef SPOTIFLOW_GENRE_TAGGER_H
#define SPOTIFLOW_GENRE_TAGGER_H

#include "spotiflow/types.h"
#include "../core/store.h"
#include <optional>
#include <string>
#include <vector>

namespace spotiflow {

/**
 * Supplies free-text tags for a track, most relevant first.
 */
class TagSource {
public:
    virtual ~TagSource() = default;

    virtual std::vector<std::string> fetch_tags(
        const std::string& track_name,
        const std::string& artist_name
    ) = 0;
};

/**
 * Reads tags recorded in the track_tags table.
 */
class StoreTagSource : public TagSource {
public:
    explicit StoreTagSource(Store& store) : store_(store) {}

    std::vector<std::string> fetch_tags(
        const std::string& track_name,
        const std::string& artist_name
    ) override;

private:
    Store& store_;
};

/**
 * Maps free-text tags onto a small closed genre vocabulary.
 * Independent of tour construction.
 */
class GenreTagger {
public:
    explicit GenreTagger(TagSource& source) : source_(source) {}

    /**
     * Genre of a track, or std::nullopt if no tag matches the vocabulary.
     */
    std::optional<std::string> lookup_genre(const std::string& track_name, const std::string& artist_name);

    /**
     * First vocabulary label matched by a tag. A tag matches a label when
     * either contains the other, ignoring case. Tags are tried in order,
     * labels in vocabulary order; empty tags never match.
     */
    static std::optional<std::string> match_genre(const std::vector<std::string>& tags);

    static const std::vector<std::string>& vocabulary();

private:
    TagSource& source_;
};

} // namespace spotiflow

#endif // SPOTIFLOW_GENRE_TAGGER_H
