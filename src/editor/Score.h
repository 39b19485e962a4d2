#pragma once

#include "editor/Note.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notesketch {

/// Ordered note collection with stable ids
class Score {
public:
    /// Add a note, assigning it a fresh id. Returns the id.
    int add(Note note);

    /// Remove by id. Returns false if no such note.
    bool remove(int id);

    Note* find(int id);
    const Note* find(int id) const;

    /// Ids of every note intersecting the box, in insertion order
    std::vector<int> notesIn(double t0, double t1, double p0, double p1) const;

    /// Copy of the notes ordered by start time (stable)
    std::vector<Note> sortedByStart() const;

    /// End of the last note, 0 for an empty score
    double endTime() const;

    const std::vector<Note>& notes() const { return notes_; }
    size_t size() const { return notes_.size(); }
    bool empty() const { return notes_.empty(); }
    void clear() { notes_.clear(); }

    // --- Persistence (TOML, version 0 layout) ---

    std::string toToml() const;

    /// Parse a document. Returns nullopt and fills `error` on failure.
    static std::optional<Score> fromToml(std::string_view text, std::string& error);

    bool save(const std::string& path, std::string& error) const;
    static std::optional<Score> load(const std::string& path, std::string& error);

private:
    std::vector<Note> notes_;
    int nextId_ = 1;
};

} // namespace notesketch
