#include "editor/Score.h"

#include <toml++/toml.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace notesketch {

int Score::add(Note note) {
    note.id = nextId_++;
    if (note.end < note.start)
        std::swap(note.start, note.end);
    notes_.push_back(note);
    return note.id;
}

bool Score::remove(int id) {
    auto it = std::find_if(notes_.begin(), notes_.end(),
                           [id](const Note& n) { return n.id == id; });
    if (it == notes_.end())
        return false;
    notes_.erase(it);
    return true;
}

Note* Score::find(int id) {
    for (auto& note : notes_) {
        if (note.id == id) return &note;
    }
    return nullptr;
}

const Note* Score::find(int id) const {
    return const_cast<Score*>(this)->find(id);
}

std::vector<int> Score::notesIn(double t0, double t1, double p0, double p1) const {
    std::vector<int> ids;
    for (const auto& note : notes_) {
        if (note.intersects(t0, t1, p0, p1))
            ids.push_back(note.id);
    }
    return ids;
}

std::vector<Note> Score::sortedByStart() const {
    std::vector<Note> sorted = notes_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Note& a, const Note& b) { return a.start < b.start; });
    return sorted;
}

double Score::endTime() const {
    double end = 0.0;
    for (const auto& note : notes_)
        end = std::max(end, note.end);
    return end;
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

std::string Score::toToml() const {
    toml::array notes;
    for (const auto& note : notes_) {
        notes.push_back(toml::table{
            {"start", note.start},
            {"end", note.end},
            {"pitch", note.pitch},
            {"velocity", note.velocity},
        });
    }

    toml::table doc{{"notes", std::move(notes)}};
    std::ostringstream out;
    out << doc << "\n";
    return out.str();
}

std::optional<Score> Score::fromToml(std::string_view text, std::string& error) {
    toml::table doc;
    try {
        doc = toml::parse(text);
    } catch (const toml::parse_error& err) {
        error = std::string("Load error: ") + std::string(err.description());
        return std::nullopt;
    }

    // Only the unversioned layout exists so far
    if (doc.contains("version")) {
        error = "Load error: unsupported version or corrupt document";
        return std::nullopt;
    }

    Score score;
    const toml::array* notes = doc["notes"].as_array();
    if (!notes)
        return score;

    for (const auto& node : *notes) {
        const toml::table* entry = node.as_table();
        if (!entry) {
            error = "Load error: notes must be tables";
            return std::nullopt;
        }
        auto start = (*entry)["start"].value<double>();
        auto end = (*entry)["end"].value<double>();
        auto pitch = (*entry)["pitch"].value<double>();
        if (!start || !end || !pitch || *pitch <= 0.0) {
            error = "Load error: note needs start, end and a positive pitch";
            return std::nullopt;
        }

        Note note;
        note.start = *start;
        note.end = *end;
        note.pitch = *pitch;
        note.velocity = std::clamp((*entry)["velocity"].value_or(0.75), 0.0, 1.0);
        score.add(note);
    }
    return score;
}

bool Score::save(const std::string& path, std::string& error) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        error = "Save error: cannot open " + path;
        return false;
    }
    out << toToml();
    if (!out) {
        error = "Save error: write to " + path + " failed";
        return false;
    }
    return true;
}

std::optional<Score> Score::load(const std::string& path, std::string& error) {
    std::ifstream in(path);
    if (!in) {
        error = "Load error: cannot open " + path;
        return std::nullopt;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    return fromToml(buf.str(), error);
}

} // namespace notesketch
