/**
 * @file FunctionRegistry.cpp
 * @brief Implementation of FunctionRegistry and the built-in functions.
 */

#include "application/FunctionRegistry.hpp"

#include <algorithm>
#include <stdexcept>

namespace notedrift::application {

namespace {

constexpr std::size_t kDefaultCount = 5;

std::size_t CountArg(const std::vector<std::string>& args, std::size_t index) {
    if (index >= args.size()) return kDefaultCount;
    const std::string& text = args[index];
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw std::invalid_argument("Expected a count, got '" + text + "'");
    }
    return static_cast<std::size_t>(std::stoul(text));
}

std::vector<std::string> ByTimestamp(const SessionHandle& handle, std::size_t k, bool oldestFirst) {
    std::vector<const domain::Note*> notes;
    for (const auto& [id, note] : handle.notes()) notes.push_back(&note);
    std::sort(notes.begin(), notes.end(), [oldestFirst](const domain::Note* a, const domain::Note* b) {
        auto ta = oldestFirst ? a->created : a->modified;
        auto tb = oldestFirst ? b->created : b->modified;
        if (ta != tb) return oldestFirst ? ta < tb : ta > tb;
        return a->id < b->id;
    });
    std::vector<std::string> out;
    for (std::size_t i = 0; i < notes.size() && i < k; ++i) out.push_back(notes[i]->id);
    return out;
}

std::vector<std::string> SampleNotes(const SessionHandle& handle, const std::vector<std::string>& args) {
    return handle.sample(handle.graph().NoteIds(), CountArg(args, 0), "sample_notes");
}

std::vector<std::string> OldNotes(const SessionHandle& handle, const std::vector<std::string>& args) {
    return ByTimestamp(handle, CountArg(args, 0), true);
}

std::vector<std::string> RecentNotes(const SessionHandle& handle, const std::vector<std::string>& args) {
    return ByTimestamp(handle, CountArg(args, 0), false);
}

std::vector<std::string> HubNotes(const SessionHandle& handle, const std::vector<std::string>& args) {
    return handle.graph().Hubs(CountArg(args, 0));
}

std::vector<std::string> OrphanNotes(const SessionHandle& handle, const std::vector<std::string>& args) {
    return handle.graph().Orphans(CountArg(args, 0));
}

std::vector<std::string> NeighbourNotes(const SessionHandle& handle, const std::vector<std::string>& args) {
    if (args.empty()) throw std::invalid_argument("neighbours needs a note id");
    std::vector<std::string> out;
    for (const auto& [id, sim] : handle.graph().Neighbours(args[0], CountArg(args, 1))) out.push_back(id);
    return out;
}

std::vector<std::string> ClusterLabels(const SessionHandle& handle, const std::vector<std::string>&) {
    std::vector<std::string> out;
    for (const auto& [id, label] : handle.clusterLabels()) out.push_back(label);
    return out;
}

} // namespace

void FunctionRegistry::add(const std::string& name, SessionFunction fn) {
    if (name.empty()) throw std::invalid_argument("Function name must not be empty");
    if (!fn) throw std::invalid_argument("Function '" + name + "' is null");
    if (!m_functions.emplace(name, fn).second) {
        throw std::invalid_argument("Function '" + name + "' is already registered");
    }
}

std::vector<std::string> FunctionRegistry::call(const std::string& name,
                                                const SessionHandle& handle,
                                                const std::vector<std::string>& args) const {
    auto it = m_functions.find(name);
    if (it == m_functions.end()) throw std::invalid_argument("Unknown function '" + name + "'");
    return it->second(handle, args);
}

std::vector<std::string> FunctionRegistry::names() const {
    std::vector<std::string> out;
    for (const auto& [name, fn] : m_functions) out.push_back(name);
    return out;
}

void RegisterBuiltinFunctions(FunctionRegistry& registry) {
    registry.add("sample_notes", &SampleNotes);
    registry.add("old_notes", &OldNotes);
    registry.add("recent_notes", &RecentNotes);
    registry.add("hubs", &HubNotes);
    registry.add("orphans", &OrphanNotes);
    registry.add("neighbours", &NeighbourNotes);
    registry.add("cluster_labels", &ClusterLabels);
}

} // namespace notedrift::application
