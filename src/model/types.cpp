#include <docsync-cpp/error.hpp>
#include <docsync-cpp/types.hpp>

#include <algorithm>

namespace docsync_cpp {

auto SnapshotVersion::to_string() const -> std::string {
    return "SnapshotVersion(" + std::to_string(micros) + ")";
}

// -- ResourcePath -------------------------------------------------------------

auto ResourcePath::from_string(std::string_view path) -> ResourcePath {
    auto segments = std::vector<std::string>{};
    auto start = std::size_t{0};
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string_view::npos) end = path.size();
        auto segment = path.substr(start, end - start);
        if (segment.empty()) {
            // Leading or trailing slashes are tolerated, empty inner segments are not
            if (start != 0 && end != path.size()) {
                throw Exception{ErrorCode::invalid_argument,
                                "invalid path (empty segment): " + std::string{path}};
            }
        } else {
            segments.emplace_back(segment);
        }
        start = end + 1;
    }
    return ResourcePath{std::move(segments)};
}

auto ResourcePath::child(std::string_view segment) const -> ResourcePath {
    auto segments = segments_;
    segments.emplace_back(segment);
    return ResourcePath{std::move(segments)};
}

auto ResourcePath::append(const ResourcePath& other) const -> ResourcePath {
    auto segments = segments_;
    segments.insert(segments.end(), other.segments_.begin(), other.segments_.end());
    return ResourcePath{std::move(segments)};
}

auto ResourcePath::pop_last() const -> ResourcePath {
    if (segments_.empty()) {
        throw Exception{ErrorCode::invalid_argument, "cannot pop_last on an empty path"};
    }
    return ResourcePath{std::vector<std::string>{segments_.begin(), segments_.end() - 1}};
}

auto ResourcePath::pop_first(std::size_t count) const -> ResourcePath {
    if (count > segments_.size()) {
        throw Exception{ErrorCode::invalid_argument, "pop_first past the end of the path"};
    }
    return ResourcePath{std::vector<std::string>{
        segments_.begin() + static_cast<std::ptrdiff_t>(count), segments_.end()}};
}

auto ResourcePath::is_prefix_of(const ResourcePath& other) const -> bool {
    if (segments_.size() > other.segments_.size()) return false;
    return std::equal(segments_.begin(), segments_.end(), other.segments_.begin());
}

auto ResourcePath::is_immediate_parent_of(const ResourcePath& other) const -> bool {
    return segments_.size() + 1 == other.segments_.size() && is_prefix_of(other);
}

auto ResourcePath::canonical_string() const -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (i > 0) result += '/';
        result += segments_[i];
    }
    return result;
}

// -- DocumentKey --------------------------------------------------------------

DocumentKey::DocumentKey(ResourcePath path) : path_{std::move(path)} {
    if (!is_document_path(path_)) {
        throw Exception{ErrorCode::invalid_argument,
                        "invalid document key path: " + path_.canonical_string()};
    }
}

auto DocumentKey::from_path_string(std::string_view path) -> DocumentKey {
    return DocumentKey{ResourcePath::from_string(path)};
}

auto DocumentKey::collection_group() const -> const std::string& {
    return path_[path_.size() - 2];
}

auto DocumentKey::has_collection_path(const ResourcePath& collection) const -> bool {
    return path_.size() == collection.size() + 1 && collection.is_prefix_of(path_);
}

auto DatabaseId::document_resource_name(const DocumentKey& key) const -> std::string {
    return "projects/" + project_id + "/databases/" + database_id + "/documents/" +
           key.path().canonical_string();
}

}  // namespace docsync_cpp
