#include <docsync-cpp/document.hpp>
#include <docsync-cpp/error.hpp>

namespace docsync_cpp {

namespace {

const auto empty_object = ObjectValue::object();

}  // namespace

auto MutableDocument::invalid(DocumentKey key) -> MutableDocument {
    return MutableDocument{std::move(key), InvalidContents{}};
}

auto MutableDocument::found(DocumentKey key, SnapshotVersion version, ObjectValue data)
    -> MutableDocument {
    return MutableDocument{std::move(key), FoundContents{version, SnapshotVersion::none(), std::move(data)}};
}

auto MutableDocument::no_document(DocumentKey key, SnapshotVersion version) -> MutableDocument {
    return MutableDocument{std::move(key), NoDocumentContents{version}};
}

auto MutableDocument::unknown(DocumentKey key, SnapshotVersion version) -> MutableDocument {
    return MutableDocument{std::move(key), UnknownContents{version}};
}

auto MutableDocument::convert_to_found(SnapshotVersion version, ObjectValue data) -> MutableDocument& {
    auto create_time = this->create_time();
    contents_ = FoundContents{version, create_time, std::move(data)};
    state_ = DocumentState::synced;
    return *this;
}

auto MutableDocument::convert_to_no_document(SnapshotVersion version) -> MutableDocument& {
    contents_ = NoDocumentContents{version};
    state_ = DocumentState::synced;
    return *this;
}

auto MutableDocument::convert_to_unknown(SnapshotVersion version) -> MutableDocument& {
    contents_ = UnknownContents{version};
    state_ = DocumentState::has_committed_mutations;
    return *this;
}

auto MutableDocument::set_has_committed_mutations() -> MutableDocument& {
    state_ = DocumentState::has_committed_mutations;
    return *this;
}

auto MutableDocument::set_has_local_mutations() -> MutableDocument& {
    state_ = DocumentState::has_local_mutations;
    return *this;
}

auto MutableDocument::set_read_time(SnapshotVersion read_time) -> MutableDocument& {
    read_time_ = read_time;
    return *this;
}

auto MutableDocument::set_create_time(SnapshotVersion create_time) -> MutableDocument& {
    if (auto* found = std::get_if<FoundContents>(&contents_)) {
        found->create_time = create_time;
    }
    return *this;
}

auto MutableDocument::version() const -> SnapshotVersion {
    return std::visit(overload{
        [](const InvalidContents&) { return SnapshotVersion::none(); },
        [](const auto& c) { return c.version; },
    }, contents_);
}

auto MutableDocument::create_time() const -> SnapshotVersion {
    if (const auto* found = std::get_if<FoundContents>(&contents_)) return found->create_time;
    return SnapshotVersion::none();
}

auto MutableDocument::data() const -> const ObjectValue& {
    if (const auto* found = std::get_if<FoundContents>(&contents_)) return found->data;
    return empty_object;
}

auto MutableDocument::mutable_data() -> ObjectValue& {
    if (auto* found = std::get_if<FoundContents>(&contents_)) return found->data;
    throw Exception{ErrorCode::failed_precondition,
                    "mutable_data on a document that is not found: " + key_.to_string()};
}

auto MutableDocument::field(const FieldPath& path) const -> std::optional<FieldValue> {
    if (path.is_key_field()) return reference_value(key_);
    const auto* value = get_field(data(), path);
    if (!value) return std::nullopt;
    return *value;
}

auto MutableDocument::to_string() const -> std::string {
    auto kind = std::visit(overload{
        [](const InvalidContents&) { return std::string{"Invalid"}; },
        [](const FoundContents& c) { return "Found(" + c.data.dump() + ")"; },
        [](const NoDocumentContents&) { return std::string{"NoDocument"}; },
        [](const UnknownContents&) { return std::string{"Unknown"}; },
    }, contents_);
    auto state = std::string{};
    switch (state_) {
        case DocumentState::synced: state = "synced"; break;
        case DocumentState::has_local_mutations: state = "local"; break;
        case DocumentState::has_committed_mutations: state = "committed"; break;
    }
    return "Document(" + key_.to_string() + ", " + kind + ", " + version().to_string() +
           ", read " + read_time_.to_string() + ", " + state + ")";
}

}  // namespace docsync_cpp
