#include <docsync-cpp/document.hpp>
#include <docsync-cpp/error.hpp>

#include <gtest/gtest.h>

using namespace docsync_cpp;

namespace {

auto key(std::string_view path) -> DocumentKey {
    return DocumentKey::from_path_string(path);
}

}  // namespace

// -- Construction -------------------------------------------------------------

TEST(MutableDocument, invalid_has_no_version_and_empty_data) {
    auto doc = MutableDocument::invalid(key("rooms/a"));
    EXPECT_FALSE(doc.is_valid_document());
    EXPECT_TRUE(doc.version().is_none());
    EXPECT_TRUE(doc.data().empty());
    EXPECT_FALSE(doc.has_pending_writes());
}

TEST(MutableDocument, found_exposes_data_and_version) {
    auto doc = MutableDocument::found(key("rooms/a"), SnapshotVersion{7}, {{"name", "lobby"}});
    EXPECT_TRUE(doc.is_found_document());
    EXPECT_EQ(doc.version(), SnapshotVersion{7});
    EXPECT_EQ(doc.data()["name"], "lobby");
}

TEST(MutableDocument, no_document_and_unknown_keep_their_versions) {
    auto missing = MutableDocument::no_document(key("rooms/a"), SnapshotVersion{3});
    EXPECT_TRUE(missing.is_no_document());
    EXPECT_EQ(missing.version(), SnapshotVersion{3});

    auto unknown = MutableDocument::unknown(key("rooms/b"), SnapshotVersion{4});
    EXPECT_TRUE(unknown.is_unknown_document());
    EXPECT_EQ(unknown.version(), SnapshotVersion{4});
    EXPECT_TRUE(unknown.data().empty());
}

// -- Transitions --------------------------------------------------------------

TEST(MutableDocument, convert_to_found_resets_state_to_synced) {
    auto doc = MutableDocument::invalid(key("rooms/a"));
    doc.set_has_local_mutations();
    EXPECT_TRUE(doc.has_local_mutations());

    doc.convert_to_found(SnapshotVersion{2}, {{"n", 1}});
    EXPECT_TRUE(doc.is_found_document());
    EXPECT_FALSE(doc.has_pending_writes());
}

TEST(MutableDocument, convert_to_unknown_marks_committed_mutations) {
    auto doc = MutableDocument::invalid(key("rooms/a"));
    doc.convert_to_unknown(SnapshotVersion{5});
    EXPECT_TRUE(doc.has_committed_mutations());
    EXPECT_TRUE(doc.has_pending_writes());
}

TEST(MutableDocument, create_time_survives_content_updates) {
    auto doc = MutableDocument::found(key("rooms/a"), SnapshotVersion{2}, {{"n", 1}});
    doc.set_create_time(SnapshotVersion{1});
    doc.convert_to_found(SnapshotVersion{3}, {{"n", 2}});
    EXPECT_EQ(doc.create_time(), SnapshotVersion{1});

    doc.convert_to_no_document(SnapshotVersion{4});
    EXPECT_TRUE(doc.create_time().is_none());
}

TEST(MutableDocument, read_time_is_independent_of_version) {
    auto doc = MutableDocument::found(key("rooms/a"), SnapshotVersion{2}, ObjectValue::object());
    doc.set_read_time(SnapshotVersion{10});
    EXPECT_EQ(doc.read_time(), SnapshotVersion{10});
    EXPECT_EQ(doc.version(), SnapshotVersion{2});
}

// -- Field access -------------------------------------------------------------

TEST(MutableDocument, field_reads_nested_paths) {
    auto doc = MutableDocument::found(key("rooms/a"), SnapshotVersion{1},
                                      {{"owner", {{"name", "ada"}}}});
    auto name = doc.field(FieldPath{"owner", "name"});
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "ada");
    EXPECT_FALSE(doc.field(FieldPath{"owner", "age"}).has_value());
}

TEST(MutableDocument, key_path_yields_reference) {
    auto doc = MutableDocument::found(key("rooms/a"), SnapshotVersion{1}, ObjectValue::object());
    auto value = doc.field(FieldPath::key_path());
    ASSERT_TRUE(value.has_value());
    auto ref = reference_of(*value);
    ASSERT_TRUE(ref.has_value());
    EXPECT_EQ(*ref, key("rooms/a"));
}

TEST(MutableDocument, mutable_data_on_missing_document_throws) {
    auto doc = MutableDocument::no_document(key("rooms/a"), SnapshotVersion{1});
    EXPECT_THROW(doc.mutable_data(), Exception);
}

TEST(MutableDocument, equality_covers_state) {
    auto a = MutableDocument::found(key("rooms/a"), SnapshotVersion{1}, {{"n", 1}});
    auto b = a;
    EXPECT_EQ(a, b);
    b.set_has_local_mutations();
    EXPECT_NE(a, b);
}

TEST(MutableDocument, to_string_names_kind_and_state) {
    auto doc = MutableDocument::no_document(key("rooms/a"), SnapshotVersion{1});
    doc.set_has_committed_mutations();
    auto text = doc.to_string();
    EXPECT_NE(text.find("NoDocument"), std::string::npos);
    EXPECT_NE(text.find("committed"), std::string::npos);
}
