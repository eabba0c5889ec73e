#include "test_util.hpp"

#include "../src/core/view.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace docsync_cpp;
using namespace docsync_cpp::core;
using namespace docsync_cpp::test;

namespace {

using ChangeType = DocumentViewChange::Type;

auto doc_changes(std::vector<MutableDocument> docs) -> DocumentMap {
    auto result = DocumentMap{};
    for (auto& d : docs) {
        auto k = d.key();
        result.insert_or_assign(std::move(k), std::move(d));
    }
    return result;
}

auto keys_of(const ViewSnapshot& snapshot) -> std::vector<DocumentKey> {
    auto result = std::vector<DocumentKey>{};
    for (const auto& d : snapshot.documents) result.push_back(d.key());
    return result;
}

auto change_summary(const ViewSnapshot& snapshot) -> std::vector<std::pair<ChangeType, DocumentKey>> {
    auto result = std::vector<std::pair<ChangeType, DocumentKey>>{};
    for (const auto& change : snapshot.document_changes) result.emplace_back(change.type, change.document.key());
    return result;
}

auto current_change(DocumentKeySet added = {}, ByteString token = "resume") -> remote::TargetChange {
    auto change = remote::TargetChange::create_synthesized(true, std::move(token));
    change.added_documents = std::move(added);
    return change;
}

// Compute and apply in one step, as the sync engine does when no refill is
// needed.
auto apply(View& view, std::vector<MutableDocument> docs,
           const std::optional<remote::TargetChange>& target_change = std::nullopt) -> ViewChange {
    auto changes = view.compute_doc_changes(doc_changes(std::move(docs)));
    return view.apply_changes(changes, target_change);
}

}  // namespace

// -- Document changes ---------------------------------------------------------

TEST(View, first_documents_raise_a_cached_snapshot) {
    auto view = View{query("rooms"), {}};
    auto change = apply(view, {doc("rooms/b", 1, {{"n", 2}}), doc("rooms/a", 1, {{"n", 1}})});

    ASSERT_TRUE(change.snapshot.has_value());
    EXPECT_EQ(keys_of(*change.snapshot), (std::vector<DocumentKey>{key("rooms/a"), key("rooms/b")}));
    EXPECT_EQ(change_summary(*change.snapshot),
              (std::vector<std::pair<ChangeType, DocumentKey>>{{ChangeType::added, key("rooms/a")},
                                                                {ChangeType::added, key("rooms/b")}}));
    EXPECT_TRUE(change.snapshot->from_cache);
    EXPECT_TRUE(change.snapshot->sync_state_changed);
    EXPECT_TRUE(change.snapshot->old_documents.empty());
    EXPECT_EQ(view.sync_state(), SyncState::local);
}

TEST(View, documents_outside_the_query_are_ignored) {
    auto view = View{query("rooms").where(FieldPath{"open"}, FilterOperator::equal, true), {}};
    auto change = apply(view, {doc("rooms/a", 1, {{"open", true}}), doc("rooms/b", 1, {{"open", false}}),
                               doc("halls/c", 1, {{"open", true}})});

    ASSERT_TRUE(change.snapshot.has_value());
    EXPECT_EQ(keys_of(*change.snapshot), (std::vector<DocumentKey>{key("rooms/a")}));
}

TEST(View, document_that_stops_matching_is_removed) {
    auto view = View{query("rooms").where(FieldPath{"open"}, FilterOperator::equal, true), {}};
    apply(view, {doc("rooms/a", 1, {{"open", true}})});

    auto change = apply(view, {doc("rooms/a", 2, {{"open", false}})});
    ASSERT_TRUE(change.snapshot.has_value());
    EXPECT_TRUE(change.snapshot->documents.empty());
    EXPECT_EQ(change_summary(*change.snapshot),
              (std::vector<std::pair<ChangeType, DocumentKey>>{{ChangeType::removed, key("rooms/a")}}));
}

TEST(View, changed_data_is_a_modification) {
    auto view = View{query("rooms"), {}};
    apply(view, {doc("rooms/a", 1, {{"n", 1}})});

    auto change = apply(view, {doc("rooms/a", 2, {{"n", 2}})});
    ASSERT_TRUE(change.snapshot.has_value());
    EXPECT_EQ(change_summary(*change.snapshot),
              (std::vector<std::pair<ChangeType, DocumentKey>>{{ChangeType::modified, key("rooms/a")}}));
    EXPECT_EQ(change.snapshot->documents.get(key("rooms/a"))->data(), (ObjectValue{{"n", 2}}));
}

TEST(View, unchanged_document_raises_nothing) {
    auto view = View{query("rooms"), {}};
    apply(view, {doc("rooms/a", 1, {{"n", 1}})});

    auto change = apply(view, {doc("rooms/a", 1, {{"n", 1}})});
    EXPECT_FALSE(change.snapshot.has_value());
}

TEST(View, pending_write_flag_change_is_a_metadata_change) {
    auto view = View{query("rooms"), {}};
    auto local = doc("rooms/a", 0, {{"n", 1}});
    local.set_has_local_mutations();
    auto first = apply(view, {local});
    ASSERT_TRUE(first.snapshot.has_value());
    EXPECT_TRUE(first.snapshot->has_pending_writes());

    // The backend confirms the same data
    auto change = apply(view, {doc("rooms/a", 3, {{"n", 1}})});
    ASSERT_TRUE(change.snapshot.has_value());
    EXPECT_EQ(change_summary(*change.snapshot),
              (std::vector<std::pair<ChangeType, DocumentKey>>{{ChangeType::metadata, key("rooms/a")}}));
    EXPECT_FALSE(change.snapshot->has_pending_writes());
}

TEST(View, acknowledged_write_waits_for_the_synced_document) {
    auto view = View{query("rooms"), {}};
    auto local = doc("rooms/a", 0, {{"n", 2}});
    local.set_has_local_mutations();
    apply(view, {local});

    // Acknowledged, but the backend has not sent the new version: the old
    // remote value must not flash back
    auto acknowledged = doc("rooms/a", 5, {{"n", 1}});
    acknowledged.set_has_committed_mutations();
    auto change = apply(view, {acknowledged});
    EXPECT_FALSE(change.snapshot.has_value());
    EXPECT_EQ(view.documents().get(key("rooms/a"))->data(), (ObjectValue{{"n", 2}}));
}

TEST(View, changes_are_ordered_by_type_then_query_order) {
    auto view = View{query("rooms").order_by(FieldPath{"n"}), {}};
    apply(view, {doc("rooms/a", 1, {{"n", 1}}), doc("rooms/b", 1, {{"n", 2}})});

    auto change = apply(view, {doc("rooms/a", 2, {{"n", 5}}), doc("rooms/c", 1, {{"n", 3}}),
                               deleted_doc("rooms/b", 2)});
    ASSERT_TRUE(change.snapshot.has_value());
    EXPECT_EQ(change_summary(*change.snapshot),
              (std::vector<std::pair<ChangeType, DocumentKey>>{{ChangeType::removed, key("rooms/b")},
                                                                {ChangeType::added, key("rooms/c")},
                                                                {ChangeType::modified, key("rooms/a")}}));
    EXPECT_EQ(keys_of(*change.snapshot), (std::vector<DocumentKey>{key("rooms/c"), key("rooms/a")}));
}

// -- Limits -------------------------------------------------------------------

TEST(View, limit_keeps_the_first_documents) {
    auto view = View{query("rooms").order_by(FieldPath{"n"}).limit_to_first(2), {}};
    apply(view, {doc("rooms/a", 1, {{"n", 1}}), doc("rooms/b", 1, {{"n", 2}}), doc("rooms/c", 1, {{"n", 3}})});
    EXPECT_EQ(view.documents().size(), 2u);
    EXPECT_FALSE(view.documents().contains(key("rooms/c")));

    // A lower document pushes the last one out
    auto change = apply(view, {doc("rooms/z", 1, {{"n", 0}})});
    ASSERT_TRUE(change.snapshot.has_value());
    EXPECT_EQ(keys_of(*change.snapshot), (std::vector<DocumentKey>{key("rooms/z"), key("rooms/a")}));
    EXPECT_EQ(change_summary(*change.snapshot),
              (std::vector<std::pair<ChangeType, DocumentKey>>{{ChangeType::added, key("rooms/z")},
                                                                {ChangeType::removed, key("rooms/b")}}));
}

TEST(View, limit_to_last_keeps_the_last_documents) {
    auto view = View{query("rooms").order_by(FieldPath{"n"}).limit_to_last(2), {}};
    apply(view, {doc("rooms/a", 1, {{"n", 1}}), doc("rooms/b", 1, {{"n", 2}}), doc("rooms/c", 1, {{"n", 3}})});
    EXPECT_FALSE(view.documents().contains(key("rooms/a")));
    EXPECT_EQ(view.documents().size(), 2u);
}

TEST(View, leaving_a_full_window_needs_a_refill) {
    auto view = View{query("rooms").order_by(FieldPath{"n"}).limit_to_first(2), {}};
    apply(view, {doc("rooms/a", 1, {{"n", 1}}), doc("rooms/b", 1, {{"n", 2}})});

    auto removed = view.compute_doc_changes(doc_changes({deleted_doc("rooms/a", 2)}));
    EXPECT_TRUE(removed.needs_refill);
    EXPECT_THROW(view.apply_changes(removed), InternalError);

    // Moving past the edge also needs one: a document never loaded may sort before it
    auto moved = view.compute_doc_changes(doc_changes({doc("rooms/a", 2, {{"n", 9}})}));
    EXPECT_TRUE(moved.needs_refill);

    // The refill recomputes from the cache on top of the first result
    auto refilled = view.compute_doc_changes(doc_changes({doc("rooms/b", 1, {{"n", 2}}), doc("rooms/c", 1, {{"n", 3}})}),
                                             removed);
    EXPECT_FALSE(refilled.needs_refill);
    auto change = view.apply_changes(refilled);
    ASSERT_TRUE(change.snapshot.has_value());
    EXPECT_EQ(keys_of(*change.snapshot), (std::vector<DocumentKey>{key("rooms/b"), key("rooms/c")}));
}

// -- Target changes and limbo -------------------------------------------------

TEST(View, current_target_marks_the_view_synced) {
    auto view = View{query("rooms"), {}};
    apply(view, {doc("rooms/a", 1, {{"n", 1}})});

    auto change = apply(view, {}, current_change({key("rooms/a")}));
    ASSERT_TRUE(change.snapshot.has_value());
    EXPECT_FALSE(change.snapshot->from_cache);
    EXPECT_TRUE(change.snapshot->sync_state_changed);
    EXPECT_TRUE(change.snapshot->document_changes.empty());
    EXPECT_TRUE(change.snapshot->has_cached_results);
    EXPECT_EQ(view.sync_state(), SyncState::synced);
    EXPECT_EQ(view.synced_documents(), (DocumentKeySet{key("rooms/a")}));
}

TEST(View, cached_document_missing_from_a_current_target_is_in_limbo) {
    auto view = View{query("rooms"), {}};
    apply(view, {doc("rooms/a", 1, {{"n", 1}}), doc("rooms/b", 1, {{"n", 2}})});

    auto change = apply(view, {}, current_change({key("rooms/a")}));
    EXPECT_EQ(change.limbo_changes,
              (std::vector<LimboDocumentChange>{{LimboDocumentChangeType::added, key("rooms/b")}}));
    EXPECT_EQ(view.limbo_documents(), (DocumentKeySet{key("rooms/b")}));
    // Still local, so nothing new to raise
    EXPECT_FALSE(change.snapshot.has_value());
    EXPECT_EQ(view.sync_state(), SyncState::local);

    // The backend confirms the document, which resolves the limbo
    auto resolved = apply(view, {}, current_change({key("rooms/b")}));
    EXPECT_EQ(resolved.limbo_changes,
              (std::vector<LimboDocumentChange>{{LimboDocumentChangeType::removed, key("rooms/b")}}));
    ASSERT_TRUE(resolved.snapshot.has_value());
    EXPECT_FALSE(resolved.snapshot->from_cache);
}

TEST(View, local_writes_are_never_in_limbo) {
    auto view = View{query("rooms"), {}};
    auto local = doc("rooms/a", 0, {{"n", 1}});
    local.set_has_local_mutations();
    apply(view, {local});

    auto change = apply(view, {}, current_change());
    EXPECT_TRUE(change.limbo_changes.empty());
    EXPECT_EQ(view.sync_state(), SyncState::synced);
}

TEST(View, pending_reset_leaves_limbo_untouched) {
    auto view = View{query("rooms"), {}};
    auto changes = view.compute_doc_changes(doc_changes({doc("rooms/a", 1, {{"n", 1}})}));
    auto change = view.apply_changes(changes, current_change(), true);
    EXPECT_TRUE(change.limbo_changes.empty());
    EXPECT_TRUE(view.limbo_documents().empty());
}

TEST(View, going_offline_raises_a_cached_snapshot) {
    auto view = View{query("rooms"), {key("rooms/a")}};
    apply(view, {doc("rooms/a", 1, {{"n", 1}})}, current_change());
    ASSERT_EQ(view.sync_state(), SyncState::synced);

    auto offline = view.apply_online_state_change(OnlineState::offline);
    ASSERT_TRUE(offline.snapshot.has_value());
    EXPECT_TRUE(offline.snapshot->from_cache);
    EXPECT_TRUE(offline.snapshot->sync_state_changed);

    // Only a current view reacts
    EXPECT_FALSE(view.apply_online_state_change(OnlineState::offline).snapshot.has_value());
    EXPECT_FALSE(view.apply_online_state_change(OnlineState::online).snapshot.has_value());
}

// -- DocumentViewChangeSet ----------------------------------------------------

TEST(DocumentViewChangeSet, merges_repeated_changes_to_one_key) {
    auto a = doc("rooms/a", 1, {{"n", 1}});
    auto b = doc("rooms/b", 1, {{"n", 1}});
    auto c = doc("rooms/c", 1, {{"n", 1}});
    auto d = doc("rooms/d", 1, {{"n", 1}});

    auto set = DocumentViewChangeSet{};
    set.add_change({ChangeType::added, a});
    set.add_change({ChangeType::removed, a});
    set.add_change({ChangeType::added, b});
    set.add_change({ChangeType::modified, b});
    set.add_change({ChangeType::removed, c});
    set.add_change({ChangeType::added, c});
    set.add_change({ChangeType::modified, d});
    set.add_change({ChangeType::removed, d});

    auto changes = set.get_changes();
    ASSERT_EQ(changes.size(), 3u);
    EXPECT_EQ(changes[0].type, ChangeType::added);
    EXPECT_EQ(changes[0].document.key(), key("rooms/b"));
    EXPECT_EQ(changes[1].type, ChangeType::modified);
    EXPECT_EQ(changes[1].document.key(), key("rooms/c"));
    EXPECT_EQ(changes[2].type, ChangeType::removed);
    EXPECT_EQ(changes[2].document.key(), key("rooms/d"));
}

TEST(DocumentViewChangeSet, metadata_change_keeps_the_earlier_type) {
    auto set = DocumentViewChangeSet{};
    set.add_change({ChangeType::added, doc("rooms/a", 1, {{"n", 1}})});
    set.add_change({ChangeType::metadata, doc("rooms/a", 2, {{"n", 1}})});

    auto changes = set.get_changes();
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].type, ChangeType::added);
    EXPECT_EQ(changes[0].document.version(), version(2));
}

TEST(DocumentViewChangeSet, metadata_after_removal_is_fatal) {
    auto set = DocumentViewChangeSet{};
    set.add_change({ChangeType::removed, doc("rooms/a", 1, {{"n", 1}})});
    EXPECT_THROW(set.add_change({ChangeType::metadata, doc("rooms/a", 2, {{"n", 1}})}), InternalError);
}
